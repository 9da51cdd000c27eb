#pragma once
#include <sys/socket.h>
#include "socket_address.hpp"

class Socket {
    int m_fd;
public:
    Socket();

    explicit Socket(int fd);

    static Socket open(int family);

    Socket(const Socket&) = delete;

    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;

    Socket& operator=(Socket&& other) noexcept;

    ~Socket();  

    void setNonBlocking();

    void setReuseAddr(bool on = true);

    // Values <= 0 leave the OS default in place.
    void setReceiveBufferSize(int size);

    void bind(const SocketAddress& address);

    // Backlog <= 0 means SOMAXCONN.
    void listen(int backlog);

    // Returns an invalid socket (fd == -1) when no connection is pending.
    Socket accept();

    SocketAddress getLocalAddress() const;

    SocketAddress getPeerAddress() const;

    int getPort() const;

    int getFd() const { return m_fd; }

    bool isValid() const { return m_fd != -1; }

    void close() noexcept;
};
