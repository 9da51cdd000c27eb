#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <sys/socket.h>

// IPv4 / IPv6 address + port. Numeric hosts only, no name resolution.
class SocketAddress {
    sockaddr_storage m_storage;
    socklen_t m_len;

public:
    SocketAddress();

    // "127.0.0.1:8080", "[::1]:8080", "*:8080"
    static SocketAddress parse(const std::string& text);
    static SocketAddress loopback(uint16_t port);
    static SocketAddress any(uint16_t port);
    static SocketAddress fromSockaddr(const sockaddr* addr, socklen_t len);

    const sockaddr* data() const { return reinterpret_cast<const sockaddr*>(&m_storage); }
    socklen_t size() const { return m_len; }
    int family() const { return m_storage.ss_family; }

    uint16_t getPort() const;

    std::string toString() const;

    bool operator==(const SocketAddress& other) const;
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }
};
