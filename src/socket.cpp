#include <iostream>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <system_error>
#include <cerrno>
#include "socket.hpp"

namespace {

[[noreturn]] void throwErrno(const char* what) {
    int err = errno;
    throw std::system_error(err, std::generic_category(), std::string(what) + " failed");
}

}

Socket::Socket() : m_fd(-1) {
}

Socket::Socket(int fd) : m_fd(fd) {
}

Socket Socket::open(int family) {
    int fd = socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
        throwErrno("socket");
    }
    return Socket(fd);
}

Socket::Socket(Socket&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

Socket::~Socket() {
    close();
}

void Socket::setNonBlocking() {
    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags == -1) {
        throwErrno("fcntl(F_GETFL)");
    }
    if (fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throwErrno("fcntl(F_SETFL)");
    }
}

void Socket::setReuseAddr(bool on) {
    int opt = on ? 1 : 0;
    if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) {
        throwErrno("setsockopt(SO_REUSEADDR)");
    }
}

void Socket::setReceiveBufferSize(int size) {
    if (size <= 0) return;
    if (setsockopt(m_fd, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) == -1) {
        throwErrno("setsockopt(SO_RCVBUF)");
    }
}

void Socket::bind(const SocketAddress& address) {
    if (::bind(m_fd, address.data(), address.size()) == -1) {
        throw std::system_error(errno, std::generic_category(), "bind to " + address.toString() + " failed");
    }
}

void Socket::listen(int backlog) {
    if (::listen(m_fd, backlog > 0 ? backlog : SOMAXCONN) == -1) {
        throwErrno("listen");
    }
}

Socket Socket::accept() {
    while (true) {
        int client_fd = accept4(m_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd != -1) {
            return Socket(client_fd);
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // No more incoming connections
            return Socket();
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        throwErrno("accept");
    }
}

SocketAddress Socket::getLocalAddress() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
        throwErrno("getsockname");
    }
    return SocketAddress::fromSockaddr(reinterpret_cast<sockaddr*>(&addr), len);
}

SocketAddress Socket::getPeerAddress() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
        throwErrno("getpeername");
    }
    return SocketAddress::fromSockaddr(reinterpret_cast<sockaddr*>(&addr), len);
}

int Socket::getPort() const {
    if (m_fd == -1) return 0;
    return getLocalAddress().getPort();
}

void Socket::close() noexcept {
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
}
