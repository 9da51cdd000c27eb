#include <stdexcept>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include "socket_address.hpp"

namespace {

uint16_t parsePort(const std::string& text, const std::string& input) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid port in address: " + input);
    }
    unsigned long port = std::stoul(text);
    if (port > 65535) {
        throw std::invalid_argument("Port out of range in address: " + input);
    }
    return static_cast<uint16_t>(port);
}

}

SocketAddress::SocketAddress() : m_storage{}, m_len(0) {
}

SocketAddress SocketAddress::parse(const std::string& text) {
    std::string host;
    std::string port;

    if (!text.empty() && text[0] == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw std::invalid_argument("Malformed IPv6 address: " + text);
        }
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("Address must be host:port: " + text);
        }
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    uint16_t portNum = parsePort(port, text);

    SocketAddress addr;
    if (host == "*" || host.empty()) {
        return any(portNum);
    }

    sockaddr_in v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        v4.sin_port = htons(portNum);
        std::memcpy(&addr.m_storage, &v4, sizeof(v4));
        addr.m_len = sizeof(v4);
        return addr;
    }

    sockaddr_in6 v6{};
    if (inet_pton(AF_INET6, host.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        v6.sin6_port = htons(portNum);
        std::memcpy(&addr.m_storage, &v6, sizeof(v6));
        addr.m_len = sizeof(v6);
        return addr;
    }

    throw std::invalid_argument("Not a numeric IPv4/IPv6 host: " + text);
}

SocketAddress SocketAddress::loopback(uint16_t port) {
    sockaddr_in v4{};
    v4.sin_family = AF_INET;
    v4.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    v4.sin_port = htons(port);
    return fromSockaddr(reinterpret_cast<const sockaddr*>(&v4), sizeof(v4));
}

SocketAddress SocketAddress::any(uint16_t port) {
    sockaddr_in v4{};
    v4.sin_family = AF_INET;
    v4.sin_addr.s_addr = htonl(INADDR_ANY);
    v4.sin_port = htons(port);
    return fromSockaddr(reinterpret_cast<const sockaddr*>(&v4), sizeof(v4));
}

SocketAddress SocketAddress::fromSockaddr(const sockaddr* addr, socklen_t len) {
    if (addr == nullptr || len > static_cast<socklen_t>(sizeof(sockaddr_storage))) {
        throw std::invalid_argument("Invalid sockaddr length");
    }
    if (addr->sa_family != AF_INET && addr->sa_family != AF_INET6) {
        throw std::invalid_argument("Unsupported address family " + std::to_string(addr->sa_family));
    }
    SocketAddress result;
    std::memcpy(&result.m_storage, addr, len);
    result.m_len = len;
    return result;
}

uint16_t SocketAddress::getPort() const {
    if (family() == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&m_storage)->sin_port);
    }
    if (family() == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&m_storage)->sin6_port);
    }
    return 0;
}

std::string SocketAddress::toString() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (family() == AF_INET) {
        auto v4 = reinterpret_cast<const sockaddr_in*>(&m_storage);
        inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(getPort());
    }
    if (family() == AF_INET6) {
        auto v6 = reinterpret_cast<const sockaddr_in6*>(&m_storage);
        inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
        return "[" + std::string(buf) + "]:" + std::to_string(getPort());
    }
    return "<unspecified>";
}

bool SocketAddress::operator==(const SocketAddress& other) const {
    if (family() != other.family() || getPort() != other.getPort()) {
        return false;
    }
    if (family() == AF_INET) {
        return reinterpret_cast<const sockaddr_in*>(&m_storage)->sin_addr.s_addr ==
               reinterpret_cast<const sockaddr_in*>(&other.m_storage)->sin_addr.s_addr;
    }
    if (family() == AF_INET6) {
        return std::memcmp(&reinterpret_cast<const sockaddr_in6*>(&m_storage)->sin6_addr,
                           &reinterpret_cast<const sockaddr_in6*>(&other.m_storage)->sin6_addr,
                           sizeof(in6_addr)) == 0;
    }
    return m_len == other.m_len;
}
