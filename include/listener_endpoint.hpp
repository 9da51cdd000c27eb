#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include "selector.hpp"
#include "socket.hpp"
#include "socket_address.hpp"

class ListeningReactor;

// One bound listening socket registered with a Selector. Once closed it stays
// closed; re-listening creates a new endpoint.
class ListenerEndpoint {
    std::shared_ptr<Selector> m_selector;
    RegistrationId m_id;
    SocketAddress m_address;
    std::mutex m_mutex;  // guards m_socket between close() and accept()
    Socket m_socket;
    std::atomic<bool> m_closed;

    friend class ListeningReactor;

    // Throws StaleRegistrationError once closed. Invalid socket when drained.
    Socket accept();

public:
    ListenerEndpoint(std::shared_ptr<Selector> selector, RegistrationId id, Socket socket, const SocketAddress& address);
    ~ListenerEndpoint();

    ListenerEndpoint(const ListenerEndpoint&) = delete;
    ListenerEndpoint& operator=(const ListenerEndpoint&) = delete;

    bool isClosed() const { return m_closed.load(); }
    const SocketAddress& getAddress() const { return m_address; }
    RegistrationId getRegistrationId() const { return m_id; }

    void close() noexcept { tryClose(); }

    // Returns true only for the call that actually closed the endpoint.
    bool tryClose() noexcept;
};

using ListenerEndpointPtr = std::shared_ptr<ListenerEndpoint>;
