#include <utility>
#include "listener_endpoint.hpp"
#include "reactor_errors.hpp"

ListenerEndpoint::ListenerEndpoint(std::shared_ptr<Selector> selector, RegistrationId id, Socket socket,
                                   const SocketAddress& address)
    : m_selector(std::move(selector)), m_id(id), m_address(address), m_socket(std::move(socket)), m_closed(false) {
}

ListenerEndpoint::~ListenerEndpoint() {
    tryClose();
}

bool ListenerEndpoint::tryClose() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.exchange(true)) {
        return false;
    }
    if (m_socket.isValid()) {
        m_selector->deregister(m_socket.getFd());
        m_socket.close();
    }
    return true;
}

Socket ListenerEndpoint::accept() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.load()) {
        throw StaleRegistrationError("Listener " + m_address.toString() + " is no longer registered");
    }
    return m_socket.accept();
}
