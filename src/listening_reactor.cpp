#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include "listening_reactor.hpp"
#include "reactor_errors.hpp"

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Counts a push in flight so shutdownQueue() can wait for it to land.
class ProducerGuard {
    std::atomic<int>& m_count;
public:
    explicit ProducerGuard(std::atomic<int>& count) : m_count(count) { m_count.fetch_add(1); }
    ~ProducerGuard() { m_count.fetch_sub(1); }
};

}

ListeningReactor::ListeningReactor(const ReactorConfig& config, ConnectionSink sink, const ReactorStatusSource& status)
    : m_config(config),
      m_sink(std::move(sink)),
      m_status(status),
      m_selector(std::make_shared<Selector>()),
      m_paused(false),
      m_terminated(false),
      m_consuming(false),
      m_producers(0),
      m_nextId(1) {
    m_config.validate();
    if (!m_sink) {
        throw std::invalid_argument("Connection sink must not be empty");
    }
}

ListeningReactor::~ListeningReactor() {
    terminate();
}

ListenCompletion ListeningReactor::listen(const SocketAddress& address, ListenCompletion::Callback callback) {
    if (m_status.getStatus() >= ReactorStatus::SHUTTING_DOWN) {
        throw ReactorShutdownError("I/O reactor has been shut down");
    }
    ListenCompletion completion;
    if (callback) {
        completion.then(std::move(callback));
    }
    if (!enqueue(PendingListenRequest{address, completion})) {
        throw ReactorShutdownError("I/O reactor has been terminated");
    }
    m_selector->wakeup();
    return completion;
}

bool ListeningReactor::enqueue(PendingListenRequest request) {
    ProducerGuard guard(m_producers);
    if (m_terminated.load()) {
        return false;
    }
    m_requests.push(std::move(request));
    return true;
}

void ListeningReactor::requeue(const SocketAddress& address) {
    if (!enqueue(PendingListenRequest{address, std::nullopt})) {
        std::cerr << "Reactor terminated, dropping re-listen of " << address.toString() << std::endl;
    }
}

void ListeningReactor::pause() {
    bool expected = false;
    if (!m_paused.compare_exchange_strong(expected, true)) {
        return;
    }
    for (const auto& endpoint : m_endpoints.snapshot()) {
        if (endpoint->tryClose()) {
            requeue(endpoint->getAddress());
        }
        m_endpoints.remove(endpoint->getRegistrationId());
    }
}

void ListeningReactor::resume() {
    bool expected = true;
    if (m_paused.compare_exchange_strong(expected, false)) {
        m_selector->wakeup();
    }
}

std::unordered_set<ListenerEndpointPtr> ListeningReactor::getEndpoints() {
    return m_endpoints.openEndpoints();
}

bool ListeningReactor::isRunning() const {
    return m_status.getStatus() == ReactorStatus::ACTIVE && !m_terminated.load();
}

void ListeningReactor::execute() {
    bool expected = false;
    if (!m_consuming.compare_exchange_strong(expected, true)) {
        throw std::logic_error("Listening reactor is already executing");
    }
    try {
        while (isRunning()) {
            int readyCount = m_selector->select(m_config.selectInterval);
            if (!isRunning()) {
                break;
            }
            processEvents(readyCount);
        }
    } catch (...) {
        shutdownQueue();
        throw;
    }
    shutdownQueue();
}

void ListeningReactor::terminate() {
    m_terminated.store(true);
    bool expected = false;
    if (m_consuming.compare_exchange_strong(expected, true)) {
        shutdownQueue();
    } else {
        // execute() owns the queue; it drains on its way out
        m_selector->wakeup();
    }
}

void ListeningReactor::processEvents(int readyCount) {
    if (!m_paused.load()) {
        processRequests();
    }

    if (readyCount > 0) {
        for (const auto& event : m_selector->readyEvents()) {
            std::visit(overloaded{
                [this](const AcceptReady& ready) { acceptConnections(ready.id); },
                [this](const RegistrationError& error) {
                    auto endpoint = m_endpoints.find(error.id);
                    if (endpoint) {
                        std::cerr << "Listener " << endpoint->getAddress().toString()
                                  << " reported error events 0x" << std::hex << error.events << std::dec
                                  << ", closing" << std::endl;
                        endpoint->close();
                    }
                    cleanupEndpoint(error.id);
                }
            }, event);
        }
    }
}

void ListeningReactor::processRequests() {
    // Re-checked per request so a pause() issued mid-drain leaves the rest queued
    while (!m_paused.load()) {
        auto request = m_requests.pop();
        if (!request) {
            break;
        }
        if (request->isCancelled()) {
            continue;
        }
        processRequest(*request);
    }
}

void ListeningReactor::processRequest(PendingListenRequest& request) {
    const SocketAddress& address = request.address;
    Socket socket;
    ListenerEndpointPtr endpoint;
    try {
        socket = Socket::open(address.family());
        socket.setReuseAddr(m_config.soReuseAddress);
        socket.setReceiveBufferSize(m_config.rcvBufSize);
        socket.setNonBlocking();
        socket.bind(address);
        socket.listen(m_config.backlogSize);
        SocketAddress local = socket.getLocalAddress();

        RegistrationId id = m_nextId.fetch_add(1);
        int fd = socket.getFd();
        m_selector->registerAccept(fd, id);
        try {
            endpoint = std::make_shared<ListenerEndpoint>(m_selector, id, std::move(socket), local);
        } catch (...) {
            m_selector->deregister(fd);
            throw;
        }
    } catch (const std::exception& e) {
        socket.close();
        if (request.completion) {
            request.completion->fail(std::current_exception());
        } else {
            std::cerr << "Warning: Failed to re-listen on " << address.toString() << ": " << e.what() << std::endl;
        }
        return;
    }

    m_endpoints.insert(endpoint);

    if (request.completion && !request.completion->complete(endpoint)) {
        // Cancelled after dequeue; nobody will ever see this endpoint
        endpoint->close();
        m_endpoints.remove(endpoint->getRegistrationId());
        return;
    }

    // pause() may have snapshotted the registry before the insert above
    if (m_paused.load() && endpoint->tryClose()) {
        requeue(endpoint->getAddress());
        m_endpoints.remove(endpoint->getRegistrationId());
    }
}

void ListeningReactor::acceptConnections(RegistrationId id) {
    auto endpoint = m_endpoints.find(id);
    if (!endpoint) {
        // Removed by pause() after the event was reported
        return;
    }
    try {
        while (true) {
            Socket connection = endpoint->accept();
            if (!connection.isValid()) {
                break;
            }
            try {
                m_sink(std::move(connection));
            } catch (const std::exception& e) {
                std::cerr << "Connection sink for " << endpoint->getAddress().toString() << " threw: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "Connection sink for " << endpoint->getAddress().toString() << " threw an unknown exception" << std::endl;
            }
        }
    } catch (const StaleRegistrationError&) {
        cleanupEndpoint(id);
    } catch (const std::system_error& e) {
        std::cerr << "Failed to accept on " << endpoint->getAddress().toString() << ": " << e.what() << std::endl;
    }
}

void ListeningReactor::cleanupEndpoint(RegistrationId id) {
    m_endpoints.remove(id);
}

void ListeningReactor::shutdownQueue() {
    m_terminated.store(true);
    while (m_producers.load() != 0) {
        std::this_thread::yield();
    }

    while (auto request = m_requests.pop()) {
        if (request->completion) {
            request->completion->fail(std::make_exception_ptr(ReactorTerminatedError("I/O reactor terminated")));
        }
    }

    for (const auto& endpoint : m_endpoints.snapshot()) {
        endpoint->close();
        m_endpoints.remove(endpoint->getRegistrationId());
    }
    m_consuming.store(false);
}
