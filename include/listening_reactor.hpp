#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_set>
#include "completion.hpp"
#include "endpoint_registry.hpp"
#include "listener_endpoint.hpp"
#include "mpsc_queue.hpp"
#include "reactor_config.hpp"
#include "reactor_status.hpp"
#include "selector.hpp"
#include "socket.hpp"
#include "socket_address.hpp"

using ConnectionSink = std::function<void(Socket)>;
using ListenCompletion = Completion<ListenerEndpointPtr>;

// Listening side of the transport. One thread runs execute(); listen(),
// pause(), resume() and getEndpoints() are safe from any thread and never
// wait on it. Foreign threads talk to the loop only through the request
// queue, the endpoint registry and Selector::wakeup().
class ListeningReactor {
    struct PendingListenRequest {
        SocketAddress address;
        std::optional<ListenCompletion> completion;  // empty for re-listens queued by pause()

        bool isCancelled() const { return completion && completion->isCancelled(); }
    };

    ReactorConfig m_config;
    ConnectionSink m_sink;
    const ReactorStatusSource& m_status;
    std::shared_ptr<Selector> m_selector;
    MpscQueue<PendingListenRequest> m_requests;
    EndpointRegistry m_endpoints;
    std::atomic<bool> m_paused;
    std::atomic<bool> m_terminated;
    std::atomic<bool> m_consuming;  // held by whichever thread may pop m_requests
    std::atomic<int> m_producers;   // pushes in flight
    std::atomic<RegistrationId> m_nextId;

public:
    ListeningReactor(const ReactorConfig& config, ConnectionSink sink, const ReactorStatusSource& status);
    ~ListeningReactor();

    ListeningReactor(const ListeningReactor&) = delete;
    ListeningReactor& operator=(const ListeningReactor&) = delete;

    // Throws ReactorShutdownError if the reactor is shutting down or terminated.
    ListenCompletion listen(const SocketAddress& address, ListenCompletion::Callback callback = nullptr);

    void pause();
    void resume();
    bool isPaused() const { return m_paused.load(); }

    std::unordered_set<ListenerEndpointPtr> getEndpoints();

    // Registry entries, closed ones included until something purges them.
    size_t getEndpointCount() const { return m_endpoints.size(); }

    // Runs the select loop on the calling thread until the status leaves
    // ACTIVE or terminate() is called, then fails whatever is still queued.
    void execute();

    // Fails every queued request with ReactorTerminatedError and closes all
    // endpoints. If execute() is running, it does this on its way out.
    void terminate();

    void wakeup() noexcept { m_selector->wakeup(); }
    int getWakeupFd() const { return m_selector->getWakeupFd(); }

private:
    bool enqueue(PendingListenRequest request);
    void requeue(const SocketAddress& address);
    void processEvents(int readyCount);
    void processRequests();
    void processRequest(PendingListenRequest& request);
    void acceptConnections(RegistrationId id);
    void cleanupEndpoint(RegistrationId id);
    void shutdownQueue();
    bool isRunning() const;
};
