#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <catch2/catch_test_macros.hpp>
#include "../include/listening_reactor.hpp"
#include "../include/reactor_errors.hpp"

using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

bool tryConnect(const SocketAddress& address) {
    Socket s = Socket::open(address.family());
    return ::connect(s.getFd(), address.data(), address.size()) == 0;
}

// Runs execute() on a thread for the lifetime of the scope.
struct LoopRunner {
    ListeningReactor& reactor;
    BasicReactorStatus& status;
    std::thread thread;

    LoopRunner(ListeningReactor& r, BasicReactorStatus& s)
        : reactor(r), status(s), thread([&r] { r.execute(); }) {}

    ~LoopRunner() {
        status.set(ReactorStatus::SHUTTING_DOWN);
        reactor.wakeup();
        thread.join();
    }
};

// Owns a reactor and, once started, the thread running its loop.
struct ReactorHarness {
    BasicReactorStatus status{ReactorStatus::ACTIVE};
    std::atomic<int> accepted{0};
    std::atomic<bool> sinkThrows{false};
    std::unique_ptr<ListeningReactor> reactor;
    std::thread loop;

    explicit ReactorHarness(std::chrono::milliseconds selectInterval = 50ms) {
        ReactorConfig config;
        config.selectInterval = selectInterval;
        reactor = std::make_unique<ListeningReactor>(config, [this](Socket connection) {
            accepted++;
            if (sinkThrows) {
                throw std::runtime_error("sink failure on fd " + std::to_string(connection.getFd()));
            }
        }, status);
    }

    void start() {
        loop = std::thread([this] { reactor->execute(); });
    }

    void stop() {
        if (loop.joinable()) {
            status.set(ReactorStatus::SHUTTING_DOWN);
            reactor->wakeup();
            loop.join();
        }
    }

    ~ReactorHarness() {
        stop();
    }

    ListenerEndpointPtr listenLoopback(uint16_t port = 0) {
        return reactor->listen(SocketAddress::loopback(port)).get(5000ms);
    }
};

}

TEST_CASE("Listen resolves to a bound endpoint", "[reactor]") {
    ReactorHarness h;
    h.start();

    SECTION("Ephemeral ports are concrete and distinct") {
        auto first = h.listenLoopback();
        auto second = h.listenLoopback();

        REQUIRE(first->getAddress().getPort() != 0);
        REQUIRE(second->getAddress().getPort() != 0);
        REQUIRE(first->getAddress().getPort() != second->getAddress().getPort());
        REQUIRE_FALSE(first->isClosed());
        REQUIRE(h.reactor->getEndpoints().size() == 2);
    }

    SECTION("Explicit port is reported back unchanged") {
        auto scratch = h.listenLoopback();
        auto address = scratch->getAddress();
        scratch->close();

        auto endpoint = h.reactor->listen(address).get(5000ms);
        REQUIRE(endpoint->getAddress() == address);
    }

    SECTION("Callback observes the same result") {
        std::atomic<int> calls{0};
        ListenerEndpointPtr seen;
        auto handle = h.reactor->listen(SocketAddress::loopback(0), [&](const ListenCompletion& result) {
            seen = result.get();
            calls++;
        });
        auto endpoint = handle.get(5000ms);
        REQUIRE(waitUntil([&] { return calls.load() == 1; }));
        REQUIRE(seen == endpoint);
    }
}

TEST_CASE("Accepted connections reach the sink", "[reactor]") {
    ReactorHarness h;
    h.start();
    auto endpoint = h.listenLoopback();

    SECTION("Single connection") {
        REQUIRE(tryConnect(endpoint->getAddress()));
        REQUIRE(waitUntil([&] { return h.accepted.load() == 1; }));
    }

    SECTION("A burst of connections is drained") {
        std::vector<Socket> clients;
        for (int i = 0; i < 20; ++i) {
            Socket s = Socket::open(AF_INET);
            REQUIRE(::connect(s.getFd(), endpoint->getAddress().data(), endpoint->getAddress().size()) == 0);
            clients.push_back(std::move(s));
        }
        REQUIRE(waitUntil([&] { return h.accepted.load() == 20; }));
    }

    SECTION("A throwing sink does not stop the loop") {
        h.sinkThrows = true;
        REQUIRE(tryConnect(endpoint->getAddress()));
        REQUIRE(tryConnect(endpoint->getAddress()));
        REQUIRE(waitUntil([&] { return h.accepted.load() == 2; }));
        REQUIRE_FALSE(endpoint->isClosed());
    }
}

TEST_CASE("Bind failures fail the handle", "[reactor]") {
    ReactorHarness h;
    h.start();

    Socket occupant = Socket::open(AF_INET);
    occupant.bind(SocketAddress::loopback(0));
    occupant.listen(1);
    auto taken = occupant.getLocalAddress();

    auto before = h.reactor->getEndpoints().size();
    auto handle = h.reactor->listen(taken);
    REQUIRE(handle.waitFor(5000ms));
    REQUIRE(handle.getState() == ListenCompletion::State::FAILED);
    try {
        handle.get();
        FAIL("listen on a taken port should fail");
    } catch (const std::system_error& e) {
        REQUIRE(e.code().value() == EADDRINUSE);
    }
    REQUIRE(h.reactor->getEndpoints().size() == before);

    // The loop keeps serving other requests
    auto endpoint = h.listenLoopback();
    REQUIRE_FALSE(endpoint->isClosed());
}

TEST_CASE("Listen is rejected once shutting down", "[reactor]") {
    ReactorHarness h;

    SECTION("SHUTTING_DOWN") {
        h.status.set(ReactorStatus::SHUTTING_DOWN);
        REQUIRE_THROWS_AS(h.reactor->listen(SocketAddress::loopback(0)), ReactorShutdownError);
    }

    SECTION("SHUT_DOWN") {
        h.status.set(ReactorStatus::SHUT_DOWN);
        REQUIRE_THROWS_AS(h.reactor->listen(SocketAddress::loopback(0)), ReactorShutdownError);
    }

    SECTION("After terminate") {
        h.reactor->terminate();
        REQUIRE_THROWS_AS(h.reactor->listen(SocketAddress::loopback(0)), ReactorShutdownError);
    }

    REQUIRE(h.reactor->getEndpoints().empty());
}

TEST_CASE("Concurrent listen calls each resolve once", "[reactor]") {
    ReactorHarness h;
    h.start();

    constexpr int THREADS = 16;
    std::vector<std::atomic<int>> resolutions(THREADS);
    std::vector<ListenCompletion> handles(THREADS);
    std::vector<std::thread> callers;
    for (int i = 0; i < THREADS; ++i) {
        callers.emplace_back([&, i] {
            handles[i] = h.reactor->listen(SocketAddress::loopback(0), [&, i](const ListenCompletion&) {
                resolutions[i]++;
            });
        });
    }
    for (auto& t : callers) t.join();

    for (int i = 0; i < THREADS; ++i) {
        REQUIRE(handles[i].waitFor(5000ms));
        REQUIRE(handles[i].getState() == ListenCompletion::State::COMPLETED);
    }
    REQUIRE(waitUntil([&] {
        for (auto& r : resolutions) {
            if (r.load() != 1) return false;
        }
        return true;
    }));
    REQUIRE(h.reactor->getEndpoints().size() == THREADS);
}

TEST_CASE("Pause closes listeners and resume rebinds them", "[reactor]") {
    ReactorHarness h;
    h.start();

    auto a = h.listenLoopback();
    auto b = h.listenLoopback();
    auto addressA = a->getAddress();
    auto addressB = b->getAddress();

    h.reactor->pause();
    REQUIRE(h.reactor->isPaused());
    REQUIRE(h.reactor->getEndpoints().empty());
    REQUIRE(a->isClosed());
    REQUIRE(b->isClosed());
    REQUIRE_FALSE(tryConnect(addressA));
    REQUIRE_FALSE(tryConnect(addressB));

    SECTION("Requests made while paused wait for resume") {
        auto handle = h.reactor->listen(SocketAddress::loopback(0));
        REQUIRE_FALSE(handle.waitFor(200ms));
        h.reactor->resume();
        REQUIRE(handle.waitFor(5000ms));
        REQUIRE(waitUntil([&] { return h.reactor->getEndpoints().size() == 3; }));
    }

    SECTION("Resume restores the same addresses") {
        h.reactor->resume();
        REQUIRE_FALSE(h.reactor->isPaused());
        REQUIRE(waitUntil([&] { return h.reactor->getEndpoints().size() == 2; }));

        std::vector<SocketAddress> restored;
        for (const auto& endpoint : h.reactor->getEndpoints()) {
            REQUIRE(endpoint != a);
            REQUIRE(endpoint != b);
            restored.push_back(endpoint->getAddress());
        }
        REQUIRE(((restored[0] == addressA && restored[1] == addressB) ||
                 (restored[0] == addressB && restored[1] == addressA)));

        REQUIRE(tryConnect(addressA));
        REQUIRE(tryConnect(addressB));
        REQUIRE(waitUntil([&] { return h.accepted.load() == 2; }));
    }

    SECTION("Pause twice is a no-op") {
        h.reactor->pause();
        REQUIRE(h.reactor->getEndpoints().empty());

        h.reactor->resume();
        REQUIRE(waitUntil([&] { return h.reactor->getEndpoints().size() == 2; }));
        // Give a duplicate re-listen, had one been queued, time to show up
        std::this_thread::sleep_for(200ms);
        REQUIRE(h.reactor->getEndpoints().size() == 2);

        h.reactor->resume();
        REQUIRE(h.reactor->getEndpoints().size() == 2);
    }
}

TEST_CASE("getEndpoints never reports closed endpoints", "[reactor]") {
    ReactorHarness h;
    h.start();

    auto kept = h.listenLoopback();
    auto dropped = h.listenLoopback();
    dropped->close();

    auto endpoints = h.reactor->getEndpoints();
    REQUIRE(endpoints.size() == 1);
    REQUIRE(endpoints.count(kept) == 1);
    for (const auto& endpoint : endpoints) {
        REQUIRE_FALSE(endpoint->isClosed());
    }
}

TEST_CASE("Endpoint closed from another thread is cleaned up", "[reactor]") {
    ReactorHarness h;
    h.start();

    auto endpoint = h.listenLoopback();
    auto other = h.listenLoopback();
    REQUIRE(tryConnect(endpoint->getAddress()));
    endpoint->close();

    REQUIRE(waitUntil([&] { return h.reactor->getEndpoints().size() == 1; }));
    int before = h.accepted.load();
    REQUIRE(tryConnect(other->getAddress()));
    REQUIRE(waitUntil([&] { return h.accepted.load() == before + 1; }));
}

TEST_CASE("Endpoint closed between readiness and accept is removed", "[reactor]") {
    BasicReactorStatus status{ReactorStatus::ACTIVE};
    std::atomic<int> accepted{0};
    std::atomic<bool> gateEntered{false};
    std::atomic<bool> gateOpen{false};
    std::atomic<uint16_t> gatePort{0};
    std::atomic<ListenerEndpoint*> first{nullptr};
    std::atomic<ListenerEndpoint*> second{nullptr};

    ReactorConfig config;
    config.selectInterval = 50ms;
    // The gate listener parks the loop so both other listeners turn ready in
    // the same select cycle; each of those closes its sibling.
    ListeningReactor reactor(config, [&](Socket connection) {
        uint16_t port = connection.getLocalAddress().getPort();
        if (port == gatePort.load()) {
            gateEntered = true;
            while (!gateOpen) std::this_thread::sleep_for(1ms);
            return;
        }
        accepted++;
        ListenerEndpoint* a = first.load();
        ListenerEndpoint* b = second.load();
        if (port == a->getAddress().getPort()) {
            b->close();
        } else {
            a->close();
        }
    }, status);
    LoopRunner runner(reactor, status);
    struct GateRelease {
        std::atomic<bool>& open;
        ~GateRelease() { open = true; }
    } release{gateOpen};

    auto gate = reactor.listen(SocketAddress::loopback(0)).get(5000ms);
    auto a = reactor.listen(SocketAddress::loopback(0)).get(5000ms);
    auto b = reactor.listen(SocketAddress::loopback(0)).get(5000ms);
    gatePort = gate->getAddress().getPort();
    first = a.get();
    second = b.get();
    REQUIRE(reactor.getEndpointCount() == 3);

    Socket gateClient = Socket::open(AF_INET);
    REQUIRE(::connect(gateClient.getFd(), gate->getAddress().data(), gate->getAddress().size()) == 0);
    REQUIRE(waitUntil([&] { return gateEntered.load(); }));

    Socket clientA = Socket::open(AF_INET);
    Socket clientB = Socket::open(AF_INET);
    REQUIRE(::connect(clientA.getFd(), a->getAddress().data(), a->getAddress().size()) == 0);
    REQUIRE(::connect(clientB.getFd(), b->getAddress().data(), b->getAddress().size()) == 0);
    gateOpen = true;

    REQUIRE(waitUntil([&] { return accepted.load() == 1; }));
    // No getEndpoints() call here: the count drops only through the loop's own cleanup
    REQUIRE(waitUntil([&] { return reactor.getEndpointCount() == 2; }));
    REQUIRE(accepted.load() == 1);
    REQUIRE(a->isClosed() != b->isClosed());
    REQUIRE_FALSE(gate->isClosed());
}

TEST_CASE("Non-standard exceptions from callbacks do not stop the loop", "[reactor]") {
    BasicReactorStatus status{ReactorStatus::ACTIVE};
    std::atomic<int> accepted{0};
    ReactorConfig config;
    config.selectInterval = 50ms;
    ListeningReactor reactor(config, [&](Socket) {
        accepted++;
        throw 42;
    }, status);
    LoopRunner runner(reactor, status);

    std::atomic<int> callbacks{0};
    auto endpoint = reactor.listen(SocketAddress::loopback(0), [&](const ListenCompletion&) {
        callbacks++;
        throw 7;
    }).get(5000ms);
    REQUIRE(waitUntil([&] { return callbacks.load() == 1; }));

    REQUIRE(tryConnect(endpoint->getAddress()));
    REQUIRE(tryConnect(endpoint->getAddress()));
    REQUIRE(waitUntil([&] { return accepted.load() == 2; }));
    REQUIRE_FALSE(endpoint->isClosed());

    // Still serving new requests
    auto another = reactor.listen(SocketAddress::loopback(0)).get(5000ms);
    REQUIRE_FALSE(another->isClosed());
    REQUIRE(reactor.getEndpoints().size() == 2);
}

TEST_CASE("Cancelled requests are skipped", "[reactor]") {
    ReactorHarness h;

    auto cancelled = h.reactor->listen(SocketAddress::loopback(0));
    REQUIRE(cancelled.cancel());
    auto live = h.reactor->listen(SocketAddress::loopback(0));

    h.start();
    REQUIRE(live.waitFor(5000ms));
    REQUIRE(live.getState() == ListenCompletion::State::COMPLETED);
    REQUIRE(cancelled.isCancelled());
    REQUIRE(h.reactor->getEndpoints().size() == 1);
}

TEST_CASE("Termination fails pending requests", "[reactor]") {
    ReactorHarness h;

    SECTION("Terminate without a running loop") {
        auto pending = h.reactor->listen(SocketAddress::loopback(0));
        h.reactor->terminate();
        REQUIRE(pending.getState() == ListenCompletion::State::FAILED);
        REQUIRE_THROWS_AS(pending.get(), ReactorTerminatedError);
    }

    SECTION("Loop exit on shutdown drains the queue") {
        h.start();
        auto endpoint = h.listenLoopback();
        h.reactor->pause();
        auto pending = h.reactor->listen(SocketAddress::loopback(0));
        h.stop();

        REQUIRE(pending.getState() == ListenCompletion::State::FAILED);
        REQUIRE_THROWS_AS(pending.get(), ReactorTerminatedError);
        REQUIRE(h.reactor->getEndpoints().empty());
    }

    SECTION("Terminate while the loop runs") {
        h.start();
        auto endpoint = h.listenLoopback();
        h.reactor->terminate();
        h.loop.join();

        REQUIRE(endpoint->isClosed());
        REQUIRE(h.reactor->getEndpoints().empty());
        REQUIRE_THROWS_AS(h.reactor->listen(SocketAddress::loopback(0)), ReactorShutdownError);
    }
}

TEST_CASE("Loop exits when status leaves ACTIVE", "[reactor]") {
    ReactorHarness h(10000ms);
    h.start();
    h.listenLoopback();

    auto start = std::chrono::steady_clock::now();
    h.stop();
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Second execute is rejected while running", "[reactor]") {
    ReactorHarness h;
    h.start();
    h.listenLoopback();
    REQUIRE_THROWS_AS(h.reactor->execute(), std::logic_error);
}
