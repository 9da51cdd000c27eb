#pragma once
#include <chrono>
#include <cstdint>
#include <variant>
#include <vector>

using RegistrationId = uint64_t;

// A listening registration has connections waiting to be accepted.
struct AcceptReady {
    RegistrationId id;
};

// EPOLLERR / EPOLLHUP reported on a listening registration.
struct RegistrationError {
    RegistrationId id;
    uint32_t events;
};

using ReadyEvent = std::variant<AcceptReady, RegistrationError>;

// epoll instance with an eventfd wakeup channel. select() and readyEvents()
// belong to the reactor thread; registration, deregistration and wakeup() may
// be called from any thread.
class Selector {
    int m_epollFd;
    int m_wakeupFd;
    std::vector<ReadyEvent> m_ready;

public:
    Selector();
    ~Selector();

    Selector(const Selector&) = delete;
    Selector& operator=(const Selector&) = delete;

    // Returns the number of ready registrations; 0 on timeout, wakeup or EINTR.
    int select(std::chrono::milliseconds timeout);

    const std::vector<ReadyEvent>& readyEvents() const { return m_ready; }

    void registerAccept(int fd, RegistrationId id);
    bool deregister(int fd) noexcept;

    // Async-signal-safe.
    void wakeup() noexcept;

    int getWakeupFd() const { return m_wakeupFd; }
};
