#include <iostream>
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include "selector.hpp"

namespace {

// Marks the wakeup eventfd in epoll_event.data.u64. Registration ids start at 1.
constexpr uint64_t WAKEUP_TOKEN = 0;
constexpr int MAX_EVENTS = 64;

}

Selector::Selector() : m_epollFd(-1), m_wakeupFd(-1) {
    m_epollFd = epoll_create1(EPOLL_CLOEXEC);
    if (m_epollFd == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create epoll instance");
    }

    m_wakeupFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeupFd == -1) {
        int err = errno;
        close(m_epollFd);
        throw std::system_error(err, std::generic_category(), "Failed to create wakeup eventfd");
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = WAKEUP_TOKEN;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, m_wakeupFd, &ev) == -1) {
        int err = errno;
        close(m_wakeupFd);
        close(m_epollFd);
        throw std::system_error(err, std::generic_category(), "Failed to register wakeup fd with epoll");
    }
}

Selector::~Selector() {
    if (m_wakeupFd != -1) {
        close(m_wakeupFd);
    }
    if (m_epollFd != -1) {
        close(m_epollFd);
    }
}

int Selector::select(std::chrono::milliseconds timeout) {
    struct epoll_event events[MAX_EVENTS];
    m_ready.clear();

    int nfds = epoll_wait(m_epollFd, events, MAX_EVENTS, static_cast<int>(timeout.count()));
    if (nfds == -1) {
        if (errno == EINTR) {
            return 0;
        }
        throw std::system_error(errno, std::generic_category(), "epoll_wait failed");
    }

    for (int i = 0; i < nfds; ++i) {
        if (events[i].data.u64 == WAKEUP_TOKEN) {
            uint64_t val;
            // Drain the eventfd; EAGAIN just means another wakeup raced us
            if (read(m_wakeupFd, &val, sizeof(val)) == -1 && errno != EAGAIN) {
                std::cerr << "Warning: Failed to drain wakeup fd: " << std::strerror(errno) << std::endl;
            }
            continue;
        }
        if (events[i].events & (EPOLLERR | EPOLLHUP)) {
            m_ready.emplace_back(RegistrationError{events[i].data.u64, events[i].events});
        } else {
            m_ready.emplace_back(AcceptReady{events[i].data.u64});
        }
    }
    return static_cast<int>(m_ready.size());
}

void Selector::registerAccept(int fd, RegistrationId id) {
    if (id == WAKEUP_TOKEN) {
        throw std::invalid_argument("Registration id 0 is reserved");
    }
    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = id;
    if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, fd, &ev) == -1) {
        throw std::system_error(errno, std::generic_category(),
            "Failed to register fd " + std::to_string(fd) + " with epoll");
    }
}

bool Selector::deregister(int fd) noexcept {
    if (epoll_ctl(m_epollFd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        std::cerr << "Warning: Failed to unregister fd " << fd << " from epoll: " << std::strerror(errno) << std::endl;
        return false;
    }
    return true;
}

void Selector::wakeup() noexcept {
    uint64_t val = 1;
    // EAGAIN only when the counter is saturated, which still wakes the selector
    ssize_t written = write(m_wakeupFd, &val, sizeof(val));
    (void)written;
}
