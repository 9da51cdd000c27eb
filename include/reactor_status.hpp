#pragma once
#include <atomic>

enum class ReactorStatus {
    INACTIVE,
    ACTIVE,
    SHUTTING_DOWN,
    SHUT_DOWN
};

const char* toString(ReactorStatus status);

// Owned by the reactor lifecycle; the listening reactor only reads it.
class ReactorStatusSource {
public:
    virtual ~ReactorStatusSource() = default;
    virtual ReactorStatus getStatus() const = 0;
};

// Plain atomic cell, enough for a program that drives the lifecycle by hand.
class BasicReactorStatus : public ReactorStatusSource {
    std::atomic<ReactorStatus> m_status;
public:
    explicit BasicReactorStatus(ReactorStatus initial = ReactorStatus::INACTIVE) : m_status(initial) {}

    ReactorStatus getStatus() const override { return m_status.load(); }
    void set(ReactorStatus status) { m_status.store(status); }
};
