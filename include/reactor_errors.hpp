#pragma once
#include <stdexcept>
#include <string>

// listen() called once the reactor is shutting down. Thrown synchronously.
class ReactorShutdownError : public std::runtime_error {
public:
    explicit ReactorShutdownError(const std::string& what) : std::runtime_error(what) {}
};

// Stored in requests still queued when the reactor terminates.
class ReactorTerminatedError : public std::runtime_error {
public:
    explicit ReactorTerminatedError(const std::string& what) : std::runtime_error(what) {}
};

// The endpoint was closed between becoming ready and being processed.
class StaleRegistrationError : public std::runtime_error {
public:
    explicit StaleRegistrationError(const std::string& what) : std::runtime_error(what) {}
};

class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("Operation cancelled") {}
};
