#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include "reactor_errors.hpp"

// One-shot result cell. Copies share state. The first of complete(), fail()
// or cancel() wins; the rest return false and have no effect. Continuations
// attached with then() run once, on the thread that resolves the cell, or
// right away if it is already resolved.
template <typename T>
class Completion {
public:
    enum class State { PENDING, COMPLETED, FAILED, CANCELLED };
    using Callback = std::function<void(const Completion<T>&)>;

    Completion() : m_state(std::make_shared<Shared>()) {}

    bool complete(T value) {
        return resolve(State::COMPLETED, [&](Shared& s) { s.value = std::move(value); });
    }

    bool fail(std::exception_ptr error) {
        if (!error) {
            error = std::make_exception_ptr(std::runtime_error("Unspecified failure"));
        }
        return resolve(State::FAILED, [&](Shared& s) { s.error = std::move(error); });
    }

    bool cancel() {
        return resolve(State::CANCELLED, [](Shared&) {});
    }

    State getState() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->state;
    }

    bool isDone() const { return getState() != State::PENDING; }
    bool isCancelled() const { return getState() == State::CANCELLED; }

    bool waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        return m_state->cond.wait_for(lock, timeout, [this] { return m_state->state != State::PENDING; });
    }

    // Blocks until resolved. Rethrows the failure, or CancelledError.
    T get() const {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cond.wait(lock, [this] { return m_state->state != State::PENDING; });
        return extract();
    }

    // Like get() but throws std::runtime_error if still pending after timeout.
    T get(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        if (!m_state->cond.wait_for(lock, timeout, [this] { return m_state->state != State::PENDING; })) {
            throw std::runtime_error("Timed out waiting for completion");
        }
        return extract();
    }

    void then(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->state == State::PENDING) {
                m_state->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback(*this);
    }

private:
    struct Shared {
        std::mutex mutex;
        std::condition_variable cond;
        State state = State::PENDING;
        std::optional<T> value;
        std::exception_ptr error;
        std::vector<Callback> callbacks;
    };

    template <typename Fn>
    bool resolve(State target, Fn&& store) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->state != State::PENDING) {
                return false;
            }
            store(*m_state);
            m_state->state = target;
            callbacks.swap(m_state->callbacks);
        }
        m_state->cond.notify_all();
        for (auto& cb : callbacks) {
            try {
                cb(*this);
            } catch (const std::exception& e) {
                std::cerr << "Completion callback threw: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "Completion callback threw an unknown exception" << std::endl;
            }
        }
        return true;
    }

    // Caller holds the lock and the state is final.
    T extract() const {
        switch (m_state->state) {
        case State::COMPLETED:
            return *m_state->value;
        case State::FAILED:
            std::rethrow_exception(m_state->error);
        case State::CANCELLED:
        case State::PENDING:
            break;
        }
        throw CancelledError();
    }

    std::shared_ptr<Shared> m_state;
};
