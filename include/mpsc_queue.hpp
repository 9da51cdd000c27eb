#pragma once
#include <atomic>
#include <optional>
#include <utility>

// Unbounded lock-free queue: any number of producers, one consumer.
// Linked nodes with a stub; producers swap the head, the consumer walks the
// tail. A push still linking its node reads as empty to the consumer.
// Nodes are raw pointers: ownership passes through the atomic links, so a
// node belongs to the queue from push() until pop() retires the old tail.
template <typename T>
class MpscQueue {
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
    };

    std::atomic<Node*> m_head;
    Node* m_tail;

public:
    MpscQueue() {
        Node* stub = new Node();
        m_head.store(stub);
        m_tail = stub;
    }

    ~MpscQueue() {
        while (m_tail != nullptr) {
            Node* next = m_tail->next.load();
            delete m_tail;
            m_tail = next;
        }
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;

    void push(T value) {
        Node* node = new Node();
        node->value.emplace(std::move(value));
        Node* prev = m_head.exchange(node);
        prev->next.store(node);
    }

    // Consumer thread only.
    std::optional<T> pop() {
        Node* next = m_tail->next.load();
        if (next == nullptr) {
            return std::nullopt;
        }
        std::optional<T> result(std::move(next->value));
        next->value.reset();
        delete m_tail;
        m_tail = next;
        return result;
    }

    // Consumer thread only; racy against producers by nature.
    bool empty() const {
        return m_tail->next.load() == nullptr;
    }
};
