#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstddef>

// Bounded FIFO shared between one producer thread and one consumer.
// tryPush never blocks: a full queue rejects the item so real-time producers
// keep running. pop() blocks until an item arrives or shutdown() is called.
template<typename T>
class ThreadSafeQueue
{
public:
    explicit ThreadSafeQueue(size_t capacity = 0) : m_capacity(capacity) {}

    bool tryPush(T value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || (m_capacity > 0 && m_queue.size() >= m_capacity)) {
            return false;
        }
        m_queue.push(std::move(value));
        m_cv.notify_one();
        return true;
    }

    bool pop(T& value)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_queue.empty() || m_shutdown; });
        if (m_shutdown && m_queue.empty()) {
            return false;
        }
        value = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

    bool tryPop(T& value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return false;
        }
        value = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::queue<T> empty;
        m_queue.swap(empty);
    }

    // Wakes blocked consumers; queued items can still be drained with tryPop
    void shutdown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_cv.notify_all();
    }

    // Re-arms a queue after shutdown(), dropping leftovers
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::queue<T> empty;
        m_queue.swap(empty);
        m_shutdown = false;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    std::queue<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_capacity = 0;
    bool m_shutdown = false;
};
