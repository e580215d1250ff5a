//
// work_queue.hpp
// Bounded producer/consumer queue feeding the copy workers
//

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace simgroup {

// Bounded hand-off of non-owning task pointers between a producer and worker threads.
// pop() returns nullptr once the sentinel is set and the queue has drained.
template <typename T>
class WorkQueue {
private:
    std::vector<T*> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::atomic<bool> m_sentinel{ false };
    size_t m_maxCapacity;

public:
    explicit WorkQueue(size_t maxCapacity)
        : m_maxCapacity(std::max<size_t>(1, maxCapacity)) {
    }

    void push(T* item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return m_items.size() < m_maxCapacity; });
        m_items.emplace_back(item);
        m_cond.notify_all();
    }

    T* pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_items.empty() || m_sentinel.load(std::memory_order_acquire); });
        if (m_items.empty()) { return nullptr; }
        T* result = m_items.back();
        m_items.pop_back();
        m_cond.notify_all();
        return result;
    }

    void setSentinel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sentinel.store(true, std::memory_order_release);
        }
        m_cond.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }
};

} // namespace simgroup
