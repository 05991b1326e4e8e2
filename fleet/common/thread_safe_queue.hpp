/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file thread_safe_queue.hpp
 * @brief Blocking multi-producer single-consumer queue with shutdown
 **/

#ifndef _FLEET_THREAD_SAFE_QUEUE_HPP_
#define _FLEET_THREAD_SAFE_QUEUE_HPP_

#include "fleet/expected.hpp"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

#include <queue>
#include <mutex>
#include <limits>
#include <condition_variable>
#include <chrono>


namespace fleet
{

template <class T>
class SafeQueue final {
public:
    static constexpr size_t UNLIMITED_QUEUE_SIZE = std::numeric_limits<size_t>::max();

    SafeQueue(size_t max_size) :
        m_max_size(max_size),
        m_is_shutdown(false)
    {}

    SafeQueue() :
        SafeQueue(UNLIMITED_QUEUE_SIZE)
    {}

    ~SafeQueue() = default;

    fleet_status enqueue(T &&t)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            CHECK(!m_is_shutdown, FLEET_SHUTDOWN_EVENT_SIGNALED, "Can't enqueue after queue shutdown");
            CHECK((m_max_size == UNLIMITED_QUEUE_SIZE) || (m_queue.size() < m_max_size), FLEET_INVALID_OPERATION,
                "Queue is full (max size {})", m_max_size);
            m_queue.push(std::move(t));
        }
        m_cv.notify_one();
        return FLEET_SUCCESS;
    }

    /**
     * Blocks until an item is available. Items enqueued before shutdown() are still returned; once the queue is
     * both empty and shut down, returns FLEET_SHUTDOWN_EVENT_SIGNALED.
     */
    Expected<T> dequeue(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        const auto has_item = m_cv.wait_for(lock, timeout, [this]() { return (m_is_shutdown || !m_queue.empty()); });
        if (!has_item) {
            return make_unexpected(FLEET_TIMEOUT);
        }
        if (m_queue.empty()) {
            return make_unexpected(FLEET_SHUTDOWN_EVENT_SIGNALED);
        }
        T val = std::move(m_queue.front());
        m_queue.pop();
        return val;
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_is_shutdown = true;
        }
        m_cv.notify_all();
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

protected:
    const size_t m_max_size;
    std::queue<T> m_queue;
    bool m_is_shutdown;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} /* namespace fleet */

#endif /* _FLEET_THREAD_SAFE_QUEUE_HPP_ */
