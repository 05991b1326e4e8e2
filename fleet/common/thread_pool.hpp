/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file thread_pool.hpp
 * @brief Fixed size worker pool executing status returning jobs
 **/

#ifndef _FLEET_THREAD_POOL_HPP_
#define _FLEET_THREAD_POOL_HPP_

#include "common/status_thread.hpp"
#include "common/logger_macros.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>
#include <string>

namespace fleet {

class WorkerPool {
public:
    WorkerPool(size_t num_worker_threads, const std::string &name = "fleet-worker") :
        m_num_threads(num_worker_threads), m_kill_threads(false)
    {
        for (size_t i = 0; i < num_worker_threads; i++) {
            m_threads.emplace_back(std::make_unique<StatusThread>(name,
            [this]() -> fleet_status {
                while(true) {
                    std::function<fleet_status()> func;
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);
                        m_cv.wait(lock, [this](){ return (m_kill_threads || !m_queue.empty()); });
                        if (m_kill_threads && m_queue.empty()) {
                            return FLEET_SUCCESS;
                        }
                        func = std::move(m_queue.front());
                        m_queue.pop();
                    }

                    fleet_status status = func();
                    if (FLEET_SUCCESS != status) {
                        LOGGER__DEBUG("Worker job failed with status {}", status);
                    }
               }
            }
        ));
        }
    }

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool(WorkerPool &&other) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool& operator=(WorkerPool &&) = delete;

    template<class F, class... Args>
    fleet_status add_job(F&& func, Args&&... args) {
        auto job = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_kill_threads) {
                LOGGER__ERROR("Cannot add jobs after the worker pool has been terminated");
                return FLEET_INVALID_OPERATION;
            }
            m_queue.emplace(job);
        }
        m_cv.notify_one();
        return FLEET_SUCCESS;
    }

    // Lets the queued jobs drain and joins all workers. No jobs may be added afterwards.
    void join()
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_kill_threads = true;
        }
        m_cv.notify_all();
        for (auto &thread : m_threads) {
            if (nullptr != thread) {
                (void)thread->join();
            }
        }
        m_threads.clear();
    }

    size_t size() const { return m_num_threads; }

    ~WorkerPool() {
        join();
    }

private:
    size_t m_num_threads;
    std::vector<StatusThreadPtr> m_threads;
    std::queue<std::function<fleet_status()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_kill_threads;
};

} /* namespace fleet */

#endif /* _FLEET_THREAD_POOL_HPP_ */
