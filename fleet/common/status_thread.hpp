/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file status_thread.hpp
 * @brief Named background thread whose body returns a fleet_status
 **/

#ifndef _FLEET_STATUS_THREAD_HPP_
#define _FLEET_STATUS_THREAD_HPP_

#include "fleet/fleet.h"

#include "common/logger_macros.hpp"
#include "common/os_utils.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace fleet
{

/**
 * Runs @a body on a new named thread. join() waits for it and returns the body's status; a failure is logged
 * with the thread name so background errors are never lost, even when the owner only joins on destruction.
 * Not movable, the thread captures `this`. Hold it in a StatusThreadPtr to move it around.
 */
class StatusThread final {
public:
    StatusThread(const std::string &name, std::function<fleet_status()> body) :
        m_name(name),
        m_status(FLEET_UNINITIALIZED),
        m_joined(false),
        m_thread([this, body]() {
            OsUtils::set_current_thread_name(m_name);
            m_status = body();
            if (FLEET_SUCCESS != m_status) {
                LOGGER__ERROR("Thread {} finished with status {}", m_name, m_status);
            }
        })
    {}

    ~StatusThread()
    {
        (void)join();
    }

    StatusThread(const StatusThread &) = delete;
    StatusThread(StatusThread &&) = delete;
    StatusThread &operator=(const StatusThread &) = delete;
    StatusThread &operator=(StatusThread &&) = delete;

    // Blocks until the body returns. Later calls return the same status.
    fleet_status join()
    {
        if (!m_joined) {
            m_thread.join();
            m_joined = true;
        }
        return m_status;
    }

    const std::string &name() const { return m_name; }

private:
    const std::string m_name;
    fleet_status m_status;
    bool m_joined;
    std::thread m_thread;
};

using StatusThreadPtr = std::unique_ptr<StatusThread>;

} /* namespace fleet */

#endif /* _FLEET_STATUS_THREAD_HPP_ */
