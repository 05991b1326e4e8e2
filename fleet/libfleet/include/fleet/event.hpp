/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file event.hpp
 * @brief Manual reset event, used for cancellation and interruptible waits.
 **/

#ifndef _FLEET_EVENT_HPP_
#define _FLEET_EVENT_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"

#include <memory>
#include <vector>
#include <chrono>

/** fleet namespace */
namespace fleet
{

class Event;
using EventPtr = std::shared_ptr<Event>;

// Manual reset event backed by an eventfd. signal() is async-signal-safe and may be called from a signal handler.
class FLEETAPI Event final
{
public:
    enum class State
    {
        signalled,
        not_signalled
    };

    explicit Event(int handle);
    ~Event();
    Event(Event&& other);

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;
    Event& operator=(Event&&) = delete;

    static Expected<Event> create(const State& initial_state);
    static Expected<EventPtr> create_shared(const State& initial_state);

    // Blocks the current thread until the event is signaled. Returns FLEET_TIMEOUT if it was not signaled in time.
    // The event is not reset.
    fleet_status wait(std::chrono::milliseconds timeout);
    fleet_status signal();
    fleet_status reset();
    bool is_signalled();

    /**
     * Blocks until any of @a events is signaled and returns its index, or FLEET_TIMEOUT.
     * Null entries are ignored.
     */
    static Expected<size_t> wait_any(const std::vector<EventPtr> &events, std::chrono::milliseconds timeout);

    static constexpr auto INIFINITE_TIMEOUT() { return std::chrono::milliseconds(FLEET_INFINITE); }

private:
    static int open_event_handle(const State& initial_state);
    static fleet_status eventfd_poll(int fd, std::chrono::milliseconds timeout);
    static fleet_status eventfd_read(int fd);
    static fleet_status eventfd_write(int fd);

    int m_handle;
};

} /* namespace fleet */

#endif /* _FLEET_EVENT_HPP_ */
