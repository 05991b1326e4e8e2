/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file event.cpp
 * @brief Event wrapper for Linux
 **/

#include "fleet/fleet.h"
#include "fleet/event.hpp"

#include "common/utils.hpp"

#include <sys/eventfd.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <climits>
#include <thread>
#include <utility>


namespace fleet
{

Event::Event(int handle) :
    m_handle(handle)
{}

Event::~Event()
{
    if (-1 != m_handle) {
        (void) close(m_handle);
    }
}

Event::Event(Event&& other) :
    m_handle(std::exchange(other.m_handle, -1))
{}

Expected<Event> Event::create(const State& initial_state)
{
    const auto handle = open_event_handle(initial_state);
    if (-1 == handle) {
        return make_unexpected(FLEET_INTERNAL_FAILURE);
    }
    return Event(handle);
}

Expected<EventPtr> Event::create_shared(const State& initial_state)
{
    const auto handle = open_event_handle(initial_state);
    CHECK_AS_EXPECTED(-1 != handle, FLEET_INTERNAL_FAILURE);

    auto res = make_shared_nothrow<Event>(handle);
    CHECK_NOT_NULL_AS_EXPECTED(res, FLEET_OUT_OF_HOST_MEMORY);

    return res;
}

fleet_status Event::wait(std::chrono::milliseconds timeout)
{
    auto status = eventfd_poll(m_handle, timeout);
    if (FLEET_TIMEOUT == status) {
        LOGGER__TRACE("eventfd_poll failed with timeout (timeout={}ms)", timeout.count());
        return status;
    }
    CHECK_SUCCESS(status);

    return FLEET_SUCCESS;
}

fleet_status Event::signal()
{
    return eventfd_write(m_handle);
}

fleet_status Event::reset()
{
    if (FLEET_TIMEOUT == wait(std::chrono::milliseconds(0))) {
        // Event is not set nothing to do, otherwise `eventfd_read` would block forever
        return FLEET_SUCCESS;
    }
    return eventfd_read(m_handle);
}

bool Event::is_signalled()
{
    return (FLEET_SUCCESS == wait(std::chrono::milliseconds(0)));
}

Expected<size_t> Event::wait_any(const std::vector<EventPtr> &events, std::chrono::milliseconds timeout)
{
    CHECK(UINT32_MAX >= timeout.count(), FLEET_INVALID_ARGUMENT, "Invalid timeout value: {}", timeout.count());
    if (INT_MAX < timeout.count()) {
        timeout = std::chrono::milliseconds(INT_MAX);
    }

    std::vector<struct pollfd> pfds;
    std::vector<size_t> indices;
    for (size_t i = 0; i < events.size(); i++) {
        if (nullptr == events[i]) {
            continue;
        }
        struct pollfd pfd{};
        pfd.fd = events[i]->m_handle;
        pfd.events = POLLIN;
        pfds.push_back(pfd);
        indices.push_back(i);
    }

    if (pfds.empty()) {
        std::this_thread::sleep_for(timeout);
        return make_unexpected(FLEET_TIMEOUT);
    }

    int poll_ret = -1;
    do {
        poll_ret = poll(pfds.data(), static_cast<nfds_t>(pfds.size()), static_cast<int>(timeout.count()));
    } while ((0 > poll_ret) && (EINTR == errno));

    if (0 == poll_ret) {
        return make_unexpected(FLEET_TIMEOUT);
    }
    CHECK(0 < poll_ret, FLEET_INTERNAL_FAILURE, "poll failed with errno={}", errno);

    for (size_t i = 0; i < pfds.size(); i++) {
        if (0 != (pfds[i].revents & POLLIN)) {
            return Expected<size_t>(indices[i]);
        }
    }

    LOGGER__ERROR("poll returned without a signaled event");
    return make_unexpected(FLEET_INTERNAL_FAILURE);
}

int Event::open_event_handle(const State& initial_state)
{
    const unsigned int state = initial_state == State::signalled ? 1 : 0;
    const auto handle = eventfd(state, EFD_CLOEXEC);
    if (-1 == handle) {
        LOGGER__ERROR("Call to eventfd failed with errno={}", errno);
    }
    return handle;
}

fleet_status Event::eventfd_poll(int fd, std::chrono::milliseconds timeout)
{
    CHECK(-1 != fd, FLEET_INVALID_OPERATION, "Waiting on a moved event");
    CHECK(UINT32_MAX >= timeout.count(), FLEET_INVALID_ARGUMENT, "Invalid timeout value: {}", timeout.count());
    if (INT_MAX < timeout.count()) {
        timeout = std::chrono::milliseconds(INT_MAX);
    }

    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int poll_ret = -1;
    do {
        poll_ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while ((0 > poll_ret) && (EINTR == errno));

    if (0 == poll_ret) {
        return FLEET_TIMEOUT;
    }
    CHECK(0 < poll_ret, FLEET_INTERNAL_FAILURE, "poll failed with errno={}", errno);
    CHECK(0 != (pfd.revents & POLLIN), FLEET_INTERNAL_FAILURE, "pfd not in read state. revents={}", pfd.revents);

    return FLEET_SUCCESS;
}

fleet_status Event::eventfd_read(int fd)
{
    uint64_t dummy = 0;
    const auto read_ret = read(fd, &dummy, sizeof(dummy));
    CHECK(sizeof(dummy) == read_ret, FLEET_INTERNAL_FAILURE,
        "read failed. bytes_read={}, expected={}, errno={}", read_ret, sizeof(dummy), errno);
    return FLEET_SUCCESS;
}

fleet_status Event::eventfd_write(int fd)
{
    // No logging on this path, signal() is called from signal handlers
    uint64_t buffer = 1;
    const auto write_ret = write(fd, &buffer, sizeof(buffer));
    return (sizeof(buffer) == write_ret) ? FLEET_SUCCESS : FLEET_INTERNAL_FAILURE;
}

} /* namespace fleet */
