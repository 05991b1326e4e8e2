/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file hash_verification_poller.hpp
 * @brief Waits for the remote service to finish verifying an uploaded binary.
 **/

#ifndef _FLEET_HASH_VERIFICATION_POLLER_HPP_
#define _FLEET_HASH_VERIFICATION_POLLER_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/event.hpp"
#include "fleet/binary.hpp"
#include "fleet/admin_api.hpp"

#include <chrono>
#include <random>
#include <string>

/** fleet namespace */
namespace fleet
{

struct PollParams {
    std::chrono::milliseconds interval = std::chrono::milliseconds(FLEET_DEFAULT_POLL_INTERVAL_MS);
    // Up to this much is added at random to every interval
    std::chrono::milliseconds jitter = std::chrono::milliseconds(0);
    // Overall deadline
    std::chrono::milliseconds timeout = std::chrono::milliseconds(FLEET_DEFAULT_POLL_TIMEOUT_MS);
};

class FLEETAPI HashVerificationPoller final
{
public:
    HashVerificationPoller(AdminApi &api, const PollParams &params, EventPtr cancel_event);

    /**
     * Polls @a binary_id until it reaches a verified state and returns it (its hash is the verified digest).
     * Returns FLEET_HASH_VERIFICATION_FAILED on hash_failed, FLEET_TIMEOUT when the deadline passes and
     * FLEET_OPERATION_ABORTED when cancelled. A backward state move is logged, and one that falls below hashable
     * fails with FLEET_CONFLICT. Transient query failures are retried until the deadline.
     * Polling only reads remote state, so it is safe to call again after a cancellation.
     */
    Expected<Binary> wait_for_verification(const std::string &binary_id);

private:
    std::chrono::milliseconds next_interval();

    AdminApi &m_api;
    PollParams m_params;
    EventPtr m_cancel_event;
    std::mt19937 m_random_engine;
};

} /* namespace fleet */

#endif /* _FLEET_HASH_VERIFICATION_POLLER_HPP_ */
