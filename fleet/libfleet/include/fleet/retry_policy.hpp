/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file retry_policy.hpp
 * @brief Bounded exponential backoff for remote requests.
 **/

#ifndef _FLEET_RETRY_POLICY_HPP_
#define _FLEET_RETRY_POLICY_HPP_

#include "fleet/fleet.h"

#include <chrono>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

struct RetryDecision {
    bool should_retry;
    std::chrono::milliseconds delay;

    static RetryDecision give_up() { return RetryDecision{false, std::chrono::milliseconds(0)}; }
    static RetryDecision retry_after(std::chrono::milliseconds delay) { return RetryDecision{true, delay}; }
};

class FLEETAPI RetryPolicy final
{
public:
    RetryPolicy(uint32_t max_attempts = FLEET_DEFAULT_MAX_UPLOAD_ATTEMPTS,
        std::chrono::milliseconds base_delay = std::chrono::milliseconds(FLEET_DEFAULT_BACKOFF_BASE_MS),
        std::chrono::milliseconds max_delay = std::chrono::milliseconds(FLEET_DEFAULT_BACKOFF_CAP_MS));

    /**
     * Decides what to do after attempt number @a attempt (1 based) failed with @a error.
     * Only transient errors are retried, at most max_attempts() attempts in total. The n-th retry waits
     * base_delay * 2^(n-1), capped at max_delay.
     */
    RetryDecision decide(uint32_t attempt, fleet_status error) const;

    // Timeouts, transport failures and 408/429/5xx answers
    static bool is_transient(fleet_status error);

    uint32_t max_attempts() const { return m_max_attempts; }

private:
    uint32_t m_max_attempts;
    std::chrono::milliseconds m_base_delay;
    std::chrono::milliseconds m_max_delay;
};

} /* namespace fleet */

#endif /* _FLEET_RETRY_POLICY_HPP_ */
