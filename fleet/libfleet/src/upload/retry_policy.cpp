/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file retry_policy.cpp
 * @brief Bounded exponential backoff for transient failures
 **/

#include "fleet/retry_policy.hpp"

#include <algorithm>

namespace fleet
{

RetryPolicy::RetryPolicy(uint32_t max_attempts, std::chrono::milliseconds base_delay,
        std::chrono::milliseconds max_delay) :
    m_max_attempts(std::max<uint32_t>(max_attempts, 1)),
    m_base_delay(base_delay),
    m_max_delay(std::max(base_delay, max_delay))
{}

bool RetryPolicy::is_transient(fleet_status error)
{
    switch (error) {
    case FLEET_TIMEOUT:
    case FLEET_COMMUNICATION_FAILURE:
    case FLEET_SERVER_UNAVAILABLE:
        return true;
    default:
        return false;
    }
}

RetryDecision RetryPolicy::decide(uint32_t attempt, fleet_status error) const
{
    if (!is_transient(error) || (attempt >= m_max_attempts)) {
        return RetryDecision::give_up();
    }

    // Doubling stops once the cap is reached
    auto delay = m_base_delay;
    for (uint32_t i = 1; (i < attempt) && (delay < m_max_delay); i++) {
        delay *= 2;
    }
    return RetryDecision::retry_after(std::min(delay, m_max_delay));
}

} /* namespace fleet */
