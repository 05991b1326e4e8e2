/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file hash_verification_poller.cpp
 * @brief Waits for the remote integrity verification of a finalized binary
 **/

#include "fleet/hash_verification_poller.hpp"
#include "fleet/retry_policy.hpp"

#include "common/utils.hpp"

namespace fleet
{

HashVerificationPoller::HashVerificationPoller(AdminApi &api, const PollParams &params, EventPtr cancel_event) :
    m_api(api),
    m_params(params),
    m_cancel_event(cancel_event),
    m_random_engine(std::random_device{}())
{}

std::chrono::milliseconds HashVerificationPoller::next_interval()
{
    if (0 >= m_params.jitter.count()) {
        return m_params.interval;
    }
    std::uniform_int_distribution<int64_t> distribution(0, m_params.jitter.count());
    return m_params.interval + std::chrono::milliseconds(distribution(m_random_engine));
}

Expected<Binary> HashVerificationPoller::wait_for_verification(const std::string &binary_id)
{
    const auto deadline = std::chrono::steady_clock::now() + m_params.timeout;
    uint32_t polls = 0;
    auto last_state = BinaryState::UNKNOWN;

    while (true) {
        if ((nullptr != m_cancel_event) && m_cancel_event->is_signalled()) {
            LOGGER__WARNING("Waiting for verification of binary {} was cancelled", binary_id);
            return make_unexpected(FLEET_OPERATION_ABORTED);
        }

        polls++;
        auto binary = m_api.get_binary(binary_id);
        if (binary) {
            const auto state = binary->state;
            if ((BinaryState::UNKNOWN != last_state) && (BinaryState::UNKNOWN != state) && (last_state != state) &&
                !BinaryStateUtils::is_forward_transition(last_state, state)) {
                LOGGER__WARNING("Binary {} moved back from {} to {}", binary_id, BinaryStateUtils::to_string(last_state),
                    BinaryStateUtils::to_string(state));
                // Content is no longer complete on the remote side, waiting will not verify it
                CHECK_AS_EXPECTED(BinaryStateUtils::rank(state) >= BinaryStateUtils::rank(BinaryState::HASHABLE),
                    FLEET_CONFLICT, "Binary {} is {} again after being finalized", binary_id,
                    BinaryStateUtils::to_string(state));
            }
            if (BinaryState::UNKNOWN != state) {
                last_state = state;
            }

            if (BinaryStateUtils::is_verified(state)) {
                LOGGER__INFO("Binary {} verified after {} polls (state {}, hash {})", binary_id, polls,
                    BinaryStateUtils::to_string(binary->state), binary->hash);
                return binary;
            }
            CHECK_AS_EXPECTED(BinaryState::HASH_FAILED != state, FLEET_HASH_VERIFICATION_FAILED,
                "Remote verification of binary {} failed", binary_id);
            LOGGER__DEBUG("Binary {} is {}, waiting for verification", binary_id,
                BinaryStateUtils::to_string(state));
        } else if (RetryPolicy::is_transient(binary.status())) {
            LOGGER__WARNING("Polling binary {} failed with status {}, will poll again", binary_id, binary.status());
        } else {
            LOGGER__ERROR("Polling binary {} failed with status {}", binary_id, binary.status());
            return make_unexpected(binary.status());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOGGER__ERROR("Binary {} was not verified within {} ms ({} polls)", binary_id, m_params.timeout.count(),
                polls);
            return make_unexpected(FLEET_TIMEOUT);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto interrupted = Event::wait_any({ m_cancel_event }, std::min(next_interval(), remaining));
        if (interrupted) {
            LOGGER__WARNING("Waiting for verification of binary {} was cancelled", binary_id);
            return make_unexpected(FLEET_OPERATION_ABORTED);
        }
        CHECK_AS_EXPECTED(FLEET_TIMEOUT == interrupted.status(), interrupted.status());
    }
}

} /* namespace fleet */
