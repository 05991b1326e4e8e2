/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fake_admin_api.hpp
 * @brief In-memory AdminApi for the unit tests
 *
 * Binaries live in memory. Uploaded parts are stored, and remote verification hashes the stored parts in index order,
 * so a binary only verifies when the uploaded bytes really match the announced hash. Every get_binary() of a
 * hashable binary advances it one step: hashable -> hashing -> hashed (or hash_failed).
 **/

#ifndef _FLEET_FAKE_ADMIN_API_HPP_
#define _FLEET_FAKE_ADMIN_API_HPP_

#include "fleet/admin_api.hpp"
#include "fleet/event.hpp"
#include "crypto/sha256.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fleet
{
namespace test
{

class FakeAdminApi final : public AdminApi
{
public:
    struct StoredBinary {
        Binary binary;
        std::map<uint32_t, std::vector<uint8_t>> parts;
    };

    virtual Expected<Binary> create_binary(const std::string &artifact_version_id, const std::string &target,
        uint64_t expected_size, const std::string &expected_hash) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        create_binary_calls++;
        if (FLEET_SUCCESS != create_binary_status) {
            return make_unexpected(create_binary_status);
        }

        StoredBinary stored{};
        stored.binary.id = "prn:binary:" + std::to_string(++m_next_id);
        stored.binary.artifact_version_id = artifact_version_id;
        stored.binary.target = target;
        stored.binary.size = expected_size;
        stored.binary.hash = expected_hash;
        stored.binary.state = BinaryState::CREATED;
        m_binaries[stored.binary.id] = stored;
        return Binary(stored.binary);
    }

    virtual Expected<Binary> get_binary(const std::string &binary_id) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        get_binary_calls++;
        if (!get_binary_failures.empty()) {
            const auto status = get_binary_failures.front();
            get_binary_failures.pop_front();
            return make_unexpected(status);
        }

        auto it = m_binaries.find(binary_id);
        if (m_binaries.end() == it) {
            return make_unexpected(FLEET_NOT_FOUND);
        }
        if (!reported_states.empty()) {
            it->second.binary.state = reported_states.front();
            reported_states.pop_front();
        } else {
            advance_verification(it->second);
        }
        return snapshot(it->second);
    }

    virtual Expected<PartReceipt> create_binary_part(const std::string &binary_id, const PartInfo &part,
        const MemoryView &body) override
    {
        const auto in_flight = ++m_in_flight;
        update_max_in_flight(in_flight);
        if (0 < part_delay.count()) {
            std::this_thread::sleep_for(part_delay);
        }
        auto receipt = store_part(binary_id, part, body);
        --m_in_flight;
        return receipt;
    }

    virtual Expected<Binary> finalize_binary(const std::string &binary_id) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        finalize_calls++;
        if (!finalize_failures.empty()) {
            const auto status = finalize_failures.front();
            finalize_failures.pop_front();
            return make_unexpected(status);
        }

        auto it = m_binaries.find(binary_id);
        if (m_binaries.end() == it) {
            return make_unexpected(FLEET_NOT_FOUND);
        }
        it->second.binary.state = BinaryState::HASHABLE;
        return snapshot(it->second);
    }

    virtual Expected<BinarySignature> create_binary_signature(const std::string &binary_id,
        const std::string &signing_key_id, const std::string &signature) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        signature_calls++;
        if (FLEET_SUCCESS != signature_status) {
            return make_unexpected(signature_status);
        }
        if (!m_binaries.count(binary_id)) {
            return make_unexpected(FLEET_NOT_FOUND);
        }

        BinarySignature result{};
        result.id = "prn:binary_signature:" + std::to_string(++m_next_id);
        result.binary_id = binary_id;
        result.signing_key_id = signing_key_id;
        result.signature = signature;
        signatures.push_back(result);
        return result;
    }

    virtual Expected<Binary> mark_binary_signed(const std::string &binary_id) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mark_signed_calls++;
        auto it = m_binaries.find(binary_id);
        if (m_binaries.end() == it) {
            return make_unexpected(FLEET_NOT_FOUND);
        }
        it->second.binary.state = BinaryState::SIGNED;
        return snapshot(it->second);
    }

    // Test setup and inspection

    void add_binary(const Binary &binary)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        StoredBinary stored{};
        stored.binary = binary;
        m_binaries[binary.id] = stored;
    }

    void set_state(const std::string &binary_id, BinaryState state)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_binaries.at(binary_id).binary.state = state;
    }

    void remove_binary(const std::string &binary_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_binaries.erase(binary_id);
    }

    // Makes part @a index fail with @a statuses, one per attempt, before it succeeds
    void fail_part(uint32_t index, std::deque<fleet_status> statuses)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_part_failures[index] = std::move(statuses);
    }

    // Signals @a event once @a count parts were stored
    void cancel_after_parts(uint32_t count, EventPtr event)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_after_parts = count;
        m_cancel_event = event;
    }

    std::vector<uint32_t> uploaded_indices() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_uploaded_indices;
    }

    uint32_t part_calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_part_calls;
    }

    uint32_t part_attempts(uint32_t index) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_part_attempts.find(index);
        return (m_part_attempts.end() == it) ? 0 : it->second;
    }

    uint32_t max_in_flight() const { return m_max_in_flight; }

    Binary binary(const std::string &binary_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return snapshot(m_binaries.at(binary_id));
    }

    size_t binaries_count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_binaries.size();
    }

    fleet_status create_binary_status = FLEET_SUCCESS;
    fleet_status signature_status = FLEET_SUCCESS;
    std::deque<fleet_status> get_binary_failures;
    // States get_binary reports (and stores) before the simulated verification takes over
    std::deque<BinaryState> reported_states;
    std::deque<fleet_status> finalize_failures;
    std::chrono::milliseconds part_delay = std::chrono::milliseconds(0);
    // The binary stays in hashing forever
    bool stall_verification = false;
    // Remote verification fails even when the stored parts match
    bool fail_verification = false;
    // Reported by receipts instead of the part hash when not empty
    std::string receipt_hash_override;

    uint32_t create_binary_calls = 0;
    uint32_t get_binary_calls = 0;
    uint32_t finalize_calls = 0;
    uint32_t signature_calls = 0;
    uint32_t mark_signed_calls = 0;
    std::vector<BinarySignature> signatures;

private:
    Expected<PartReceipt> store_part(const std::string &binary_id, const PartInfo &part, const MemoryView &body)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_part_calls++;
        m_part_attempts[part.index]++;

        auto failures = m_part_failures.find(part.index);
        if ((m_part_failures.end() != failures) && !failures->second.empty()) {
            const auto status = failures->second.front();
            failures->second.pop_front();
            return make_unexpected(status);
        }

        auto it = m_binaries.find(binary_id);
        if (m_binaries.end() == it) {
            return make_unexpected(FLEET_NOT_FOUND);
        }
        if (!BinaryStateUtils::accepts_parts(it->second.binary.state)) {
            return make_unexpected(FLEET_CONFLICT);
        }

        it->second.parts[part.index] = std::vector<uint8_t>(body.data(), body.data() + body.size());
        it->second.binary.state = BinaryState::UPLOADING;
        m_uploaded_indices.push_back(part.index);

        if ((nullptr != m_cancel_event) && (m_uploaded_indices.size() >= m_cancel_after_parts)) {
            (void)m_cancel_event->signal();
        }

        PartReceipt receipt{};
        receipt.index = part.index;
        receipt.hash = receipt_hash_override.empty() ? part.hash : receipt_hash_override;
        receipt.status = "valid";
        return receipt;
    }

    void advance_verification(StoredBinary &stored)
    {
        if (BinaryState::HASHABLE == stored.binary.state) {
            stored.binary.state = BinaryState::HASHING;
            return;
        }
        if ((BinaryState::HASHING != stored.binary.state) || stall_verification) {
            return;
        }

        auto sha = Sha256::create();
        if (!sha) {
            stored.binary.state = BinaryState::HASH_FAILED;
            return;
        }
        for (const auto &part : stored.parts) {
            (void)sha->update(part.second.data(), part.second.size());
        }
        auto digest = sha->finalize();
        const auto actual_hash = digest ? Sha256::to_hex(digest.value()) : std::string();
        const bool is_match = !fail_verification && hashes_equal(actual_hash, stored.binary.hash);
        stored.binary.state = is_match ? BinaryState::HASHED : BinaryState::HASH_FAILED;
    }

    Binary snapshot(const StoredBinary &stored) const
    {
        auto result = stored.binary;
        if (BinaryStateUtils::accepts_parts(result.state)) {
            for (const auto &part : stored.parts) {
                auto digest = Sha256::digest(MemoryView::create_const(part.second.data(), part.second.size()));
                if (digest) {
                    result.confirmed_parts.push_back(ConfirmedPart{part.first, Sha256::to_hex(digest.value())});
                }
            }
        }
        return result;
    }

    void update_max_in_flight(uint32_t in_flight)
    {
        auto current = m_max_in_flight.load();
        while ((in_flight > current) && !m_max_in_flight.compare_exchange_weak(current, in_flight)) {}
    }

    mutable std::mutex m_mutex;
    std::map<std::string, StoredBinary> m_binaries;
    std::map<uint32_t, std::deque<fleet_status>> m_part_failures;
    std::vector<uint32_t> m_uploaded_indices;
    uint32_t m_part_calls = 0;
    std::map<uint32_t, uint32_t> m_part_attempts;
    uint32_t m_next_id = 0;
    uint32_t m_cancel_after_parts = 0;
    EventPtr m_cancel_event;
    std::atomic<uint32_t> m_in_flight{0};
    std::atomic<uint32_t> m_max_in_flight{0};
};

} /* namespace test */
} /* namespace fleet */

#endif /* _FLEET_FAKE_ADMIN_API_HPP_ */
