/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary.hpp
 * @brief Remote binary data model: binaries, parts, signing keys and signatures.
 **/

#ifndef _FLEET_BINARY_HPP_
#define _FLEET_BINARY_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"

#include <string>
#include <vector>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

/**
 * Lifecycle of a remote binary. States only move forward along
 * pending -> created -> uploading -> hashable -> hashing -> {hashed | hash_failed} -> signable -> signed.
 */
enum class BinaryState {
    UNKNOWN = 0,
    PENDING,
    CREATED,
    UPLOADING,
    HASHABLE,
    HASHING,
    HASHED,
    HASH_FAILED,
    SIGNABLE,
    SIGNED,
};

class FLEETAPI BinaryStateUtils final
{
public:
    BinaryStateUtils() = delete;

    // Returns the canonical remote label of the state
    static std::string to_string(BinaryState state);
    // Parses a remote label (aliases included). Unknown labels map to BinaryState::UNKNOWN.
    static BinaryState from_string(const std::string &label);

    // Position of the state along the lifecycle. hashed and hash_failed share a rank.
    static uint32_t rank(BinaryState state);
    static bool is_forward_transition(BinaryState from, BinaryState to);

    // True once remote integrity verification has succeeded
    static bool is_verified(BinaryState state);
    // True while the remote service still accepts part uploads
    static bool accepts_parts(BinaryState state);
};

/*! Local identity of a binary: one binary exists per artifact version and target. */
struct FLEETAPI BinaryIdentity {
    std::string artifact_version_id;
    std::string target;

    // Stable string key, used to name the persisted ledger record
    std::string to_key() const;
    std::string to_string() const;
};

struct ConfirmedPart {
    uint32_t index;
    std::string hash;
};

/*! Remote binary resource */
struct Binary {
    std::string id;
    std::string artifact_version_id;
    std::string target;
    uint64_t size = 0;
    std::string hash;
    BinaryState state = BinaryState::UNKNOWN;
    std::vector<ConfirmedPart> confirmed_parts;
};

/*! Remote acknowledgement of a single uploaded part */
struct PartReceipt {
    uint32_t index;
    std::string hash;
    std::string status;
};

struct SigningKeyPair {
    std::string name;
    std::string private_key_path;
    // Identity of the public key registered remotely
    std::string signing_key_id;
};

struct BinarySignature {
    std::string id;
    std::string binary_id;
    std::string signing_key_id;
    // Uppercase hex encoded signature bytes
    std::string signature;
};

// Case insensitive comparison of two hex digests
FLEETAPI bool hashes_equal(const std::string &lhs, const std::string &rhs);

} /* namespace fleet */

#endif /* _FLEET_BINARY_HPP_ */
