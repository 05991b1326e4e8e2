/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary.cpp
 * @brief Remote binary state labels and ordering
 **/

#include "fleet/binary.hpp"

#include "common/utils.hpp"

#include <cctype>
#include <unordered_map>

namespace fleet
{

std::string BinaryStateUtils::to_string(BinaryState state)
{
    switch (state) {
    case BinaryState::PENDING:
        return "pending";
    case BinaryState::CREATED:
        return "created";
    case BinaryState::UPLOADING:
        return "uploading";
    case BinaryState::HASHABLE:
        return "hashable";
    case BinaryState::HASHING:
        return "hashing";
    case BinaryState::HASHED:
        return "hashed";
    case BinaryState::HASH_FAILED:
        return "hash_failed";
    case BinaryState::SIGNABLE:
        return "signable";
    case BinaryState::SIGNED:
        return "signed";
    case BinaryState::UNKNOWN:
    default:
        return "unknown";
    }
}

BinaryState BinaryStateUtils::from_string(const std::string &label)
{
    static const std::unordered_map<std::string, BinaryState> labels = {
        {"pending", BinaryState::PENDING},
        {"created", BinaryState::CREATED},
        {"uploadable", BinaryState::CREATED},
        {"uploading", BinaryState::UPLOADING},
        {"hashable", BinaryState::HASHABLE},
        {"uploaded", BinaryState::HASHABLE},
        {"hashing", BinaryState::HASHING},
        {"verifying", BinaryState::HASHING},
        {"hashed", BinaryState::HASHED},
        {"verified", BinaryState::HASHED},
        {"hash_failed", BinaryState::HASH_FAILED},
        {"hash_mismatch", BinaryState::HASH_FAILED},
        {"failed", BinaryState::HASH_FAILED},
        {"signable", BinaryState::SIGNABLE},
        {"signed", BinaryState::SIGNED},
    };

    std::string normalized;
    normalized.reserve(label.size());
    for (const auto c : label) {
        normalized.push_back(('-' == c) ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    auto it = labels.find(normalized);
    if (labels.end() == it) {
        LOGGER__DEBUG("Unrecognized binary state label '{}'", label);
        return BinaryState::UNKNOWN;
    }
    return it->second;
}

uint32_t BinaryStateUtils::rank(BinaryState state)
{
    switch (state) {
    case BinaryState::PENDING:
        return 1;
    case BinaryState::CREATED:
        return 2;
    case BinaryState::UPLOADING:
        return 3;
    case BinaryState::HASHABLE:
        return 4;
    case BinaryState::HASHING:
        return 5;
    case BinaryState::HASHED:
    case BinaryState::HASH_FAILED:
        return 6;
    case BinaryState::SIGNABLE:
        return 7;
    case BinaryState::SIGNED:
        return 8;
    case BinaryState::UNKNOWN:
    default:
        return 0;
    }
}

bool BinaryStateUtils::is_forward_transition(BinaryState from, BinaryState to)
{
    if ((BinaryState::UNKNOWN == to) || (BinaryState::HASH_FAILED == from)) {
        return false;
    }
    return rank(to) > rank(from);
}

bool BinaryStateUtils::is_verified(BinaryState state)
{
    return (BinaryState::HASHED == state) || (BinaryState::SIGNABLE == state) || (BinaryState::SIGNED == state);
}

bool BinaryStateUtils::accepts_parts(BinaryState state)
{
    return (BinaryState::PENDING == state) || (BinaryState::CREATED == state) || (BinaryState::UPLOADING == state);
}

std::string BinaryIdentity::to_key() const
{
    return artifact_version_id + "/" + target;
}

std::string BinaryIdentity::to_string() const
{
    return "artifact version " + artifact_version_id + " (target " + target + ")";
}

bool hashes_equal(const std::string &lhs, const std::string &rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} /* namespace fleet */
