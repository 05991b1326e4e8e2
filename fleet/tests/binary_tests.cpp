/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_tests.cpp
 * @brief Binary lifecycle states and identities
 **/

#include "fleet/binary.hpp"

#include <gtest/gtest.h>

using namespace fleet;

TEST(BinaryStateTest, ParsesCanonicalLabels)
{
    const BinaryState states[] = {BinaryState::PENDING, BinaryState::CREATED, BinaryState::UPLOADING,
        BinaryState::HASHABLE, BinaryState::HASHING, BinaryState::HASHED, BinaryState::HASH_FAILED,
        BinaryState::SIGNABLE, BinaryState::SIGNED};
    for (const auto state : states) {
        EXPECT_EQ(state, BinaryStateUtils::from_string(BinaryStateUtils::to_string(state)));
    }
}

TEST(BinaryStateTest, ParsesAliases)
{
    EXPECT_EQ(BinaryState::CREATED, BinaryStateUtils::from_string("uploadable"));
    EXPECT_EQ(BinaryState::HASHABLE, BinaryStateUtils::from_string("uploaded"));
    EXPECT_EQ(BinaryState::HASHING, BinaryStateUtils::from_string("Verifying"));
    EXPECT_EQ(BinaryState::HASH_FAILED, BinaryStateUtils::from_string("hash-failed"));
    EXPECT_EQ(BinaryState::SIGNED, BinaryStateUtils::from_string("SIGNED"));
}

TEST(BinaryStateTest, UnknownLabelIsNotFatal)
{
    EXPECT_EQ(BinaryState::UNKNOWN, BinaryStateUtils::from_string("quarantined"));
    EXPECT_EQ(BinaryState::UNKNOWN, BinaryStateUtils::from_string(""));
    EXPECT_EQ("unknown", BinaryStateUtils::to_string(BinaryState::UNKNOWN));
}

TEST(BinaryStateTest, TransitionsOnlyMoveForward)
{
    EXPECT_TRUE(BinaryStateUtils::is_forward_transition(BinaryState::CREATED, BinaryState::UPLOADING));
    EXPECT_TRUE(BinaryStateUtils::is_forward_transition(BinaryState::HASHING, BinaryState::HASH_FAILED));
    EXPECT_TRUE(BinaryStateUtils::is_forward_transition(BinaryState::HASHED, BinaryState::SIGNED));
    EXPECT_FALSE(BinaryStateUtils::is_forward_transition(BinaryState::HASHABLE, BinaryState::UPLOADING));
    EXPECT_FALSE(BinaryStateUtils::is_forward_transition(BinaryState::HASHED, BinaryState::HASH_FAILED));
    EXPECT_FALSE(BinaryStateUtils::is_forward_transition(BinaryState::HASH_FAILED, BinaryState::SIGNABLE));
    EXPECT_FALSE(BinaryStateUtils::is_forward_transition(BinaryState::CREATED, BinaryState::UNKNOWN));
}

TEST(BinaryStateTest, VerifiedAndUploadableStates)
{
    EXPECT_TRUE(BinaryStateUtils::is_verified(BinaryState::HASHED));
    EXPECT_TRUE(BinaryStateUtils::is_verified(BinaryState::SIGNABLE));
    EXPECT_TRUE(BinaryStateUtils::is_verified(BinaryState::SIGNED));
    EXPECT_FALSE(BinaryStateUtils::is_verified(BinaryState::HASHING));
    EXPECT_FALSE(BinaryStateUtils::is_verified(BinaryState::HASH_FAILED));

    EXPECT_TRUE(BinaryStateUtils::accepts_parts(BinaryState::CREATED));
    EXPECT_TRUE(BinaryStateUtils::accepts_parts(BinaryState::UPLOADING));
    EXPECT_FALSE(BinaryStateUtils::accepts_parts(BinaryState::HASHABLE));
    EXPECT_FALSE(BinaryStateUtils::accepts_parts(BinaryState::UNKNOWN));
}

TEST(BinaryIdentityTest, KeyDependsOnArtifactVersionAndTarget)
{
    const BinaryIdentity a{"prn:artifact_version:1", "rpi4"};
    const BinaryIdentity b{"prn:artifact_version:1", "rpi5"};
    const BinaryIdentity c{"prn:artifact_version:1", "rpi4"};
    EXPECT_NE(a.to_key(), b.to_key());
    EXPECT_EQ(a.to_key(), c.to_key());
}

TEST(HashesEqualTest, IgnoresCase)
{
    EXPECT_TRUE(hashes_equal("ABCDEF01", "abcdef01"));
    EXPECT_FALSE(hashes_equal("abcdef01", "abcdef02"));
    EXPECT_FALSE(hashes_equal("abcdef", "abcdef01"));
}
