/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file content_chunker_tests.cpp
 * @brief Part layout and hashing of local content
 **/

#include "fleet/content_chunker.hpp"
#include "crypto/sha256.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace fleet;
using namespace fleet::test;

static std::string sha256_hex(const std::vector<uint8_t> &content, size_t offset, size_t length)
{
    auto digest = Sha256::digest(MemoryView::create_const(content.data() + offset, length));
    return digest ? Sha256::to_hex(digest.value()) : std::string();
}

class ContentChunkerTest : public ::testing::Test {
protected:
    void create_content(size_t size)
    {
        m_content = make_content(size);
        m_path = m_dir.file("content.bin");
        write_file(m_path, m_content);
    }

    TempDirectory m_dir;
    std::string m_path;
    std::vector<uint8_t> m_content;
};

TEST_F(ContentChunkerTest, SplitsIntoFixedSizeParts)
{
    create_content(10);
    auto chunker = ContentChunker::create(m_path, 4);
    ASSERT_TRUE(chunker);
    EXPECT_EQ(10u, chunker->total_size());
    ASSERT_EQ(3u, chunker->parts_count());

    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);
    ASSERT_EQ(3u, plan->parts_count());
    const uint64_t expected_offsets[] = {0, 4, 8};
    const uint64_t expected_lengths[] = {4, 4, 2};
    for (uint32_t i = 0; i < 3; i++) {
        EXPECT_EQ(i, plan->parts[i].index);
        EXPECT_EQ(expected_offsets[i], plan->parts[i].offset);
        EXPECT_EQ(expected_lengths[i], plan->parts[i].length);
        EXPECT_EQ(sha256_hex(m_content, static_cast<size_t>(expected_offsets[i]),
            static_cast<size_t>(expected_lengths[i])), plan->parts[i].hash);
    }
    EXPECT_EQ(sha256_hex(m_content, 0, m_content.size()), plan->content_hash);
}

TEST_F(ContentChunkerTest, ExactMultipleHasNoShortPart)
{
    create_content(12);
    auto chunker = ContentChunker::create(m_path, 4);
    ASSERT_TRUE(chunker);
    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);
    ASSERT_EQ(3u, plan->parts_count());
    EXPECT_EQ(4u, plan->parts.back().length);
}

TEST_F(ContentChunkerTest, PartLargerThanContent)
{
    create_content(1000);
    auto chunker = ContentChunker::create(m_path, FLEET_DEFAULT_PART_SIZE);
    ASSERT_TRUE(chunker);
    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);
    ASSERT_EQ(1u, plan->parts_count());
    EXPECT_EQ(plan->content_hash, plan->parts[0].hash);
}

TEST_F(ContentChunkerTest, PartsLargerThanReadBlock)
{
    const size_t part_size = (ContentChunker::READ_BLOCK_SIZE * 2) + 17;
    create_content((part_size * 2) + 5);
    auto chunker = ContentChunker::create(m_path, part_size);
    ASSERT_TRUE(chunker);
    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);
    ASSERT_EQ(3u, plan->parts_count());
    EXPECT_EQ(sha256_hex(m_content, part_size, part_size), plan->parts[1].hash);
    EXPECT_EQ(sha256_hex(m_content, 0, m_content.size()), plan->content_hash);
}

TEST_F(ContentChunkerTest, HashPartAndReadPartAgreeWithPlan)
{
    create_content(100);
    auto chunker = ContentChunker::create(m_path, 30);
    ASSERT_TRUE(chunker);
    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);

    for (uint32_t i = 0; i < plan->parts_count(); i++) {
        auto hashed = chunker->hash_part(i);
        ASSERT_TRUE(hashed);
        EXPECT_EQ(plan->parts[i].hash, hashed->hash);

        auto content = chunker->read_part(i);
        ASSERT_TRUE(content);
        EXPECT_EQ(plan->parts[i].hash, content->info.hash);
        ASSERT_EQ(plan->parts[i].length, content->data.size());
        EXPECT_TRUE(std::equal(content->data.data(), content->data.data() + content->data.size(),
            m_content.begin() + static_cast<ptrdiff_t>(plan->parts[i].offset)));
    }
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, chunker->hash_part(plan->parts_count()).status());
}

TEST_F(ContentChunkerTest, SequenceIsLazyAndRestartable)
{
    create_content(50);
    auto chunker = ContentChunker::create(m_path, 20);
    ASSERT_TRUE(chunker);
    auto sequence = chunker->parts();
    ASSERT_TRUE(sequence);

    auto first = sequence->next();
    ASSERT_TRUE(first);
    EXPECT_EQ(0u, first->index);
    EXPECT_EQ(FLEET_INVALID_OPERATION, sequence->content_hash().status());

    ASSERT_EQ(FLEET_SUCCESS, sequence->restart());
    std::vector<PartInfo> parts;
    while (sequence->has_next()) {
        auto part = sequence->next();
        ASSERT_TRUE(part);
        parts.push_back(part.release());
    }
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ(0u, parts[0].index);
    auto hash = sequence->content_hash();
    ASSERT_TRUE(hash);
    EXPECT_EQ(sha256_hex(m_content, 0, m_content.size()), hash.value());
    EXPECT_EQ(FLEET_INVALID_OPERATION, sequence->next().status());
}

TEST_F(ContentChunkerTest, MegabytePartsOfFiveMillionBytes)
{
    create_content(5000000);
    auto chunker = ContentChunker::create(m_path, 1048576);
    ASSERT_TRUE(chunker);
    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);

    ASSERT_EQ(5u, plan->parts_count());
    for (uint32_t i = 0; i < 4; i++) {
        EXPECT_EQ(1048576u, plan->parts[i].length);
    }
    EXPECT_EQ(4194304u, plan->parts[4].offset);
    EXPECT_EQ(714112u, plan->parts[4].length);
    EXPECT_EQ(sha256_hex(m_content, 0, m_content.size()), plan->content_hash);
}

TEST_F(ContentChunkerTest, HugePartSizeYieldsSinglePart)
{
    create_content(10);
    auto chunker = ContentChunker::create(m_path, UINT64_MAX);
    ASSERT_TRUE(chunker);
    EXPECT_EQ(1u, chunker->parts_count());

    auto plan = chunker->compute_plan();
    ASSERT_TRUE(plan);
    ASSERT_EQ(1u, plan->parts_count());
    EXPECT_EQ(10u, plan->parts[0].length);
}

TEST_F(ContentChunkerTest, RejectsInvalidInput)
{
    create_content(10);
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, ContentChunker::create(m_path, 0).status());
    EXPECT_EQ(FLEET_FILE_READ_FAILURE, ContentChunker::create(m_dir.file("missing.bin"), 4).status());

    const auto empty_path = m_dir.file("empty.bin");
    write_file(empty_path, {});
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, ContentChunker::create(empty_path, 4).status());
}

TEST_F(ContentChunkerTest, DetectsContentChangedUnderneath)
{
    create_content(40);
    auto chunker = ContentChunker::create(m_path, 16);
    ASSERT_TRUE(chunker);

    write_file(m_path, make_content(60));
    EXPECT_EQ(FLEET_FILE_READ_FAILURE, chunker->compute_plan().status());

    write_file(m_path, make_content(20));
    EXPECT_EQ(FLEET_FILE_READ_FAILURE, chunker->compute_plan().status());
}

TEST_F(ContentChunkerTest, ChecksRecordedSize)
{
    create_content(40);
    auto chunker = ContentChunker::create(m_path, 16);
    ASSERT_TRUE(chunker);
    EXPECT_EQ(FLEET_SUCCESS, chunker->check_recorded_size(40));
    EXPECT_EQ(FLEET_SIZE_MISMATCH, chunker->check_recorded_size(41));
}
