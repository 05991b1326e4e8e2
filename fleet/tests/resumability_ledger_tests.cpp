/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file resumability_ledger_tests.cpp
 * @brief Persisted upload records and their reconciliation with local content
 **/

#include "fleet/resumability_ledger.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace fleet;
using namespace fleet::test;

class ResumabilityLedgerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        m_content_path = m_dir.file("content.bin");
        write_file(m_content_path, make_content(100));

        auto ledger = ResumabilityLedger::create(m_dir.file("uploads"));
        ASSERT_TRUE(ledger);
        m_ledger = std::make_unique<ResumabilityLedger>(ledger.release());

        auto chunker = ContentChunker::create(m_content_path, 30);
        ASSERT_TRUE(chunker);
        m_chunker = std::make_unique<ContentChunker>(chunker.release());

        auto plan = m_chunker->compute_plan();
        ASSERT_TRUE(plan);
        m_plan = plan.release();
    }

    ResumabilityRecord make_record(std::initializer_list<uint32_t> confirmed)
    {
        auto record = ResumabilityRecord::create(m_identity, "prn:binary:1", m_plan);
        for (const auto index : confirmed) {
            record.confirmed_parts[index] = m_plan.parts[index].hash;
        }
        return record;
    }

    TempDirectory m_dir;
    std::string m_content_path;
    const BinaryIdentity m_identity{"prn:artifact_version:7", "rpi4"};
    std::unique_ptr<ResumabilityLedger> m_ledger;
    std::unique_ptr<ContentChunker> m_chunker;
    UploadPlan m_plan;
};

TEST_F(ResumabilityLedgerTest, SaveAndLoad)
{
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, make_record({0, 2})));

    auto loaded = m_ledger->load(m_identity);
    ASSERT_TRUE(loaded);
    EXPECT_EQ("prn:binary:1", loaded->binary_id);
    EXPECT_EQ(m_plan.content_hash, loaded->content_hash);
    EXPECT_EQ(100u, loaded->total_size);
    EXPECT_EQ(30u, loaded->part_size);
    ASSERT_EQ(2u, loaded->confirmed_parts.size());
    EXPECT_EQ(m_plan.parts[2].hash, loaded->confirmed_parts.at(2));
}

TEST_F(ResumabilityLedgerTest, MissingRecordIsNotFound)
{
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
    EXPECT_EQ(FLEET_SUCCESS, m_ledger->remove(m_identity));
}

TEST_F(ResumabilityLedgerTest, RecordsAreKeptPerIdentity)
{
    const BinaryIdentity other{"prn:artifact_version:7", "rpi5"};
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, make_record({0})));
    EXPECT_NE(m_ledger->record_path(m_identity), m_ledger->record_path(other));
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(other).status());
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, m_ledger->save(other, make_record({0})));
}

TEST_F(ResumabilityLedgerTest, CorruptRecordIsTreatedAsAbsent)
{
    write_text_file(m_ledger->record_path(m_identity), "{\"version\": 1, \"target\": ");
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    EXPECT_FALSE(reconciled->is_resumed());
}

TEST_F(ResumabilityLedgerTest, IncompatibleVersionIsTreatedAsAbsent)
{
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, make_record({0})));
    auto record = make_record({0});
    record.format_version = FLEET_LEDGER_FORMAT_VERSION + 1;
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(ResumabilityLedgerTest, ReconcileWithoutRecordIsFresh)
{
    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    EXPECT_FALSE(reconciled->is_resumed());
}

TEST_F(ResumabilityLedgerTest, ReconcileResumesMatchingRecord)
{
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, make_record({1, 3})));

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    ASSERT_TRUE(reconciled->is_resumed());
    EXPECT_EQ("prn:binary:1", reconciled->record.binary_id);
    ASSERT_EQ(2u, reconciled->record.confirmed_parts.size());
    EXPECT_EQ(1u, reconciled->record.confirmed_parts.count(1));
    EXPECT_EQ(1u, reconciled->record.confirmed_parts.count(3));
}

TEST_F(ResumabilityLedgerTest, ReconcileDropsUnknownParts)
{
    auto record = make_record({0, 1});
    record.confirmed_parts[1] = std::string(64, '0');
    record.confirmed_parts[9] = m_plan.parts[0].hash;
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    ASSERT_TRUE(reconciled->is_resumed());
    ASSERT_EQ(1u, reconciled->record.confirmed_parts.size());
    EXPECT_EQ(1u, reconciled->record.confirmed_parts.count(0));
}

TEST_F(ResumabilityLedgerTest, ReconcileDiscardsRecordOfChangedContent)
{
    auto record = make_record({0, 1});
    record.content_hash = std::string(64, 'a');
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    EXPECT_FALSE(reconciled->is_resumed());
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(ResumabilityLedgerTest, ReconcileDiscardsRecordOfOtherPartSize)
{
    auto record = make_record({0});
    record.part_size = 40;
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    EXPECT_FALSE(reconciled->is_resumed());
}

TEST_F(ResumabilityLedgerTest, ReconcileDiscardsRecordOfOtherSize)
{
    auto record = make_record({0});
    record.total_size = 99;
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));

    auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
    ASSERT_TRUE(reconciled);
    EXPECT_FALSE(reconciled->is_resumed());
}

TEST_F(ResumabilityLedgerTest, ListSkipsUnusableRecords)
{
    const BinaryIdentity other{"prn:artifact_version:8", "rpi4"};
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, make_record({0})));
    auto other_record = make_record({});
    other_record.identity = other;
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(other, other_record));
    write_text_file(m_ledger->directory() + "/garbage.json", "not json");
    write_text_file(m_ledger->directory() + "/notes.txt", "ignored");

    auto records = m_ledger->list();
    ASSERT_TRUE(records);
    EXPECT_EQ(2u, records->size());
}
