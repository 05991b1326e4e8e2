/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upload_orchestrator_tests.cpp
 * @brief Binary creation, resumable concurrent part uploads and finalization
 **/

#include "fleet/upload_orchestrator.hpp"
#include "fake_admin_api.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <set>

using namespace fleet;
using namespace fleet::test;
using namespace std::chrono_literals;

namespace
{

class RecordingProgress final : public ProgressReporter {
public:
    virtual void on_stage(PipelineStage) override {}
    virtual void on_upload_started(uint64_t total, uint64_t confirmed, uint32_t to_upload) override
    {
        total_bytes = total;
        confirmed_bytes = confirmed;
        parts_to_upload = to_upload;
    }
    virtual void on_part_confirmed(const PartProgress &progress) override
    {
        parts_confirmed++;
        bytes_confirmed += progress.bytes;
    }
    virtual void on_part_retry(uint32_t, uint32_t, fleet_status) override { retries++; }
    virtual void on_upload_finished(fleet_status status) override { finished_status = status; }

    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint64_t> confirmed_bytes{0};
    std::atomic<uint32_t> parts_to_upload{0};
    std::atomic<uint32_t> parts_confirmed{0};
    std::atomic<uint64_t> bytes_confirmed{0};
    std::atomic<uint32_t> retries{0};
    std::atomic<fleet_status> finished_status{FLEET_UNINITIALIZED};
};

std::set<uint32_t> range(uint32_t first, uint32_t last)
{
    std::set<uint32_t> result;
    for (auto i = first; i < last; i++) {
        result.insert(i);
    }
    return result;
}

} /* namespace */

class UploadOrchestratorTest : public ::testing::Test {
protected:
    static constexpr uint32_t PARTS_COUNT = 10;

    void SetUp() override
    {
        m_content_path = m_dir.file("content.bin");
        write_file(m_content_path, make_content(100));

        auto ledger = ResumabilityLedger::create(m_dir.file("uploads"));
        ASSERT_TRUE(ledger);
        m_ledger = std::make_unique<ResumabilityLedger>(ledger.release());

        auto chunker = ContentChunker::create(m_content_path, 10);
        ASSERT_TRUE(chunker);
        m_chunker = std::make_unique<ContentChunker>(chunker.release());

        auto plan = m_chunker->compute_plan();
        ASSERT_TRUE(plan);
        m_plan = plan.release();
        ASSERT_EQ(PARTS_COUNT, m_plan.parts_count());

        auto cancel_event = Event::create_shared(Event::State::not_signalled);
        ASSERT_TRUE(cancel_event);
        m_cancel_event = cancel_event.release();

        m_params.concurrency = 4;
        m_params.retry_policy = RetryPolicy(3, 1ms, 2ms);
    }

    std::unique_ptr<UploadOrchestrator> make_orchestrator()
    {
        return std::make_unique<UploadOrchestrator>(m_api, *m_ledger, m_progress, m_cancel_event, m_params);
    }

    ReconciledPlan reconcile()
    {
        auto reconciled = m_ledger->reconcile(m_identity, *m_chunker, m_plan);
        EXPECT_TRUE(reconciled);
        return reconciled ? reconciled.release() : ReconciledPlan::fresh();
    }

    // Creates the remote binary and its ledger record
    Binary create_binary(UploadOrchestrator &orchestrator)
    {
        auto binary = orchestrator.ensure_binary(m_identity, m_plan, ReconciledPlan::fresh());
        EXPECT_TRUE(binary);
        return binary ? binary.release() : Binary{};
    }

    std::set<uint32_t> recorded_parts()
    {
        auto record = m_ledger->load(m_identity);
        if (!record) {
            return {};
        }
        return get_recorded_indices(record.value());
    }

    static std::set<uint32_t> get_recorded_indices(const ResumabilityRecord &record)
    {
        std::set<uint32_t> indices;
        for (const auto &part : record.confirmed_parts) {
            indices.insert(part.first);
        }
        return indices;
    }

    TempDirectory m_dir;
    std::string m_content_path;
    const BinaryIdentity m_identity{"prn:artifact_version:3", "rpi4"};
    FakeAdminApi m_api;
    RecordingProgress m_progress;
    std::unique_ptr<ResumabilityLedger> m_ledger;
    std::unique_ptr<ContentChunker> m_chunker;
    UploadPlan m_plan;
    EventPtr m_cancel_event;
    UploadParams m_params;
};

TEST_F(UploadOrchestratorTest, FreshUploadConfirmsEveryPart)
{
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);
    EXPECT_EQ(1u, m_api.create_binary_calls);
    EXPECT_EQ(m_plan.content_hash, binary.hash);

    auto record = m_ledger->load(m_identity);
    ASSERT_TRUE(record);
    EXPECT_EQ(binary.id, record->binary_id);
    EXPECT_TRUE(record->confirmed_parts.empty());

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(range(0, PARTS_COUNT), confirmed.value());
    EXPECT_EQ(PARTS_COUNT, m_api.part_calls());
    EXPECT_EQ(range(0, PARTS_COUNT), recorded_parts());

    EXPECT_EQ(100u, m_progress.total_bytes.load());
    EXPECT_EQ(0u, m_progress.confirmed_bytes.load());
    EXPECT_EQ(PARTS_COUNT, m_progress.parts_confirmed.load());
    EXPECT_EQ(100u, m_progress.bytes_confirmed.load());
    EXPECT_EQ(FLEET_SUCCESS, m_progress.finished_status.load());

    auto finalized = orchestrator->finalize(binary, m_plan, confirmed.value());
    ASSERT_TRUE(finalized);
    EXPECT_EQ(BinaryState::HASHABLE, finalized->state);
}

TEST_F(UploadOrchestratorTest, ResumedUploadSkipsRecordedParts)
{
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto record = ResumabilityRecord::create(m_identity, binary.id, m_plan);
    for (uint32_t i = 0; i < 5; i++) {
        record.confirmed_parts[i] = m_plan.parts[i].hash;
    }
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, record));

    const auto reconciled = reconcile();
    ASSERT_TRUE(reconciled.is_resumed());
    auto resumed_binary = orchestrator->ensure_binary(m_identity, m_plan, reconciled);
    ASSERT_TRUE(resumed_binary);
    EXPECT_EQ(binary.id, resumed_binary->id);
    EXPECT_EQ(1u, m_api.create_binary_calls);

    auto confirmed = orchestrator->upload_parts(m_identity, resumed_binary.value(), *m_chunker, m_plan, reconciled);
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(range(0, PARTS_COUNT), confirmed.value());

    auto uploaded = m_api.uploaded_indices();
    std::sort(uploaded.begin(), uploaded.end());
    EXPECT_EQ(std::vector<uint32_t>({5, 6, 7, 8, 9}), uploaded);
    EXPECT_EQ(50u, m_progress.confirmed_bytes.load());
    EXPECT_EQ(5u, m_progress.parts_to_upload.load());
}

TEST_F(UploadOrchestratorTest, AdoptsPartsConfirmedRemotely)
{
    auto orchestrator = make_orchestrator();
    const auto created = create_binary(*orchestrator);

    for (uint32_t i = 0; i < 3; i++) {
        auto content = m_chunker->read_part(i);
        ASSERT_TRUE(content);
        ASSERT_TRUE(m_api.create_binary_part(created.id, content->info, MemoryView(content->data)));
    }

    const auto binary = m_api.binary(created.id);
    ASSERT_EQ(3u, binary.confirmed_parts.size());

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(range(0, PARTS_COUNT), confirmed.value());
    EXPECT_EQ(PARTS_COUNT, m_api.part_calls());
    EXPECT_EQ(7u, m_progress.parts_to_upload.load());
}

TEST_F(UploadOrchestratorTest, ConcurrencyIsBounded)
{
    m_params.concurrency = 3;
    m_api.part_delay = 20ms;
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(PARTS_COUNT, confirmed->size());
    EXPECT_LE(m_api.max_in_flight(), 3u);
    EXPECT_GE(m_api.max_in_flight(), 1u);
}

TEST_F(UploadOrchestratorTest, ZeroConcurrencyIsRejected)
{
    m_params.concurrency = 0;
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, confirmed.status());
    EXPECT_EQ(0u, m_api.part_calls());
}

TEST_F(UploadOrchestratorTest, TransientFailuresAreRetried)
{
    m_api.fail_part(4, {FLEET_TIMEOUT, FLEET_SERVER_UNAVAILABLE});
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    ASSERT_TRUE(confirmed);
    EXPECT_EQ(range(0, PARTS_COUNT), confirmed.value());
    EXPECT_EQ(PARTS_COUNT + 2, m_api.part_calls());
    EXPECT_EQ(2u, m_progress.retries.load());
}

TEST_F(UploadOrchestratorTest, ExhaustedRetriesKeepConfirmedParts)
{
    m_params.concurrency = 1;
    m_api.fail_part(4, {FLEET_TIMEOUT, FLEET_TIMEOUT, FLEET_COMMUNICATION_FAILURE});
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_UPLOAD_FAILED, confirmed.status());
    EXPECT_EQ(range(0, 4), recorded_parts());
    EXPECT_EQ(FLEET_UPLOAD_FAILED, m_progress.finished_status.load());

    // A later run resumes from the recorded parts
    auto resumed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    ASSERT_TRUE(resumed);
    EXPECT_EQ(range(0, PARTS_COUNT), resumed.value());
    EXPECT_EQ(range(0, PARTS_COUNT), recorded_parts());
}

TEST_F(UploadOrchestratorTest, RefusedPartIsConflictAndDiscardsRecord)
{
    m_params.concurrency = 1;
    m_api.fail_part(2, {FLEET_CONFLICT});
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_CONFLICT, confirmed.status());
    EXPECT_EQ(1u, m_api.part_attempts(2));
    EXPECT_EQ(3u, m_api.part_calls());
    EXPECT_EQ(0u, m_progress.retries.load());
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(UploadOrchestratorTest, ChecksumRefusalIsConflictAfterOneAttempt)
{
    m_params.concurrency = 1;
    m_api.fail_part(1, {FLEET_INVALID_REQUEST});
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_CONFLICT, confirmed.status());
    EXPECT_EQ(1u, m_api.part_attempts(1));
    EXPECT_EQ(0u, m_api.part_attempts(2));
    EXPECT_EQ(0u, m_progress.retries.load());
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(UploadOrchestratorTest, UnauthorizedIsNotRetried)
{
    m_params.concurrency = 1;
    m_api.fail_part(0, {FLEET_UNAUTHORIZED});
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_UNAUTHORIZED, confirmed.status());
    EXPECT_EQ(1u, m_api.part_calls());
}

TEST_F(UploadOrchestratorTest, ContentChangedAfterPlanningIsConflict)
{
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    write_file(m_content_path, make_content(100, 2));
    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, ReconciledPlan::fresh());
    EXPECT_EQ(FLEET_CONFLICT, confirmed.status());
    EXPECT_EQ(0u, m_api.part_calls());
}

TEST_F(UploadOrchestratorTest, MismatchingReceiptIsConflict)
{
    m_api.receipt_hash_override = std::string(64, '0');
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_CONFLICT, confirmed.status());
}

TEST_F(UploadOrchestratorTest, CancellationStopsNewRequestsAndCanBeResumed)
{
    m_params.concurrency = 1;
    m_api.cancel_after_parts(3, m_cancel_event);
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto confirmed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconcile());
    EXPECT_EQ(FLEET_OPERATION_ABORTED, confirmed.status());
    EXPECT_EQ(3u, m_api.part_calls());
    EXPECT_EQ(range(0, 3), recorded_parts());

    m_api.cancel_after_parts(UINT32_MAX, nullptr);
    ASSERT_EQ(FLEET_SUCCESS, m_cancel_event->reset());

    const auto reconciled = reconcile();
    ASSERT_TRUE(reconciled.is_resumed());
    auto resumed = orchestrator->upload_parts(m_identity, binary, *m_chunker, m_plan, reconciled);
    ASSERT_TRUE(resumed);
    EXPECT_EQ(range(0, PARTS_COUNT), resumed.value());
    EXPECT_EQ(PARTS_COUNT, m_api.part_calls());
}

TEST_F(UploadOrchestratorTest, FinalizeRequiresEveryPart)
{
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    EXPECT_EQ(FLEET_INVALID_OPERATION, orchestrator->finalize(binary, m_plan, range(0, PARTS_COUNT - 1)).status());
    EXPECT_EQ(FLEET_INVALID_OPERATION, orchestrator->finalize(binary, m_plan, range(1, PARTS_COUNT)).status());
    EXPECT_EQ(0u, m_api.finalize_calls);
}

TEST_F(UploadOrchestratorTest, FinalizeRetriesTransientFailures)
{
    m_api.finalize_failures = {FLEET_SERVER_UNAVAILABLE};
    auto orchestrator = make_orchestrator();
    const auto binary = create_binary(*orchestrator);

    auto finalized = orchestrator->finalize(binary, m_plan, range(0, PARTS_COUNT));
    ASSERT_TRUE(finalized);
    EXPECT_EQ(2u, m_api.finalize_calls);
}

TEST_F(UploadOrchestratorTest, ResumedBinaryMustMatchIdentityAndContent)
{
    Binary other_target{};
    other_target.id = "prn:binary:other";
    other_target.artifact_version_id = m_identity.artifact_version_id;
    other_target.target = "rpi5";
    other_target.size = m_plan.total_size;
    other_target.hash = m_plan.content_hash;
    other_target.state = BinaryState::UPLOADING;
    m_api.add_binary(other_target);

    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity,
        ResumabilityRecord::create(m_identity, other_target.id, m_plan)));
    auto orchestrator = make_orchestrator();
    EXPECT_EQ(FLEET_CONFLICT, orchestrator->ensure_binary(m_identity, m_plan, reconcile()).status());

    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity,
        ResumabilityRecord::create(m_identity, "prn:binary:gone", m_plan)));
    EXPECT_EQ(FLEET_CONFLICT, orchestrator->ensure_binary(m_identity, m_plan, reconcile()).status());
    EXPECT_EQ(0u, m_api.create_binary_calls);
}

TEST_F(UploadOrchestratorTest, DefaultConcurrencyIsBounded)
{
    const auto concurrency = UploadOrchestrator::default_concurrency();
    EXPECT_GE(concurrency, 1u);
    EXPECT_LE(concurrency, static_cast<uint32_t>(FLEET_MAX_DEFAULT_CONCURRENCY));
}
