/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_pipeline_tests.cpp
 * @brief Whole ingestion flow against the in-memory admin api
 **/

#include "fleet/binary_pipeline.hpp"
#include "fake_admin_api.hpp"
#include "test_utils.hpp"
#include "test_keys.hpp"
#include "common/filesystem.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

using namespace fleet;
using namespace fleet::test;
using namespace std::chrono_literals;

namespace
{

class StageRecorder final : public ProgressReporter {
public:
    virtual void on_stage(PipelineStage stage) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stages.push_back(stage);
    }
    virtual void on_upload_started(uint64_t, uint64_t, uint32_t) override {}
    virtual void on_part_confirmed(const PartProgress &) override {}
    virtual void on_part_retry(uint32_t, uint32_t, fleet_status) override {}
    virtual void on_upload_finished(fleet_status) override {}

    std::vector<PipelineStage> stages() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stages;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stages.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<PipelineStage> m_stages;
};

} /* namespace */

class BinaryPipelineTest : public ::testing::Test {
protected:
    static constexpr uint32_t PARTS_COUNT = 8;

    void SetUp() override
    {
        m_params.artifact_version_id = "prn:artifact_version:42";
        m_params.target = "rpi4";
        m_params.content_path = m_dir.file("firmware.bin");
        write_file(m_params.content_path, make_content(64));
        m_params.part_size = 8;
        m_params.upload_params.concurrency = 1;
        m_params.upload_params.retry_policy = RetryPolicy(3, 1ms, 2ms);
        m_params.poll_params.interval = 1ms;
        m_params.poll_params.timeout = 5000ms;

        auto ledger = ResumabilityLedger::create(m_dir.file("uploads"));
        ASSERT_TRUE(ledger);
        m_ledger = std::make_unique<ResumabilityLedger>(ledger.release());

        auto cancel_event = Event::create_shared(Event::State::not_signalled);
        ASSERT_TRUE(cancel_event);
        m_cancel_event = cancel_event.release();

        m_identity = BinaryIdentity{m_params.artifact_version_id, m_params.target};
    }

    Expected<PipelineResult> run()
    {
        BinaryPipeline pipeline(m_api, *m_ledger, m_progress, m_cancel_event);
        return pipeline.run(m_params);
    }

    void enable_signing()
    {
        m_key = generate_key(EVP_PKEY_ED25519);
        ASSERT_NE(nullptr, m_key);
        const auto key_path = m_dir.file("release.pem");
        ASSERT_TRUE(write_private_key(m_key.get(), key_path));

        m_params.sign = true;
        m_params.signing_key_pair.name = "release";
        m_params.signing_key_pair.private_key_path = key_path;
        m_params.signing_key_pair.signing_key_id = "prn:signing_key:3";
    }

    // Cancels the run once @a parts_count parts were uploaded, and checks that the run stops
    void run_until_cancelled(uint32_t parts_count)
    {
        m_api.cancel_after_parts(parts_count, m_cancel_event);
        EXPECT_EQ(FLEET_OPERATION_ABORTED, run().status());
        m_api.cancel_after_parts(0, nullptr);
        ASSERT_EQ(FLEET_SUCCESS, m_cancel_event->reset());
        ASSERT_TRUE(m_ledger->load(m_identity));
    }

    UploadPlan plan()
    {
        auto chunker = ContentChunker::create(m_params.content_path, m_params.part_size);
        EXPECT_TRUE(chunker);
        auto plan = chunker->compute_plan();
        EXPECT_TRUE(plan);
        return plan.release();
    }

    TempDirectory m_dir;
    FakeAdminApi m_api;
    StageRecorder m_progress;
    std::unique_ptr<ResumabilityLedger> m_ledger;
    EventPtr m_cancel_event;
    PipelineParams m_params;
    BinaryIdentity m_identity;
    PkeyPtr m_key;
};

TEST_F(BinaryPipelineTest, UploadsVerifiesAndSigns)
{
    enable_signing();

    auto result = run();
    ASSERT_TRUE(result);
    EXPECT_EQ(BinaryState::SIGNED, result->binary.state);
    EXPECT_TRUE(result->is_signed);
    EXPECT_EQ(result->binary.id, result->signature.binary_id);
    EXPECT_EQ("prn:signing_key:3", result->signature.signing_key_id);
    EXPECT_EQ(0u, result->skipped_parts);

    EXPECT_EQ(PARTS_COUNT, m_api.part_calls());
    EXPECT_EQ(1u, m_api.finalize_calls);
    EXPECT_EQ(1u, m_api.mark_signed_calls);
    EXPECT_EQ(BinaryState::SIGNED, m_api.binary(result->binary.id).state);

    const std::vector<PipelineStage> expected_stages = {
        PipelineStage::PLANNING, PipelineStage::CREATING, PipelineStage::UPLOADING, PipelineStage::FINALIZING,
        PipelineStage::VERIFYING, PipelineStage::SIGNING, PipelineStage::DONE
    };
    EXPECT_EQ(expected_stages, m_progress.stages());

    // Nothing is left to resume
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(BinaryPipelineTest, UnsignedRunStopsAfterVerification)
{
    auto result = run();
    ASSERT_TRUE(result);
    EXPECT_EQ(BinaryState::HASHED, result->binary.state);
    EXPECT_FALSE(result->is_signed);
    EXPECT_EQ(0u, m_api.signature_calls);
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
    EXPECT_FALSE(Filesystem::does_file_exists(m_ledger->record_path(m_identity) + ".lock"));
}

TEST_F(BinaryPipelineTest, ResumesAfterCancellation)
{
    run_until_cancelled(3);
    const auto first_run_calls = m_api.part_calls();
    ASSERT_GE(first_run_calls, 3u);
    ASSERT_LT(first_run_calls, PARTS_COUNT);

    auto result = run();
    ASSERT_TRUE(result);
    EXPECT_EQ(BinaryState::HASHED, result->binary.state);
    EXPECT_EQ(1u, m_api.create_binary_calls);
    EXPECT_EQ(first_run_calls, result->skipped_parts);
    // Every part was sent exactly once over both runs
    EXPECT_EQ(PARTS_COUNT, m_api.part_calls());
}

TEST_F(BinaryPipelineTest, StaleRecordStartsOver)
{
    run_until_cancelled(2);
    const auto stale_binary_id = m_ledger->load(m_identity)->binary_id;
    m_api.remove_binary(stale_binary_id);

    auto result = run();
    ASSERT_TRUE(result);
    EXPECT_NE(stale_binary_id, result->binary.id);
    EXPECT_EQ(2u, m_api.create_binary_calls);
    EXPECT_EQ(0u, result->skipped_parts);
    EXPECT_EQ(BinaryState::HASHED, result->binary.state);
}

TEST_F(BinaryPipelineTest, StaleRecordIsKeptWhenDiscardIsDisabled)
{
    run_until_cancelled(2);
    const auto stale_binary_id = m_ledger->load(m_identity)->binary_id;
    m_api.remove_binary(stale_binary_id);

    m_params.discard_stale_ledger = false;
    EXPECT_EQ(FLEET_CONFLICT, run().status());
    EXPECT_EQ(1u, m_api.create_binary_calls);

    auto record = m_ledger->load(m_identity);
    ASSERT_TRUE(record);
    EXPECT_EQ(stale_binary_id, record->binary_id);
}

TEST_F(BinaryPipelineTest, VerifiedBinaryIsNotUploadedAgain)
{
    const auto content_plan = plan();
    Binary binary{};
    binary.id = "prn:binary:99";
    binary.artifact_version_id = m_params.artifact_version_id;
    binary.target = m_params.target;
    binary.size = content_plan.total_size;
    binary.hash = content_plan.content_hash;
    binary.state = BinaryState::HASHED;
    m_api.add_binary(binary);
    ASSERT_EQ(FLEET_SUCCESS, m_ledger->save(m_identity, ResumabilityRecord::create(m_identity, binary.id,
        content_plan)));
    enable_signing();

    auto result = run();
    ASSERT_TRUE(result);
    EXPECT_EQ("prn:binary:99", result->binary.id);
    EXPECT_TRUE(result->is_signed);
    EXPECT_EQ(0u, m_api.create_binary_calls);
    EXPECT_EQ(0u, m_api.part_calls());
    EXPECT_EQ(0u, m_api.finalize_calls);

    const std::vector<PipelineStage> expected_stages = {
        PipelineStage::PLANNING, PipelineStage::CREATING, PipelineStage::SIGNING, PipelineStage::DONE
    };
    EXPECT_EQ(expected_stages, m_progress.stages());
}

TEST_F(BinaryPipelineTest, FailedVerificationDiscardsRecord)
{
    enable_signing();
    m_api.fail_verification = true;

    EXPECT_EQ(FLEET_HASH_VERIFICATION_FAILED, run().status());
    EXPECT_EQ(0u, m_api.signature_calls);
    EXPECT_EQ(FLEET_NOT_FOUND, m_ledger->load(m_identity).status());
}

TEST_F(BinaryPipelineTest, VerificationTimeoutKeepsRecord)
{
    m_api.stall_verification = true;
    m_params.poll_params.timeout = 50ms;

    EXPECT_EQ(FLEET_TIMEOUT, run().status());
    EXPECT_TRUE(m_ledger->load(m_identity));
}

TEST_F(BinaryPipelineTest, SignatureRejected)
{
    enable_signing();
    m_api.signature_status = FLEET_CONFLICT;

    EXPECT_EQ(FLEET_SIGNATURE_REJECTED, run().status());
    EXPECT_EQ(0u, m_api.mark_signed_calls);
}

TEST_F(BinaryPipelineTest, CancelledBeforeUpload)
{
    ASSERT_EQ(FLEET_SUCCESS, m_cancel_event->signal());
    EXPECT_EQ(FLEET_OPERATION_ABORTED, run().status());
    EXPECT_EQ(0u, m_api.create_binary_calls);
}

TEST_F(BinaryPipelineTest, ConcurrentUploadOfSameBinaryIsRefused)
{
    auto other_run = LockedFile::create(m_ledger->record_path(m_identity) + ".lock", "a");
    ASSERT_TRUE(other_run);

    EXPECT_EQ(FLEET_INVALID_OPERATION, run().status());
    EXPECT_EQ(0u, m_api.create_binary_calls);
}

TEST_F(BinaryPipelineTest, InvalidParams)
{
    auto params = m_params;
    params.artifact_version_id.clear();
    BinaryPipeline pipeline(m_api, *m_ledger, m_progress, m_cancel_event);
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, pipeline.run(params).status());

    params = m_params;
    params.target.clear();
    EXPECT_EQ(FLEET_INVALID_ARGUMENT, pipeline.run(params).status());

    params = m_params;
    params.content_path = m_dir.file("missing.bin");
    EXPECT_EQ(FLEET_FILE_READ_FAILURE, pipeline.run(params).status());
    EXPECT_EQ(0u, m_api.create_binary_calls);
}
