/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_pipeline.cpp
 * @brief Plan, upload, finalize, verify and sign a binary, skipping stages completed by an earlier run
 **/

#include "fleet/binary_pipeline.hpp"
#include "fleet/signing_engine.hpp"

#include "common/utils.hpp"
#include "common/filesystem.hpp"

namespace fleet
{

static const std::string LOCK_FILE_SUFFIX = ".lock";

BinaryPipeline::BinaryPipeline(AdminApi &api, const ResumabilityLedger &ledger, ProgressReporter &progress,
        EventPtr cancel_event) :
    m_api(api),
    m_ledger(ledger),
    m_progress(progress),
    m_cancel_event(cancel_event)
{}

Expected<Binary> BinaryPipeline::prepare_binary(const PipelineParams &params, const BinaryIdentity &identity,
    const ContentChunker &chunker, const UploadPlan &plan, UploadOrchestrator &orchestrator,
    ReconciledPlan &reconciled)
{
    auto binary = orchestrator.ensure_binary(identity, plan, reconciled);
    if ((FLEET_CONFLICT == binary.status()) && reconciled.is_resumed() && params.discard_stale_ledger) {
        LOGGER__WARNING("Recorded binary {} of {} cannot be resumed, starting over with a new binary",
            reconciled.record.binary_id, identity.to_string());
        CHECK_SUCCESS_AS_EXPECTED(m_ledger.remove(identity));
        TRY(reconciled, m_ledger.reconcile(identity, chunker, plan));
        return orchestrator.ensure_binary(identity, plan, reconciled);
    }
    return binary;
}

Expected<Binary> BinaryPipeline::upload_and_finalize(const BinaryIdentity &identity, const Binary &binary,
    const ContentChunker &chunker, const UploadPlan &plan, UploadOrchestrator &orchestrator,
    const ReconciledPlan &reconciled, PipelineResult &result)
{
    std::set<uint32_t> skipped;
    if (reconciled.is_resumed()) {
        skipped = get_key_set(reconciled.record.confirmed_parts);
    }
    for (const auto &remote_part : binary.confirmed_parts) {
        if ((remote_part.index < plan.parts_count()) &&
            hashes_equal(remote_part.hash, plan.parts[remote_part.index].hash)) {
            skipped.insert(remote_part.index);
        }
    }
    result.skipped_parts = static_cast<uint32_t>(skipped.size());

    m_progress.on_stage(PipelineStage::UPLOADING);
    TRY(const auto confirmed, orchestrator.upload_parts(identity, binary, chunker, plan, reconciled));

    m_progress.on_stage(PipelineStage::FINALIZING);
    return orchestrator.finalize(binary, plan, confirmed);
}

Expected<PipelineResult> BinaryPipeline::run(const PipelineParams &params)
{
    CHECK_AS_EXPECTED(!params.artifact_version_id.empty(), FLEET_INVALID_ARGUMENT, "Artifact version is required");
    CHECK_AS_EXPECTED(!params.target.empty(), FLEET_INVALID_ARGUMENT, "Target is required");
    CHECK_AS_EXPECTED(!params.content_path.empty(), FLEET_INVALID_ARGUMENT, "Content path is required");

    const BinaryIdentity identity{params.artifact_version_id, params.target};
    PipelineResult result{};

    // Two processes uploading the same binary would race on its ledger record
    const auto lock_path = m_ledger.record_path(identity) + LOCK_FILE_SUFFIX;
    TRY(const auto lock, LockedFile::create(lock_path, "a"),
        "Another upload of {} is in progress", identity.to_string());

    m_progress.on_stage(PipelineStage::PLANNING);
    TRY(const auto chunker, ContentChunker::create(params.content_path, params.part_size));
    TRY(const auto plan, chunker.compute_plan());
    if ((nullptr != m_cancel_event) && m_cancel_event->is_signalled()) {
        return make_unexpected(FLEET_OPERATION_ABORTED);
    }
    TRY(auto reconciled, m_ledger.reconcile(identity, chunker, plan));

    UploadOrchestrator orchestrator(m_api, m_ledger, m_progress, m_cancel_event, params.upload_params);
    m_progress.on_stage(PipelineStage::CREATING);
    TRY(auto binary, prepare_binary(params, identity, chunker, plan, orchestrator, reconciled));

    if (BinaryStateUtils::accepts_parts(binary.state)) {
        TRY(binary, upload_and_finalize(identity, binary, chunker, plan, orchestrator, reconciled, result));
    } else {
        LOGGER__INFO("Binary {} is already {}, skipping the upload", binary.id,
            BinaryStateUtils::to_string(binary.state));
    }

    if (!BinaryStateUtils::is_verified(binary.state)) {
        m_progress.on_stage(PipelineStage::VERIFYING);
        HashVerificationPoller poller(m_api, params.poll_params, m_cancel_event);
        auto verified = poller.wait_for_verification(binary.id);
        if (FLEET_HASH_VERIFICATION_FAILED == verified.status()) {
            // Resuming cannot fix a failed verification
            auto status = m_ledger.remove(identity);
            if (FLEET_SUCCESS != status) {
                LOGGER__ERROR("Failed discarding ledger record of {}, status {}", identity.to_string(), status);
            }
            return make_unexpected(FLEET_HASH_VERIFICATION_FAILED);
        }
        CHECK_EXPECTED(verified);
        binary = verified.release();
    }

    if (!hashes_equal(binary.hash, plan.content_hash)) {
        LOGGER__ERROR("Binary {} was verified with hash {}, but the content hash is {}", binary.id, binary.hash,
            plan.content_hash);
        auto status = m_ledger.remove(identity);
        if (FLEET_SUCCESS != status) {
            LOGGER__ERROR("Failed discarding ledger record of {}, status {}", identity.to_string(), status);
        }
        return make_unexpected(FLEET_HASH_VERIFICATION_FAILED);
    }

    if (params.sign && (BinaryState::SIGNED != binary.state)) {
        m_progress.on_stage(PipelineStage::SIGNING);
        SigningEngine signing_engine(m_api);
        TRY(result.signature, signing_engine.sign_binary(binary, params.signing_key_pair));
        binary.state = BinaryState::SIGNED;
    }
    result.is_signed = (BinaryState::SIGNED == binary.state);

    CHECK_SUCCESS_AS_EXPECTED(m_ledger.remove(identity));
    // Unlinked while still held, the lock only guards an in-progress upload
    auto lock_status = Filesystem::remove_file(lock_path);
    if (FLEET_SUCCESS != lock_status) {
        LOGGER__WARNING("Failed removing upload lock {}, status {}", lock_path, lock_status);
    }
    m_progress.on_stage(PipelineStage::DONE);

    result.binary = std::move(binary);
    return result;
}

} /* namespace fleet */
