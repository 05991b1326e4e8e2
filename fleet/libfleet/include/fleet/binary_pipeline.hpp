/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_pipeline.hpp
 * @brief End to end ingestion of a binary: plan, reconcile, upload, finalize, verify and sign.
 **/

#ifndef _FLEET_BINARY_PIPELINE_HPP_
#define _FLEET_BINARY_PIPELINE_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/event.hpp"
#include "fleet/binary.hpp"
#include "fleet/admin_api.hpp"
#include "fleet/resumability_ledger.hpp"
#include "fleet/progress_reporter.hpp"
#include "fleet/upload_orchestrator.hpp"
#include "fleet/hash_verification_poller.hpp"

#include <string>

/** fleet namespace */
namespace fleet
{

struct PipelineParams {
    std::string artifact_version_id;
    std::string content_path;
    std::string target;

    bool sign = false;
    // Used only when sign is set
    SigningKeyPair signing_key_pair;

    uint64_t part_size = FLEET_DEFAULT_PART_SIZE;
    UploadParams upload_params;
    PollParams poll_params;

    // On a conflicting resumed binary, discard the ledger record and create a new binary once
    bool discard_stale_ledger = true;
};

struct PipelineResult {
    Binary binary;
    bool is_signed = false;
    // Valid only when is_signed is set and the signature was created by this run
    BinarySignature signature;
    // Number of part requests that were not needed thanks to resumed state
    uint32_t skipped_parts = 0;
};

class FLEETAPI BinaryPipeline final
{
public:
    BinaryPipeline(AdminApi &api, const ResumabilityLedger &ledger, ProgressReporter &progress,
        EventPtr cancel_event);

    /**
     * Runs the whole flow. Stages already completed remotely are skipped, so re-running after an interruption
     * resumes where the previous run stopped. The ledger record is removed after full success and after a failed
     * remote verification.
     */
    Expected<PipelineResult> run(const PipelineParams &params);

private:
    Expected<Binary> prepare_binary(const PipelineParams &params, const BinaryIdentity &identity,
        const ContentChunker &chunker, const UploadPlan &plan, UploadOrchestrator &orchestrator,
        ReconciledPlan &reconciled);
    Expected<Binary> upload_and_finalize(const BinaryIdentity &identity, const Binary &binary,
        const ContentChunker &chunker, const UploadPlan &plan, UploadOrchestrator &orchestrator,
        const ReconciledPlan &reconciled, PipelineResult &result);

    AdminApi &m_api;
    const ResumabilityLedger &m_ledger;
    ProgressReporter &m_progress;
    EventPtr m_cancel_event;
};

} /* namespace fleet */

#endif /* _FLEET_BINARY_PIPELINE_HPP_ */
