/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upload_orchestrator.hpp
 * @brief Drives the remote binary lifecycle and the concurrent upload of its parts.
 **/

#ifndef _FLEET_UPLOAD_ORCHESTRATOR_HPP_
#define _FLEET_UPLOAD_ORCHESTRATOR_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/event.hpp"
#include "fleet/binary.hpp"
#include "fleet/admin_api.hpp"
#include "fleet/content_chunker.hpp"
#include "fleet/resumability_ledger.hpp"
#include "fleet/progress_reporter.hpp"
#include "fleet/retry_policy.hpp"

#include <set>
#include <string>

/** fleet namespace */
namespace fleet
{

struct UploadParams {
    // Number of parts uploaded concurrently
    uint32_t concurrency = 4;
    RetryPolicy retry_policy;
};

class FLEETAPI UploadOrchestrator final
{
public:
    // Default concurrency: twice the hardware threads, capped at FLEET_MAX_DEFAULT_CONCURRENCY
    static uint32_t default_concurrency();

    /**
     * @param[in] cancel_event  Once signaled no new part requests are issued. In-flight requests settle and are
     *                          recorded, after which the operations return FLEET_OPERATION_ABORTED.
     */
    UploadOrchestrator(AdminApi &api, const ResumabilityLedger &ledger, ProgressReporter &progress,
        EventPtr cancel_event, const UploadParams &params);

    /**
     * Creates the remote binary, or when @a reconciled is resumed fetches the recorded one and checks it matches
     * @a identity and @a plan. A mismatch, or a recorded binary that no longer exists, returns FLEET_CONFLICT with no
     * side effects. A freshly created binary is recorded in the ledger immediately.
     */
    Expected<Binary> ensure_binary(const BinaryIdentity &identity, const UploadPlan &plan,
        const ReconciledPlan &reconciled);

    /**
     * Uploads every part of @a plan that is neither confirmed in @a reconciled nor already confirmed remotely
     * (with a matching hash). Each confirmed part is persisted to the ledger by a single writer thread as soon as
     * the remote service acknowledges it.
     *
     * Returns the full set of confirmed indices, or:
     *  - FLEET_UPLOAD_FAILED once retries of a transient failure are exhausted
     *  - FLEET_CONFLICT on a non retryable refusal or when the content changed; the ledger record is discarded
     *  - FLEET_OPERATION_ABORTED when cancelled
     */
    Expected<std::set<uint32_t>> upload_parts(const BinaryIdentity &identity, const Binary &binary,
        const ContentChunker &chunker, const UploadPlan &plan, const ReconciledPlan &reconciled);

    // Legal only when @a confirmed is exactly {0..N-1}, otherwise FLEET_INVALID_OPERATION
    Expected<Binary> finalize(const Binary &binary, const UploadPlan &plan, const std::set<uint32_t> &confirmed);

private:
    class PartUploadContext;

    fleet_status upload_single_part(PartUploadContext &context, uint32_t index);
    Expected<Binary> validate_resumed_binary(const BinaryIdentity &identity, const UploadPlan &plan,
        const ReconciledPlan &reconciled);

    AdminApi &m_api;
    const ResumabilityLedger &m_ledger;
    ProgressReporter &m_progress;
    EventPtr m_cancel_event;
    UploadParams m_params;
};

} /* namespace fleet */

#endif /* _FLEET_UPLOAD_ORCHESTRATOR_HPP_ */
