/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upload_orchestrator.cpp
 * @brief Remote binary lifecycle and concurrent part uploads
 **/

#include "fleet/upload_orchestrator.hpp"

#include "common/utils.hpp"
#include "common/os_utils.hpp"
#include "common/thread_pool.hpp"

#include "upload/ledger_writer.hpp"

#include <mutex>

namespace fleet
{

/* Shared state of one upload_parts() call, accessed by all upload workers */
class UploadOrchestrator::PartUploadContext final
{
public:
    PartUploadContext(const Binary &binary, const ContentChunker &chunker, const UploadPlan &plan,
            LedgerWriter &writer, EventPtr stop_event, EventPtr cancel_event, std::set<uint32_t> &&confirmed) :
        m_binary(binary),
        m_chunker(chunker),
        m_plan(plan),
        m_writer(writer),
        m_stop_event(stop_event),
        m_cancel_event(cancel_event),
        m_confirmed(std::move(confirmed)),
        m_first_error(FLEET_SUCCESS)
    {}

    const Binary &binary() const { return m_binary; }
    const ContentChunker &chunker() const { return m_chunker; }
    const UploadPlan &plan() const { return m_plan; }
    LedgerWriter &writer() { return m_writer; }

    // The events a backoff wait is interrupted by
    std::vector<EventPtr> stop_events() const { return { m_stop_event, m_cancel_event }; }

    bool should_stop()
    {
        return m_stop_event->is_signalled() || ((nullptr != m_cancel_event) && m_cancel_event->is_signalled());
    }

    bool is_cancelled()
    {
        return (nullptr != m_cancel_event) && m_cancel_event->is_signalled();
    }

    // Records the first fatal failure and stops the other workers from issuing new requests
    void fail(uint32_t index, fleet_status status)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (FLEET_SUCCESS != m_first_error) {
                return;
            }
            m_first_error = status;
        }
        LOGGER__ERROR("Upload of part {} of binary {} failed with status {}, stopping the upload", index,
            m_binary.id, status);
        auto signal_status = m_stop_event->signal();
        if (FLEET_SUCCESS != signal_status) {
            LOGGER__ERROR("Failed signaling upload stop event, status {}", signal_status);
        }
    }

    void add_confirmed(uint32_t index)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_confirmed.insert(index);
    }

    std::set<uint32_t> confirmed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_confirmed;
    }

    fleet_status first_error() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_first_error;
    }

private:
    const Binary &m_binary;
    const ContentChunker &m_chunker;
    const UploadPlan &m_plan;
    LedgerWriter &m_writer;
    EventPtr m_stop_event;
    EventPtr m_cancel_event;
    std::set<uint32_t> m_confirmed;
    fleet_status m_first_error;
    mutable std::mutex m_mutex;
};

static std::set<uint32_t> all_indices(const UploadPlan &plan)
{
    std::set<uint32_t> indices;
    for (uint32_t i = 0; i < plan.parts_count(); i++) {
        indices.insert(i);
    }
    return indices;
}

uint32_t UploadOrchestrator::default_concurrency()
{
    const auto parallelism = static_cast<uint32_t>(OsUtils::get_available_parallelism());
    return std::max<uint32_t>(1, std::min<uint32_t>(2 * parallelism, FLEET_MAX_DEFAULT_CONCURRENCY));
}

UploadOrchestrator::UploadOrchestrator(AdminApi &api, const ResumabilityLedger &ledger, ProgressReporter &progress,
        EventPtr cancel_event, const UploadParams &params) :
    m_api(api),
    m_ledger(ledger),
    m_progress(progress),
    m_cancel_event(cancel_event),
    m_params(params)
{}

Expected<Binary> UploadOrchestrator::ensure_binary(const BinaryIdentity &identity, const UploadPlan &plan,
    const ReconciledPlan &reconciled)
{
    if (reconciled.is_resumed()) {
        return validate_resumed_binary(identity, plan, reconciled);
    }

    TRY(auto binary, m_api.create_binary(identity.artifact_version_id, identity.target, plan.total_size,
        plan.content_hash), "Failed creating binary for {}", identity.to_string());
    LOGGER__INFO("Created binary {} for {} (state {})", binary.id, identity.to_string(),
        BinaryStateUtils::to_string(binary.state));

    auto status = m_ledger.save(identity, ResumabilityRecord::create(identity, binary.id, plan));
    CHECK_SUCCESS_AS_EXPECTED(status, "Failed recording binary {} in the ledger", binary.id);

    return binary;
}

Expected<Binary> UploadOrchestrator::validate_resumed_binary(const BinaryIdentity &identity, const UploadPlan &plan,
    const ReconciledPlan &reconciled)
{
    const auto &binary_id = reconciled.record.binary_id;
    auto binary = m_api.get_binary(binary_id);
    if (FLEET_NOT_FOUND == binary.status()) {
        LOGGER__WARNING("Recorded binary {} of {} no longer exists", binary_id, identity.to_string());
        return make_unexpected(FLEET_CONFLICT);
    }
    CHECK_EXPECTED(binary, "Failed fetching recorded binary {}", binary_id);

    if (binary->target != identity.target) {
        LOGGER__WARNING("Recorded binary {} has target {}, expected {}", binary_id, binary->target, identity.target);
        return make_unexpected(FLEET_CONFLICT);
    }
    if (!binary->artifact_version_id.empty() && (binary->artifact_version_id != identity.artifact_version_id)) {
        LOGGER__WARNING("Recorded binary {} belongs to artifact version {}, expected {}", binary_id,
            binary->artifact_version_id, identity.artifact_version_id);
        return make_unexpected(FLEET_CONFLICT);
    }
    if (binary->size != plan.total_size) {
        LOGGER__WARNING("Recorded binary {} expects {} bytes, content has {}", binary_id, binary->size,
            plan.total_size);
        return make_unexpected(FLEET_CONFLICT);
    }
    if (!hashes_equal(binary->hash, plan.content_hash)) {
        LOGGER__WARNING("Recorded binary {} expects hash {}, content hash is {}", binary_id, binary->hash,
            plan.content_hash);
        return make_unexpected(FLEET_CONFLICT);
    }

    LOGGER__INFO("Resuming binary {} (state {})", binary_id, BinaryStateUtils::to_string(binary->state));
    return binary;
}

Expected<std::set<uint32_t>> UploadOrchestrator::upload_parts(const BinaryIdentity &identity, const Binary &binary,
    const ContentChunker &chunker, const UploadPlan &plan, const ReconciledPlan &reconciled)
{
    CHECK_AS_EXPECTED(0 < m_params.concurrency, FLEET_INVALID_ARGUMENT, "Upload concurrency must be positive");

    auto record = reconciled.is_resumed() ? reconciled.record : ResumabilityRecord::create(identity, binary.id, plan);
    record.binary_id = binary.id;

    // Parts the remote service already holds with the expected hash are adopted into the ledger
    bool adopted_remote_parts = false;
    for (const auto &remote_part : binary.confirmed_parts) {
        if ((remote_part.index >= plan.parts_count()) || contains(record.confirmed_parts, remote_part.index)) {
            continue;
        }
        if (!hashes_equal(remote_part.hash, plan.parts[remote_part.index].hash)) {
            LOGGER__WARNING("Remote part {} of binary {} has hash {}, expected {}; uploading it again",
                remote_part.index, binary.id, remote_part.hash, plan.parts[remote_part.index].hash);
            continue;
        }
        record.confirmed_parts[remote_part.index] = plan.parts[remote_part.index].hash;
        adopted_remote_parts = true;
    }
    if (adopted_remote_parts) {
        CHECK_SUCCESS_AS_EXPECTED(m_ledger.save(identity, record));
    }

    auto confirmed = get_key_set(record.confirmed_parts);
    uint64_t confirmed_bytes = 0;
    std::vector<uint32_t> to_upload;
    for (const auto &part : plan.parts) {
        if (contains(confirmed, part.index)) {
            confirmed_bytes += part.length;
        } else {
            to_upload.push_back(part.index);
        }
    }

    LOGGER__INFO("Uploading {} of {} parts of binary {} ({} parts already confirmed)", to_upload.size(),
        plan.parts_count(), binary.id, confirmed.size());
    m_progress.on_upload_started(plan.total_size, confirmed_bytes, static_cast<uint32_t>(to_upload.size()));
    if (to_upload.empty()) {
        m_progress.on_upload_finished(FLEET_SUCCESS);
        return confirmed;
    }

    TRY(auto stop_event, Event::create_shared(Event::State::not_signalled));
    TRY(auto writer, LedgerWriter::create(m_ledger, identity, record));
    PartUploadContext context(binary, chunker, plan, *writer, stop_event, m_cancel_event, std::move(confirmed));

    {
        WorkerPool pool(std::min<size_t>(m_params.concurrency, to_upload.size()), "fleet-upload");
        for (const auto index : to_upload) {
            auto add_status = pool.add_job([this, &context, index]() {
                auto status = upload_single_part(context, index);
                if (FLEET_SUCCESS != status) {
                    context.fail(index, status);
                }
                return status;
            });
            CHECK_SUCCESS_AS_EXPECTED(add_status);
        }
        pool.join();
    }

    auto status = context.first_error();
    const auto writer_status = writer->stop();
    auto uploaded = context.confirmed();
    if ((FLEET_SUCCESS == status) && (uploaded.size() != plan.parts_count())) {
        status = context.is_cancelled() ? FLEET_OPERATION_ABORTED : FLEET_INTERNAL_FAILURE;
    }
    if (FLEET_SUCCESS == status) {
        status = writer_status;
    }

    if (FLEET_CONFLICT == status) {
        LOGGER__WARNING("Content of {} conflicts with binary {}, discarding its ledger record", identity.to_string(),
            binary.id);
        auto remove_status = m_ledger.remove(identity);
        if (FLEET_SUCCESS != remove_status) {
            LOGGER__ERROR("Failed discarding ledger record of {}, status {}", identity.to_string(), remove_status);
        }
    }

    m_progress.on_upload_finished(status);
    if (FLEET_OPERATION_ABORTED == status) {
        LOGGER__WARNING("Upload of binary {} was cancelled with {}/{} parts confirmed", binary.id, uploaded.size(),
            plan.parts_count());
        return make_unexpected(status);
    }
    CHECK_SUCCESS_AS_EXPECTED(status, "Upload of binary {} failed", binary.id);

    return uploaded;
}

fleet_status UploadOrchestrator::upload_single_part(PartUploadContext &context, uint32_t index)
{
    if (context.should_stop()) {
        return FLEET_SUCCESS;
    }

    const auto start_time = std::chrono::steady_clock::now();
    const auto &expected_part = context.plan().parts[index];
    TRY(auto content, context.chunker().read_part(index));
    CHECK(hashes_equal(content.info.hash, expected_part.hash), FLEET_CONFLICT,
        "Part {} changed since it was planned (hash {}, planned {})", index, content.info.hash, expected_part.hash);

    for (uint32_t attempt = 1; ; attempt++) {
        auto receipt = m_api.create_binary_part(context.binary().id, content.info, MemoryView(content.data));
        if (receipt) {
            CHECK(receipt->hash.empty() || hashes_equal(receipt->hash, content.info.hash), FLEET_CONFLICT,
                "Remote acknowledged part {} with hash {}, expected {}", index, receipt->hash, content.info.hash);

            auto status = context.writer().record_confirmed(ConfirmedPart{index, content.info.hash});
            CHECK_SUCCESS(status, "Failed recording confirmed part {}", index);
            context.add_confirmed(index);

            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            LOGGER__DEBUG("Part {} ({} bytes) confirmed after {} attempts in {} ms", index, content.info.length,
                attempt, elapsed.count());
            m_progress.on_part_confirmed(PartProgress{index, content.info.length, elapsed});
            return FLEET_SUCCESS;
        }

        const auto decision = m_params.retry_policy.decide(attempt, receipt.status());
        if (!decision.should_retry) {
            if (RetryPolicy::is_transient(receipt.status())) {
                LOGGER__ERROR("Part {} failed {} times, last status {}", index, attempt, receipt.status());
                return FLEET_UPLOAD_FAILED;
            }
            if (FLEET_UNAUTHORIZED == receipt.status()) {
                LOGGER__ERROR("Part {} was refused, credentials were rejected", index);
                return FLEET_UNAUTHORIZED;
            }
            // Any other refusal means the remote disagrees with the part (e.g. a checksum mismatch)
            LOGGER__ERROR("Part {} was refused with status {}", index, receipt.status());
            return FLEET_CONFLICT;
        }

        LOGGER__WARNING("Attempt {} of part {} failed with status {}, retrying in {} ms", attempt, index,
            receipt.status(), decision.delay.count());
        m_progress.on_part_retry(index, attempt, receipt.status());

        auto interrupted = Event::wait_any(context.stop_events(), decision.delay);
        if (interrupted) {
            // Stopped during backoff, the part stays unconfirmed
            return FLEET_SUCCESS;
        }
        CHECK(FLEET_TIMEOUT == interrupted.status(), interrupted.status(), "Failed waiting for retry backoff");
    }
}

Expected<Binary> UploadOrchestrator::finalize(const Binary &binary, const UploadPlan &plan,
    const std::set<uint32_t> &confirmed)
{
    CHECK_AS_EXPECTED(confirmed == all_indices(plan), FLEET_INVALID_OPERATION,
        "Binary {} cannot be finalized with {}/{} parts confirmed", binary.id, confirmed.size(), plan.parts_count());

    for (uint32_t attempt = 1; ; attempt++) {
        auto finalized = m_api.finalize_binary(binary.id);
        if (finalized) {
            LOGGER__INFO("Finalized binary {} (state {})", binary.id, BinaryStateUtils::to_string(finalized->state));
            return finalized;
        }

        const auto decision = m_params.retry_policy.decide(attempt, finalized.status());
        CHECK_AS_EXPECTED(decision.should_retry, finalized.status(), "Failed finalizing binary {}", binary.id);

        LOGGER__WARNING("Finalizing binary {} failed with status {}, retrying in {} ms", binary.id,
            finalized.status(), decision.delay.count());
        auto interrupted = Event::wait_any({ m_cancel_event }, decision.delay);
        if (interrupted) {
            return make_unexpected(FLEET_OPERATION_ABORTED);
        }
        CHECK_AS_EXPECTED(FLEET_TIMEOUT == interrupted.status(), interrupted.status());
    }
}

} /* namespace fleet */
