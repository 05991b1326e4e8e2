/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file ledger_writer.cpp
 **/

#include "upload/ledger_writer.hpp"

#include "common/utils.hpp"

namespace fleet
{

static const std::chrono::milliseconds LEDGER_WRITER_DEQUEUE_TIMEOUT(1000);

Expected<std::unique_ptr<LedgerWriter>> LedgerWriter::create(const ResumabilityLedger &ledger,
    const BinaryIdentity &identity, const ResumabilityRecord &record)
{
    auto writer = make_unique_nothrow<LedgerWriter>(ledger, identity, record);
    CHECK_NOT_NULL_AS_EXPECTED(writer, FLEET_OUT_OF_HOST_MEMORY);
    CHECK_SUCCESS_AS_EXPECTED(writer->start());
    return writer;
}

LedgerWriter::LedgerWriter(const ResumabilityLedger &ledger, const BinaryIdentity &identity,
        const ResumabilityRecord &record) :
    m_ledger(ledger),
    m_identity(identity),
    m_record(record),
    m_queue(),
    m_thread(nullptr)
{}

LedgerWriter::~LedgerWriter()
{
    auto status = stop();
    if (FLEET_SUCCESS != status) {
        LOGGER__ERROR("Ledger writer of {} stopped with status {}", m_identity.to_string(), status);
    }
}

fleet_status LedgerWriter::start()
{
    m_thread = make_unique_nothrow<StatusThread>("fleet-ledger", [this]() {
        return write_loop();
    });
    CHECK_NOT_NULL(m_thread, FLEET_OUT_OF_HOST_MEMORY);
    return FLEET_SUCCESS;
}

fleet_status LedgerWriter::record_confirmed(ConfirmedPart &&part)
{
    return m_queue.enqueue(std::move(part));
}

fleet_status LedgerWriter::stop()
{
    if (nullptr == m_thread) {
        return FLEET_SUCCESS;
    }
    m_queue.shutdown();
    auto status = m_thread->join();
    m_thread.reset();
    return status;
}

fleet_status LedgerWriter::write_loop()
{
    fleet_status first_error = FLEET_SUCCESS;
    while (true) {
        auto part = m_queue.dequeue(LEDGER_WRITER_DEQUEUE_TIMEOUT);
        if (FLEET_TIMEOUT == part.status()) {
            continue;
        }
        if (FLEET_SHUTDOWN_EVENT_SIGNALED == part.status()) {
            return first_error;
        }
        CHECK_EXPECTED_AS_STATUS(part);

        m_record.confirmed_parts[part->index] = part->hash;
        auto status = m_ledger.save(m_identity, m_record);
        if ((FLEET_SUCCESS != status) && (FLEET_SUCCESS == first_error)) {
            // Keep draining, a later save may still persist the parts confirmed so far
            first_error = status;
        }
    }
}

} /* namespace fleet */
