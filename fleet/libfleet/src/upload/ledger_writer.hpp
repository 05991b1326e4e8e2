/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file ledger_writer.hpp
 * @brief Single owner of a ledger record while its parts are uploaded concurrently
 *
 * Upload workers never touch the record file. They post confirmations to a queue, and one writer thread applies
 * each confirmation to its in-memory record and persists it before taking the next one.
 **/

#ifndef _FLEET_LEDGER_WRITER_HPP_
#define _FLEET_LEDGER_WRITER_HPP_

#include "fleet/resumability_ledger.hpp"

#include "common/status_thread.hpp"
#include "common/thread_safe_queue.hpp"

#include <memory>

namespace fleet
{

class LedgerWriter final
{
public:
    static Expected<std::unique_ptr<LedgerWriter>> create(const ResumabilityLedger &ledger,
        const BinaryIdentity &identity, const ResumabilityRecord &record);

    LedgerWriter(const ResumabilityLedger &ledger, const BinaryIdentity &identity, const ResumabilityRecord &record);
    ~LedgerWriter();

    LedgerWriter(const LedgerWriter &) = delete;
    LedgerWriter &operator=(const LedgerWriter &) = delete;
    LedgerWriter(LedgerWriter &&) = delete;
    LedgerWriter &operator=(LedgerWriter &&) = delete;

    // Must be called only after the remote service acknowledged the part
    fleet_status record_confirmed(ConfirmedPart &&part);

    // Persists everything queued so far and joins the writer thread. Returns the first persistence failure.
    fleet_status stop();

private:
    fleet_status start();
    fleet_status write_loop();

    const ResumabilityLedger &m_ledger;
    const BinaryIdentity m_identity;
    ResumabilityRecord m_record;
    SafeQueue<ConfirmedPart> m_queue;
    StatusThreadPtr m_thread;
};

} /* namespace fleet */

#endif /* _FLEET_LEDGER_WRITER_HPP_ */
