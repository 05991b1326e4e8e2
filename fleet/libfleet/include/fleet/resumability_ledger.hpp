/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file resumability_ledger.hpp
 * @brief Local, crash safe record of the parts already confirmed for a binary.
 *
 * One JSON record is kept per binary identity under the ledger directory. Records are replaced atomically
 * (temporary file + rename) and carry a format version so incompatible layouts are discarded rather than misread.
 * The ledger performs no remote calls.
 **/

#ifndef _FLEET_RESUMABILITY_LEDGER_HPP_
#define _FLEET_RESUMABILITY_LEDGER_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/binary.hpp"
#include "fleet/content_chunker.hpp"

#include <map>
#include <string>
#include <vector>
#include <cstdint>

/** fleet namespace */
namespace fleet
{

struct ResumabilityRecord {
    uint32_t format_version = FLEET_LEDGER_FORMAT_VERSION;
    BinaryIdentity identity;
    // Remote binary the confirmed parts belong to
    std::string binary_id;
    // Whole content hash the record was built against
    std::string content_hash;
    uint64_t total_size = 0;
    uint64_t part_size = 0;
    // index -> part hash
    std::map<uint32_t, std::string> confirmed_parts;

    static ResumabilityRecord create(const BinaryIdentity &identity, const std::string &binary_id,
        const UploadPlan &plan);
};

enum class ReconciledPlanKind {
    FRESH,
    RESUMED,
};

/*! Result of reconciling the ledger with a freshly computed plan */
struct ReconciledPlan {
    ReconciledPlanKind kind = ReconciledPlanKind::FRESH;
    // Valid only when kind == RESUMED
    ResumabilityRecord record;

    static ReconciledPlan fresh();
    static ReconciledPlan resumed(ResumabilityRecord &&record);

    bool is_resumed() const { return ReconciledPlanKind::RESUMED == kind; }
};

class FLEETAPI ResumabilityLedger final
{
public:
    static const std::string RECORD_SUFFIX;

    // Creates the ledger directory if needed
    static Expected<ResumabilityLedger> create(const std::string &directory);

    /**
     * Loads the record of @a identity. Returns FLEET_NOT_FOUND when there is no usable record: missing, corrupt
     * or written with an incompatible format version. Unusable records are logged and treated as absent.
     */
    Expected<ResumabilityRecord> load(const BinaryIdentity &identity) const;

    // Atomically replaces the record of @a identity
    fleet_status save(const BinaryIdentity &identity, const ResumabilityRecord &record) const;

    // Removes the record of @a identity. A missing record is not an error.
    fleet_status remove(const BinaryIdentity &identity) const;

    /**
     * Decides between a fresh and a resumed upload. The stored record is used only if its content hash, sizes
     * and part hashes match @a plan; otherwise the stale record is discarded and a fresh plan is returned.
     * Confirmed parts that no longer exist in @a plan, or whose hash changed, are dropped.
     */
    Expected<ReconciledPlan> reconcile(const BinaryIdentity &identity, const ContentChunker &chunker,
        const UploadPlan &plan) const;

    // Every usable record in the ledger directory
    Expected<std::vector<ResumabilityRecord>> list() const;

    std::string record_path(const BinaryIdentity &identity) const;
    const std::string &directory() const { return m_directory; }

private:
    explicit ResumabilityLedger(const std::string &directory);

    Expected<ResumabilityRecord> load_from_path(const std::string &path) const;

    std::string m_directory;
};

} /* namespace fleet */

#endif /* _FLEET_RESUMABILITY_LEDGER_HPP_ */
