/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file resumability_ledger.cpp
 * @brief Local persisted record of confirmed parts, one JSON file per binary identity
 **/

#include "fleet/resumability_ledger.hpp"

#include "common/utils.hpp"
#include "common/file_utils.hpp"
#include "common/filesystem.hpp"

#include "crypto/sha256.hpp"

#include <nlohmann/json.hpp>

namespace fleet
{

using json = nlohmann::json;

const std::string ResumabilityLedger::RECORD_SUFFIX = ".json";

static json record_to_json(const ResumabilityRecord &record)
{
    json parts = json::array();
    for (const auto &confirmed_part : record.confirmed_parts) {
        parts.push_back({{"index", confirmed_part.first}, {"hash", confirmed_part.second}});
    }

    return {
        {"version", record.format_version},
        {"artifact_version_id", record.identity.artifact_version_id},
        {"target", record.identity.target},
        {"binary_id", record.binary_id},
        {"content_hash", record.content_hash},
        {"total_size", record.total_size},
        {"part_size", record.part_size},
        {"confirmed_parts", parts}
    };
}

static Expected<ResumabilityRecord> record_from_json(const json &record_json)
{
    ResumabilityRecord record{};
    try {
        record.format_version = record_json.at("version").get<uint32_t>();
        CHECK_AS_EXPECTED(FLEET_LEDGER_FORMAT_VERSION == record.format_version, FLEET_LEDGER_CORRUPTED,
            "Unsupported ledger record version {} (expected {})", record.format_version, FLEET_LEDGER_FORMAT_VERSION);

        record.identity.artifact_version_id = record_json.at("artifact_version_id").get<std::string>();
        record.identity.target = record_json.at("target").get<std::string>();
        record.binary_id = record_json.at("binary_id").get<std::string>();
        record.content_hash = record_json.at("content_hash").get<std::string>();
        record.total_size = record_json.at("total_size").get<uint64_t>();
        record.part_size = record_json.at("part_size").get<uint64_t>();
        for (const auto &part : record_json.at("confirmed_parts")) {
            record.confirmed_parts[part.at("index").get<uint32_t>()] = part.at("hash").get<std::string>();
        }
    } catch (const json::exception &e) {
        LOGGER__WARNING("Malformed ledger record: {}", e.what());
        return make_unexpected(FLEET_LEDGER_CORRUPTED);
    }
    return record;
}

ResumabilityRecord ResumabilityRecord::create(const BinaryIdentity &identity, const std::string &binary_id,
    const UploadPlan &plan)
{
    ResumabilityRecord record{};
    record.identity = identity;
    record.binary_id = binary_id;
    record.content_hash = plan.content_hash;
    record.total_size = plan.total_size;
    record.part_size = plan.part_size;
    return record;
}

ReconciledPlan ReconciledPlan::fresh()
{
    return ReconciledPlan{};
}

ReconciledPlan ReconciledPlan::resumed(ResumabilityRecord &&record)
{
    ReconciledPlan plan{};
    plan.kind = ReconciledPlanKind::RESUMED;
    plan.record = std::move(record);
    return plan;
}

ResumabilityLedger::ResumabilityLedger(const std::string &directory) :
    m_directory(directory)
{}

Expected<ResumabilityLedger> ResumabilityLedger::create(const std::string &directory)
{
    CHECK_AS_EXPECTED(!directory.empty(), FLEET_INVALID_ARGUMENT, "Ledger directory must not be empty");
    auto status = Filesystem::create_directories(directory);
    CHECK_SUCCESS_AS_EXPECTED(status, "Failed creating ledger directory {}", directory);
    return ResumabilityLedger(directory);
}

std::string ResumabilityLedger::record_path(const BinaryIdentity &identity) const
{
    const auto key = identity.to_key();
    auto digest = Sha256::digest(MemoryView::create_const(key.data(), key.size()));
    // SHA-256 over an in-memory buffer fails only if OpenSSL itself is broken
    const auto name = digest ? Sha256::to_hex(digest.value()) : key;
    return Filesystem::join(m_directory, name + RECORD_SUFFIX);
}

Expected<ResumabilityRecord> ResumabilityLedger::load_from_path(const std::string &path) const
{
    TRY_WITH_ACCEPTABLE_STATUS(FLEET_NOT_FOUND, const auto content, read_text_file(path));

    json record_json;
    try {
        record_json = json::parse(content);
    } catch (const json::exception &e) {
        LOGGER__WARNING("Ledger record {} is not valid JSON, ignoring it: {}", path, e.what());
        return make_unexpected(FLEET_LEDGER_CORRUPTED);
    }
    return record_from_json(record_json);
}

Expected<ResumabilityRecord> ResumabilityLedger::load(const BinaryIdentity &identity) const
{
    const auto path = record_path(identity);
    auto record = load_from_path(path);
    if (FLEET_LEDGER_CORRUPTED == record.status()) {
        LOGGER__WARNING("Discarding unusable ledger record {} of {}", path, identity.to_string());
        return make_unexpected(FLEET_NOT_FOUND);
    }
    CHECK_EXPECTED_WITH_ACCEPTABLE_STATUS(FLEET_NOT_FOUND, record);

    if (record->identity.to_key() != identity.to_key()) {
        LOGGER__WARNING("Ledger record {} belongs to {}, not to {}", path, record->identity.to_string(),
            identity.to_string());
        return make_unexpected(FLEET_NOT_FOUND);
    }
    return record;
}

fleet_status ResumabilityLedger::save(const BinaryIdentity &identity, const ResumabilityRecord &record) const
{
    CHECK(identity.to_key() == record.identity.to_key(), FLEET_INVALID_ARGUMENT,
        "Record of {} cannot be saved as {}", record.identity.to_string(), identity.to_string());

    const auto path = record_path(identity);
    auto status = Filesystem::write_file_atomically(path, record_to_json(record).dump(4));
    CHECK_SUCCESS(status, "Failed saving ledger record {}", path);

    LOGGER__TRACE("Saved ledger record of {} with {} confirmed parts", identity.to_string(),
        record.confirmed_parts.size());
    return FLEET_SUCCESS;
}

fleet_status ResumabilityLedger::remove(const BinaryIdentity &identity) const
{
    auto status = Filesystem::remove_file(record_path(identity));
    if (FLEET_NOT_FOUND == status) {
        return FLEET_SUCCESS;
    }
    CHECK_SUCCESS(status, "Failed removing ledger record of {}", identity.to_string());
    LOGGER__DEBUG("Removed ledger record of {}", identity.to_string());
    return FLEET_SUCCESS;
}

Expected<ReconciledPlan> ResumabilityLedger::reconcile(const BinaryIdentity &identity,
    const ContentChunker &chunker, const UploadPlan &plan) const
{
    auto record = load(identity);
    if (FLEET_NOT_FOUND == record.status()) {
        LOGGER__DEBUG("No ledger record for {}, starting fresh", identity.to_string());
        return ReconciledPlan::fresh();
    }
    CHECK_EXPECTED(record);

    const bool size_matches = (FLEET_SUCCESS == chunker.check_recorded_size(record->total_size));
    const bool is_stale = !size_matches || (record->part_size != plan.part_size) || record->binary_id.empty() ||
        !hashes_equal(record->content_hash, plan.content_hash);
    if (is_stale) {
        LOGGER__INFO("Local content of {} changed since the last upload attempt, discarding its ledger record",
            identity.to_string());
        CHECK_SUCCESS_AS_EXPECTED(remove(identity));
        return ReconciledPlan::fresh();
    }

    auto resumed = record.release();
    for (auto it = resumed.confirmed_parts.begin(); it != resumed.confirmed_parts.end();) {
        const bool is_known_part = (it->first < plan.parts_count()) && hashes_equal(it->second, plan.parts[it->first].hash);
        if (!is_known_part) {
            LOGGER__WARNING("Dropping confirmed part {} of {} from the ledger, it does not match the content",
                it->first, identity.to_string());
            it = resumed.confirmed_parts.erase(it);
        } else {
            it++;
        }
    }

    LOGGER__INFO("Resuming upload of {} (binary {}), {}/{} parts already confirmed", identity.to_string(),
        resumed.binary_id, resumed.confirmed_parts.size(), plan.parts_count());
    return ReconciledPlan::resumed(std::move(resumed));
}

Expected<std::vector<ResumabilityRecord>> ResumabilityLedger::list() const
{
    TRY(const auto files, Filesystem::get_files_in_dir_flat(m_directory));

    std::vector<ResumabilityRecord> records;
    for (const auto &file : files) {
        if (!Filesystem::has_suffix(file, RECORD_SUFFIX)) {
            continue;
        }
        auto record = load_from_path(file);
        if (!record) {
            LOGGER__WARNING("Skipping unusable ledger record {} (status {})", file, record.status());
            continue;
        }
        records.emplace_back(record.release());
    }
    return records;
}

} /* namespace fleet */
