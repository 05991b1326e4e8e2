/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.cpp
 * @brief Common functions.
 **/
#include "common.hpp"
#include "common/utils.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>

std::string CliCommon::duration_to_string(std::chrono::seconds secs)
{
    using namespace std::chrono;
    using namespace std::chrono_literals;

    bool neg = (secs < 0s);
    if (neg) {
        secs = -secs;
    }

    auto h = duration_cast<hours>(secs);
    secs -= h;
    auto m = duration_cast<minutes>(secs);
    secs -= m;

    std::stringstream result;
    if (neg) {
        result << '-';
    }

    if (h < 10h) {
        result << '0';
    }
    result << (h/1h) << ':';

    if (m < 10min) {
        result << '0';
    }
    result << m/1min << ':';

    if (secs < 10s) {
        result << '0';
    }
    result << secs/1s;

    return result.str();
}

std::string CliCommon::bytes_to_string(uint64_t bytes)
{
    static const char *UNITS[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while ((value >= 1024.0) && (unit < (ARRAY_ENTRIES(UNITS) - 1))) {
        value /= 1024.0;
        unit++;
    }

    std::stringstream result;
    if (0 == unit) {
        result << bytes << " " << UNITS[unit];
    } else {
        result << std::setprecision(2) << std::fixed << value << " " << UNITS[unit];
    }
    return result.str();
}

std::string CliCommon::status_to_message(fleet_status status)
{
    switch (status) {
    case FLEET_INVALID_CONFIG:
        return "invalid or incomplete configuration, check the profile, api key and base url";
    case FLEET_UNAUTHORIZED:
        return "the api key was refused";
    case FLEET_NOT_FOUND:
        return "the requested resource does not exist";
    case FLEET_CONFLICT:
        return "the remote binary conflicts with the local content";
    case FLEET_UPLOAD_FAILED:
        return "uploading failed after all retries, run the command again to resume";
    case FLEET_HASH_VERIFICATION_FAILED:
        return "the remote service could not verify the uploaded content";
    case FLEET_TIMEOUT:
        return "timed out, run the command again to resume";
    case FLEET_INVALID_KEY:
        return "the signing private key could not be read";
    case FLEET_SIGNATURE_REJECTED:
        return "the signature was rejected, check the signing key prn";
    case FLEET_OPERATION_ABORTED:
        return "interrupted, run the command again to resume";
    case FLEET_FILE_READ_FAILURE:
    case FLEET_SIZE_MISMATCH:
        return "the content file changed or could not be read";
    case FLEET_INVALID_OPERATION:
        return "the operation is not possible in the current state";
    default:
        return "unexpected failure, see the log for details";
    }
}

void CliCommon::print_json(const ordered_json &result)
{
    std::cout << result.dump(4) << std::endl;
}

namespace fleet
{

void to_json(ordered_json &j, const Binary &binary)
{
    j = ordered_json{
        {"prn", binary.id},
        {"artifact_version_prn", binary.artifact_version_id},
        {"target", binary.target},
        {"size", binary.size},
        {"hash", binary.hash},
        {"state", binary.state}
    };
}

void to_json(ordered_json &j, const BinarySignature &signature)
{
    j = ordered_json{
        {"prn", signature.id},
        {"binary_prn", signature.binary_id},
        {"signing_key_prn", signature.signing_key_id},
        {"signature", signature.signature}
    };
}

void to_json(ordered_json &j, const ResumabilityRecord &record)
{
    j = ordered_json{
        {"artifact_version_prn", record.identity.artifact_version_id},
        {"target", record.identity.target},
        {"binary_prn", record.binary_id},
        {"content_hash", record.content_hash},
        {"total_size", record.total_size},
        {"part_size", record.part_size},
        {"confirmed_parts", record.confirmed_parts.size()}
    };
}

void to_json(ordered_json &j, const PipelineResult &result)
{
    j = ordered_json{
        {"binary", result.binary},
        {"signed", result.is_signed},
        {"skipped_parts", result.skipped_parts}
    };
    if (!result.signature.signature.empty()) {
        j["binary_signature"] = result.signature;
    }
}

} /* namespace fleet */
