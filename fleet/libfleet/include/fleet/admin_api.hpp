/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file admin_api.hpp
 * @brief Remote Admin API consumed by the ingestion pipeline.
 **/

#ifndef _FLEET_ADMIN_API_HPP_
#define _FLEET_ADMIN_API_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/buffer.hpp"
#include "fleet/binary.hpp"
#include "fleet/content_chunker.hpp"

#include <chrono>
#include <memory>
#include <string>

/** fleet namespace */
namespace fleet
{

struct ApiConfig {
    std::string base_url;
    std::string api_key;
    // Optional CA bundle used to verify the server certificate
    std::string ca_path;
    std::chrono::milliseconds request_timeout = std::chrono::milliseconds(FLEET_DEFAULT_REQUEST_TIMEOUT_MS);
};

/**
 * Remote Admin API. Implementations must be safe to call concurrently from several threads.
 *
 * Transport failures are reported as FLEET_COMMUNICATION_FAILURE, FLEET_TIMEOUT (per attempt timeout) or
 * FLEET_SERVER_UNAVAILABLE (408, 429, 5xx). Remote refusals are reported as FLEET_NOT_FOUND, FLEET_CONFLICT,
 * FLEET_UNAUTHORIZED or FLEET_INVALID_REQUEST.
 */
class FLEETAPI AdminApi
{
public:
    virtual ~AdminApi() = default;

    virtual Expected<Binary> create_binary(const std::string &artifact_version_id, const std::string &target,
        uint64_t expected_size, const std::string &expected_hash) = 0;

    // The returned binary includes the parts the remote service already confirmed
    virtual Expected<Binary> get_binary(const std::string &binary_id) = 0;

    virtual Expected<PartReceipt> create_binary_part(const std::string &binary_id, const PartInfo &part,
        const MemoryView &body) = 0;

    // Marks content transfer as complete, the binary moves to hashable
    virtual Expected<Binary> finalize_binary(const std::string &binary_id) = 0;

    virtual Expected<BinarySignature> create_binary_signature(const std::string &binary_id,
        const std::string &signing_key_id, const std::string &signature) = 0;

    virtual Expected<Binary> mark_binary_signed(const std::string &binary_id) = 0;
};

/*! AdminApi over HTTPS (libcurl) */
class FLEETAPI HttpAdminApi final
{
public:
    HttpAdminApi() = delete;

    static Expected<std::unique_ptr<AdminApi>> create(const ApiConfig &config);
};

} /* namespace fleet */

#endif /* _FLEET_ADMIN_API_HPP_ */
