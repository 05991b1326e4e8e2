/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file http_admin_api.cpp
 * @brief AdminApi over the REST interface of the fleet management service
 *
 * Remote part indices are 1 based, local indices are 0 based. The translation happens only in this file.
 **/

#include "fleet/admin_api.hpp"

#include "common/utils.hpp"

#include "api/http_client.hpp"
#include "crypto/sha256.hpp"

#include <nlohmann/json.hpp>

namespace fleet
{

using json = nlohmann::json;

static const std::string JSON_CONTENT_TYPE_HEADER = "Content-Type: application/json";
static const std::string CONFIRMED_PART_STATE = "valid";

class HttpAdminApiImpl final : public AdminApi
{
public:
    explicit HttpAdminApiImpl(std::shared_ptr<HttpClient> client) :
        m_client(client)
    {}

    virtual Expected<Binary> create_binary(const std::string &artifact_version_id, const std::string &target,
        uint64_t expected_size, const std::string &expected_hash) override;
    virtual Expected<Binary> get_binary(const std::string &binary_id) override;
    virtual Expected<PartReceipt> create_binary_part(const std::string &binary_id, const PartInfo &part,
        const MemoryView &body) override;
    virtual Expected<Binary> finalize_binary(const std::string &binary_id) override;
    virtual Expected<BinarySignature> create_binary_signature(const std::string &binary_id,
        const std::string &signing_key_id, const std::string &signature) override;
    virtual Expected<Binary> mark_binary_signed(const std::string &binary_id) override;

private:
    Expected<json> request_json(const std::string &method, const std::string &path, const json *body);
    Expected<Binary> update_binary_state(const std::string &binary_id, BinaryState state);
    Expected<std::vector<ConfirmedPart>> list_confirmed_parts(const std::string &binary_id);

    std::shared_ptr<HttpClient> m_client;
};

// Optional fields may be missing or null
static std::string get_string(const json &object, const std::string &key, const std::string &default_value = "")
{
    const auto it = object.find(key);
    if ((object.end() == it) || !it->is_string()) {
        return default_value;
    }
    return it->get<std::string>();
}

static Expected<Binary> binary_from_json(const json &response)
{
    try {
        const auto &binary_json = response.at("binary");
        Binary binary{};
        binary.id = binary_json.at("prn").get<std::string>();
        binary.artifact_version_id = get_string(binary_json, "artifact_version_prn");
        binary.target = get_string(binary_json, "target");
        const auto size = binary_json.find("size");
        binary.size = ((binary_json.end() != size) && size->is_number_unsigned()) ? size->get<uint64_t>() : 0;
        binary.hash = get_string(binary_json, "hash");
        binary.state = BinaryStateUtils::from_string(get_string(binary_json, "state"));
        return binary;
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed binary in response: {}", e.what());
        return make_unexpected(FLEET_INVALID_RESPONSE);
    }
}

Expected<json> HttpAdminApiImpl::request_json(const std::string &method, const std::string &path, const json *body)
{
    HttpRequest request{};
    request.method = method;
    request.url = m_client->url(path);
    request.headers.push_back("Accept: application/json");

    std::string serialized_body;
    if (nullptr != body) {
        serialized_body = body->dump();
        request.headers.push_back(JSON_CONTENT_TYPE_HEADER);
        request.body = MemoryView(serialized_body);
    }

    TRY(const auto response, m_client->perform(request));
    if (response.body.empty()) {
        return json::object();
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception &e) {
        LOGGER__ERROR("{} {} returned an unparsable body: {}", method, path, e.what());
        return make_unexpected(FLEET_INVALID_RESPONSE);
    }
}

Expected<Binary> HttpAdminApiImpl::create_binary(const std::string &artifact_version_id, const std::string &target,
    uint64_t expected_size, const std::string &expected_hash)
{
    const json body = {
        {"binary", {
            {"artifact_version_prn", artifact_version_id},
            {"target", target},
            {"size", expected_size},
            {"hash", expected_hash}
        }}
    };
    TRY(const auto response, request_json("POST", "/binaries", &body));
    return binary_from_json(response);
}

Expected<std::vector<ConfirmedPart>> HttpAdminApiImpl::list_confirmed_parts(const std::string &binary_id)
{
    std::vector<ConfirmedPart> parts;
    std::string page;
    do {
        auto path = "/binaries/" + binary_id + "/binary_parts";
        if (!page.empty()) {
            path += "?page=" + page;
        }
        TRY(const auto response, request_json("GET", path, nullptr));

        try {
            for (const auto &part_json : response.at("binary_parts")) {
                if (CONFIRMED_PART_STATE != get_string(part_json, "state", CONFIRMED_PART_STATE)) {
                    continue;
                }
                const auto remote_index = part_json.at("index").get<uint32_t>();
                CHECK_AS_EXPECTED(0 < remote_index, FLEET_INVALID_RESPONSE, "Remote part index must start at 1");
                parts.push_back(ConfirmedPart{remote_index - 1, part_json.at("hash").get<std::string>()});
            }
            const auto next_page = response.find("next_page");
            page = ((response.end() != next_page) && next_page->is_string()) ? next_page->get<std::string>() : "";
        } catch (const json::exception &e) {
            LOGGER__ERROR("Malformed binary parts of {}: {}", binary_id, e.what());
            return make_unexpected(FLEET_INVALID_RESPONSE);
        }
    } while (!page.empty());

    return parts;
}

Expected<Binary> HttpAdminApiImpl::get_binary(const std::string &binary_id)
{
    TRY(const auto response, request_json("GET", "/binaries/" + binary_id, nullptr));
    TRY(auto binary, binary_from_json(response));

    // Parts are listed only while they may still be uploaded
    if (BinaryStateUtils::accepts_parts(binary.state)) {
        TRY(binary.confirmed_parts, list_confirmed_parts(binary_id));
    }
    return binary;
}

Expected<PartReceipt> HttpAdminApiImpl::create_binary_part(const std::string &binary_id, const PartInfo &part,
    const MemoryView &body)
{
    CHECK_AS_EXPECTED(part.length == body.size(), FLEET_INVALID_ARGUMENT, "Part {} has {} bytes, expected {}",
        part.index, body.size(), part.length);

    const json request_body = {
        {"binary_part", {
            {"index", part.index + 1},
            {"hash", part.hash},
            {"size", part.length}
        }}
    };
    TRY(const auto response, request_json("POST", "/binaries/" + binary_id + "/binary_parts", &request_body));

    std::string upload_url;
    PartReceipt receipt{};
    receipt.index = part.index;
    try {
        const auto &part_json = response.at("binary_part");
        upload_url = part_json.at("presigned_upload_url").get<std::string>();
        receipt.hash = get_string(part_json, "hash", part.hash);
        receipt.status = get_string(part_json, "state");
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed binary part {} of {}: {}", part.index, binary_id, e.what());
        return make_unexpected(FLEET_INVALID_RESPONSE);
    }

    TRY(const auto digest, Sha256::from_hex(part.hash));
    TRY(const auto checksum, Sha256::to_base64(digest));

    HttpRequest upload{};
    upload.method = "PUT";
    upload.url = upload_url;
    upload.with_api_key = false;
    upload.headers = {
        "x-amz-checksum-sha256: " + checksum,
        "Content-Type: application/octet-stream"
    };
    upload.body = body;
    auto upload_response = m_client->perform(upload);
    CHECK_EXPECTED(upload_response, "Failed uploading part {} of {}", part.index, binary_id);

    receipt.status = CONFIRMED_PART_STATE;
    return receipt;
}

Expected<Binary> HttpAdminApiImpl::update_binary_state(const std::string &binary_id, BinaryState state)
{
    const json body = {
        {"binary", {
            {"state", BinaryStateUtils::to_string(state)}
        }}
    };
    TRY(const auto response, request_json("PATCH", "/binaries/" + binary_id, &body));
    return binary_from_json(response);
}

Expected<Binary> HttpAdminApiImpl::finalize_binary(const std::string &binary_id)
{
    return update_binary_state(binary_id, BinaryState::HASHABLE);
}

Expected<Binary> HttpAdminApiImpl::mark_binary_signed(const std::string &binary_id)
{
    return update_binary_state(binary_id, BinaryState::SIGNED);
}

Expected<BinarySignature> HttpAdminApiImpl::create_binary_signature(const std::string &binary_id,
    const std::string &signing_key_id, const std::string &signature)
{
    const json body = {
        {"binary_signature", {
            {"binary_prn", binary_id},
            {"signing_key_prn", signing_key_id},
            {"signature", signature}
        }}
    };
    TRY(const auto response, request_json("POST", "/binary_signatures", &body));

    try {
        const auto &signature_json = response.at("binary_signature");
        BinarySignature result{};
        result.id = get_string(signature_json, "prn");
        result.binary_id = get_string(signature_json, "binary_prn", binary_id);
        result.signing_key_id = get_string(signature_json, "signing_key_prn", signing_key_id);
        result.signature = get_string(signature_json, "signature", signature);
        return result;
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed binary signature of {}: {}", binary_id, e.what());
        return make_unexpected(FLEET_INVALID_RESPONSE);
    }
}

Expected<std::unique_ptr<AdminApi>> HttpAdminApi::create(const ApiConfig &config)
{
    CHECK_AS_EXPECTED(!config.api_key.empty(), FLEET_INVALID_CONFIG, "Api key must not be empty");
    TRY(auto client, HttpClient::create(config));

    std::unique_ptr<AdminApi> api = make_unique_nothrow<HttpAdminApiImpl>(client);
    CHECK_NOT_NULL_AS_EXPECTED(api, FLEET_OUT_OF_HOST_MEMORY);
    return api;
}

} /* namespace fleet */
