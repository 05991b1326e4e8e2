/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_signatures_command.cpp
 * @brief Sign an already verified binary
 **/

#include "binary_signatures_command.hpp"
#include "common.hpp"

#include "fleet/content_chunker.hpp"
#include "fleet/signing_engine.hpp"

BinarySignaturesCreateCommand::BinarySignaturesCreateCommand(CLI::App &parent_app) :
    ApiCommand(parent_app.add_subcommand("create", "Sign a verified binary with a local key"))
{
    m_app->add_option("--binary-prn", m_binary_id, "Binary to sign")
        ->required();
    m_app->add_option("--binary-content-path", m_content_path,
        "Local copy of the binary content, its hash must match the verified remote hash")
        ->required()
        ->check(CLI::ExistingFile);
    add_signing_key_options(m_app, m_signing_key_params, true);
}

fleet_status BinarySignaturesCreateCommand::execute_with_api(const Config &config, AdminApi &api)
{
    TRY(const auto key_pair, get_signing_key_pair(config, m_signing_key_params));
    TRY(const auto binary, api.get_binary(m_binary_id), "Failed getting binary {}", m_binary_id);

    TRY(const auto chunker, ContentChunker::create(m_content_path, FLEET_DEFAULT_PART_SIZE));
    TRY(const auto plan, chunker.compute_plan(), "Failed hashing {}", m_content_path);
    CHECK(hashes_equal(plan.content_hash, binary.hash), FLEET_HASH_VERIFICATION_FAILED,
        "Content of {} (sha256 {}) does not match binary {} (sha256 {})", m_content_path, plan.content_hash,
        binary.id, binary.hash);

    SigningEngine signing_engine(api);
    TRY(const auto signature, signing_engine.sign_binary(binary, key_pair));

    CliCommon::print_json(ordered_json(signature));
    return FLEET_SUCCESS;
}

BinarySignaturesCommand::BinarySignaturesCommand(CLI::App &parent_app) :
    ContainerCommand(parent_app.add_subcommand("binary-signatures", "Manage binary signatures"))
{
    add_subcommand<BinarySignaturesCreateCommand>();
}
