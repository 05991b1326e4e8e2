/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binaries_command.cpp
 * @brief Upload, verify and sign binaries
 **/

#include "binaries_command.hpp"
#include "upload_progress.hpp"
#include "common.hpp"

#include "fleet/resumability_ledger.hpp"
#include "fleet/upload_orchestrator.hpp"

#include <iostream>

#define PROGRESS_PRINT_INTERVAL (std::chrono::milliseconds(500))

BinariesCreateCommand::BinariesCreateCommand(CLI::App &parent_app) :
    ApiCommand(parent_app.add_subcommand("create", "Upload a binary, wait for its remote verification and sign it")),
    m_no_discard_stale(false),
    m_poll_interval_sec(FLEET_DEFAULT_POLL_INTERVAL_MS / 1000),
    m_poll_timeout_sec(FLEET_DEFAULT_POLL_TIMEOUT_MS / 1000)
{
    m_params.upload_params.concurrency = UploadOrchestrator::default_concurrency();

    m_app->add_option("--artifact-version-prn", m_params.artifact_version_id, "Artifact version the binary belongs to")
        ->required();
    m_app->add_option("--target", m_params.target, "Target the binary is built for")
        ->required();
    m_app->add_option("--content-path", m_params.content_path, "Path of the binary content")
        ->required()
        ->check(CLI::ExistingFile);
    add_signing_key_options(m_app, m_signing_key_params, false);

    auto group = m_app->add_option_group("Upload Options");
    group->add_option("--concurrency", m_params.upload_params.concurrency, "Number of parts uploaded concurrently")
        ->check(CLI::PositiveNumber)
        ->default_val(m_params.upload_params.concurrency);
    group->add_option("--part-size", m_params.part_size, "Size in bytes of every uploaded part")
        ->check(CLI::PositiveNumber)
        ->default_val(FLEET_DEFAULT_PART_SIZE);
    group->add_flag("--no-discard-stale", m_no_discard_stale,
        "Fail instead of starting over when the recorded binary conflicts with the content");
    group->add_option("--poll-interval", m_poll_interval_sec, "Seconds between verification queries")
        ->check(CLI::PositiveNumber)
        ->default_val(m_poll_interval_sec);
    group->add_option("--poll-timeout", m_poll_timeout_sec, "Seconds to wait for the remote verification")
        ->check(CLI::PositiveNumber)
        ->default_val(m_poll_timeout_sec);
}

fleet_status BinariesCreateCommand::execute_with_api(const Config &config, AdminApi &api)
{
    m_params.discard_stale_ledger = !m_no_discard_stale;
    m_params.poll_params.interval = std::chrono::seconds(m_poll_interval_sec);
    m_params.poll_params.timeout = std::chrono::seconds(m_poll_timeout_sec);

    m_params.sign = m_signing_key_params.is_set();
    if (m_params.sign) {
        TRY(m_params.signing_key_pair, get_signing_key_pair(config, m_signing_key_params));
    } else {
        LOGGER__INFO("No signing key given, the binary will be left unsigned");
    }

    TRY(const auto ledger, ResumabilityLedger::create(config.ledger_directory()));
    TRY(auto progress, UploadProgress::create(PROGRESS_PRINT_INTERVAL));

    BinaryPipeline pipeline(api, ledger, *progress, get_cancel_event());
    TRY(const auto result, pipeline.run(m_params));

    std::cerr << FORMAT_GREEN_PRINT << "Binary " << result.binary.id << " is " <<
        BinaryStateUtils::to_string(result.binary.state) << FORMAT_NORMAL_PRINT << std::endl;
    CliCommon::print_json(ordered_json(result));
    return FLEET_SUCCESS;
}

BinariesGetCommand::BinariesGetCommand(CLI::App &parent_app) :
    ApiCommand(parent_app.add_subcommand("get", "Print a binary"))
{
    m_app->add_option("--binary-prn", m_binary_id, "Binary to print")
        ->required();
}

fleet_status BinariesGetCommand::execute_with_api(const Config &/*config*/, AdminApi &api)
{
    TRY(const auto binary, api.get_binary(m_binary_id), "Failed getting binary {}", m_binary_id);
    CliCommon::print_json(ordered_json(binary));
    return FLEET_SUCCESS;
}

BinariesCommand::BinariesCommand(CLI::App &parent_app) :
    ContainerCommand(parent_app.add_subcommand("binaries", "Manage binaries"))
{
    add_subcommand<BinariesCreateCommand>();
    add_subcommand<BinariesGetCommand>();
}
