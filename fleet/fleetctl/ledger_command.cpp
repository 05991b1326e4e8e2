/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file ledger_command.cpp
 * @brief Inspect and clear the local resumability records
 **/

#include "ledger_command.hpp"
#include "common.hpp"

#include "fleet/resumability_ledger.hpp"

#include <iostream>

LedgerListCommand::LedgerListCommand(CLI::App &parent_app) :
    ConfigCommand(parent_app.add_subcommand("list", "Print the interrupted uploads that can be resumed"))
{
}

fleet_status LedgerListCommand::execute_with_config(const Config &config)
{
    TRY(const auto ledger, ResumabilityLedger::create(config.ledger_directory()));
    TRY(const auto records, ledger.list());

    auto result = ordered_json::array();
    for (const auto &record : records) {
        result.push_back(ordered_json(record));
    }
    CliCommon::print_json(result);
    return FLEET_SUCCESS;
}

LedgerClearCommand::LedgerClearCommand(CLI::App &parent_app) :
    ConfigCommand(parent_app.add_subcommand("clear",
        "Remove the resumability record of one binary, or every record when no binary is given"))
{
    auto artifact_version_option = m_app->add_option("--artifact-version-prn", m_identity.artifact_version_id,
        "Artifact version of the binary");
    auto target_option = m_app->add_option("--target", m_identity.target, "Target of the binary");
    artifact_version_option->needs(target_option);
    target_option->needs(artifact_version_option);
}

fleet_status LedgerClearCommand::execute_with_config(const Config &config)
{
    TRY(const auto ledger, ResumabilityLedger::create(config.ledger_directory()));

    if (!m_identity.artifact_version_id.empty()) {
        auto status = ledger.remove(m_identity);
        CHECK_SUCCESS(status, "Failed removing the record of {}", m_identity.to_string());
        std::cerr << "Removed the record of " << m_identity.to_string() << std::endl;
        return FLEET_SUCCESS;
    }

    TRY(const auto records, ledger.list());
    for (const auto &record : records) {
        auto status = ledger.remove(record.identity);
        CHECK_SUCCESS(status, "Failed removing the record of {}", record.identity.to_string());
    }
    std::cerr << "Removed " << records.size() << " records" << std::endl;
    return FLEET_SUCCESS;
}

LedgerCommand::LedgerCommand(CLI::App &parent_app) :
    ContainerCommand(parent_app.add_subcommand("ledger", "Manage the local resumability records"))
{
    add_subcommand<LedgerListCommand>();
    add_subcommand<LedgerClearCommand>();
}
