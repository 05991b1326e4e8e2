/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleetctl.cpp
 * @brief fleetctl CLI.
 *
 * Fleet management command line interface.
 **/
#include "fleetctl.hpp"
#include "command.hpp"
#include "common.hpp"
#include "binaries_command.hpp"
#include "binary_signatures_command.hpp"
#include "ledger_command.hpp"

#include "fleet/fleet.h"
#include "fleet/event.hpp"

#include "CLI/CLI.hpp"

#include <signal.h>

#include <cerrno>
#include <iostream>
#include <memory>


static EventPtr g_cancel_event;

EventPtr get_cancel_event()
{
    return g_cancel_event;
}

static void sigint_handler(int /*signum*/)
{
    // SA_RESETHAND restores the default action, so a second interrupt terminates the process
    if (nullptr != g_cancel_event) {
        (void)g_cancel_event->signal();
    }
}

static fleet_status install_sigint_handler()
{
    struct sigaction action = {};
    action.sa_handler = sigint_handler;
    action.sa_flags = SA_RESETHAND;
    CHECK(0 == sigemptyset(&action.sa_mask), FLEET_INTERNAL_FAILURE, "sigemptyset failed with errno {}", errno);
    CHECK(0 == sigaction(SIGINT, &action, nullptr), FLEET_INTERNAL_FAILURE,
        "sigaction failed with errno {}", errno);
    return FLEET_SUCCESS;
}

void add_config_options(CLI::App *app, ConfigOverrides &overrides)
{
    auto group = app->add_option_group("Config Options");
    group->add_option("--profile", overrides.profile,
        "Configuration profile to use (default: $FLEET_PROFILE or 'default')");
    group->add_option("--config-directory", overrides.config_directory,
        "Directory holding config.json and credentials.json")
        ->check(CLI::ExistingDirectory);
}

void add_api_options(CLI::App *app, ConfigOverrides &overrides)
{
    auto group = app->add_option_group("API Options");
    group->add_option("--api-key", overrides.api_key, "Admin API key (default: $FLEET_API_KEY)");
    group->add_option("--base-url", overrides.base_url, "Admin API base url (default: $FLEET_BASE_URL)");
    group->add_option("--ca-path", overrides.ca_path, "CA bundle used to verify the server certificate")
        ->check(CLI::ExistingFile);
}

void add_signing_key_options(CLI::App *app, signing_key_params &params, bool is_required)
{
    auto group = app->add_option_group("Signing Key Options");
    auto *key_pair_option = group->add_option("--signing-key-pair", params.key_pair_name,
        "Name of a signing key pair from the configuration");
    auto *private_key_option = group->add_option("--signing-key-private", params.private_key_path,
        "Path of a PEM encoded Ed25519 private key")
        ->check(CLI::ExistingFile);
    auto *key_prn_option = group->add_option("--signing-key-prn", params.signing_key_prn,
        "Remote identity of the signing key");

    key_pair_option->excludes(private_key_option);
    key_pair_option->excludes(key_prn_option);
    private_key_option->needs(key_prn_option);
    key_prn_option->needs(private_key_option);

    group->parse_complete_callback([&params, is_required]() {
        PARSE_CHECK(!is_required || params.is_set(),
            "One of --signing-key-pair or --signing-key-private with --signing-key-prn is required");
    });
}

Expected<SigningKeyPair> get_signing_key_pair(const Config &config, const signing_key_params &params)
{
    if (!params.key_pair_name.empty()) {
        return config.signing_key_pair(params.key_pair_name);
    }

    CHECK_AS_EXPECTED(!params.private_key_path.empty() && !params.signing_key_prn.empty(), FLEET_INVALID_ARGUMENT,
        "No signing key given");
    SigningKeyPair key_pair{};
    key_pair.name = params.signing_key_prn;
    key_pair.private_key_path = params.private_key_path;
    key_pair.signing_key_id = params.signing_key_prn;
    return key_pair;
}

class FleetCtl : public ContainerCommand {
public:
    FleetCtl(CLI::App *app) : ContainerCommand(app), m_verbose(false)
    {
        m_app->set_version_flag("--version", fmt::format("fleetctl version {}", FLEET_VERSION_STRING));
        m_app->add_flag("-v,--verbose", m_verbose, "Print debug logs to stderr");

        add_subcommand<BinariesCommand>();
        add_subcommand<BinarySignaturesCommand>();
        add_subcommand<LedgerCommand>();
    }

    int parse_and_execute(int argc, char **argv)
    {
        CLI11_PARSE(*m_app, argc, argv);

        auto status = fleet_init_logger(m_verbose ? FLEET_LOG_LEVEL_DEBUG : FLEET_LOG_LEVEL_WARNING);
        if (FLEET_SUCCESS != status) {
            std::cerr << "Failed initializing the logger, status " << fleet_get_status_message(status) << std::endl;
            return FLEETCTL_ERROR_EXIT_CODE;
        }

        status = execute();
        if (FLEET_SUCCESS != status) {
            std::cerr << "fleetctl failed with status " << fleet_get_status_message(status) << ": " <<
                CliCommon::status_to_message(status) << std::endl;
            return FLEETCTL_ERROR_EXIT_CODE;
        }
        return 0;
    }

private:
    bool m_verbose;
};

int main(int argc, char** argv) {
    auto cancel_event = Event::create_shared(Event::State::not_signalled);
    if (!cancel_event) {
        std::cerr << "Failed creating the cancel event, status " << fleet_get_status_message(cancel_event.status()) <<
            std::endl;
        return FLEETCTL_ERROR_EXIT_CODE;
    }
    g_cancel_event = cancel_event.release();

    if (FLEET_SUCCESS != install_sigint_handler()) {
        return FLEETCTL_ERROR_EXIT_CODE;
    }

    CLI::App app{"fleetctl - fleet management CLI"};
    FleetCtl cli(&app);
    return cli.parse_and_execute(argc, argv);
}
