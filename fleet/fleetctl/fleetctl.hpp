/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleetctl.hpp
 * @brief fleetctl CLI.
 **/

#ifndef _FLEET_FLEETCTL_HPP_
#define _FLEET_FLEETCTL_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/event.hpp"
#include "fleet/config.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "CLI/CLI.hpp"
#include <string>

using namespace fleet;

#define PARSE_CHECK(cond, message) \
    do {                                                                        \
        if (!(cond)) {                                                          \
            throw CLI::ParseError(message, CLI::ExitCodes::InvalidError);       \
        }                                                                       \
    } while (0)

// EX_DATAERR from sysexits.h
constexpr int FLEETCTL_ERROR_EXIT_CODE (65);

struct signing_key_params {
    std::string key_pair_name;
    std::string private_key_path;
    std::string signing_key_prn;

    bool is_set() const { return !key_pair_name.empty() || !private_key_path.empty(); }
};

void add_config_options(CLI::App *app, ConfigOverrides &overrides);
void add_api_options(CLI::App *app, ConfigOverrides &overrides);
void add_signing_key_options(CLI::App *app, signing_key_params &params, bool is_required);
Expected<SigningKeyPair> get_signing_key_pair(const Config &config, const signing_key_params &params);

// Signaled by SIGINT. Long running commands pass it down so that an interrupt stops them cleanly.
EventPtr get_cancel_event();

#endif /* _FLEET_FLEETCTL_HPP_ */
