/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.cpp
 * @brief Base classes for fleetctl commands.
 **/


#include "command.hpp"

Command::Command(CLI::App *app) :
    m_app(app)
{
}

ContainerCommand::ContainerCommand(CLI::App *app) :
    Command(app)
{
    m_app->require_subcommand(1);
}

fleet_status ContainerCommand::execute()
{
    for (auto &command : m_subcommands) {
        if (command->parsed()) {
            return command->execute();
        }
    }

    LOGGER__ERROR("No subcommand was given");
    return FLEET_NOT_FOUND;
}

ConfigCommand::ConfigCommand(CLI::App *app) :
    Command(app)
{
    add_config_options(m_app, m_overrides);
}

fleet_status ConfigCommand::execute()
{
    TRY(const auto config, Config::load(m_overrides), "Failed loading configuration");
    return execute_with_config(config);
}

ApiCommand::ApiCommand(CLI::App *app) :
    ConfigCommand(app)
{
    add_api_options(m_app, m_overrides);
}

fleet_status ApiCommand::execute_with_config(const Config &config)
{
    TRY(const auto api_config, config.api_config());
    TRY(auto api, HttpAdminApi::create(api_config));
    return execute_with_api(config, *api);
}
