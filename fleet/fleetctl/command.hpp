/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.hpp
 * @brief Base classes for fleetctl commands.
 **/

#ifndef _FLEET_COMMAND_HPP_
#define _FLEET_COMMAND_HPP_

#include "fleetctl.hpp"
#include "fleet/admin_api.hpp"
#include "CLI/CLI.hpp"

#include <memory>
#include <vector>


class Command {
public:
    explicit Command(CLI::App *app);
    virtual ~Command() = default;

    virtual fleet_status execute() = 0;

    bool parsed() const
    {
        return m_app->parsed();
    }

    void set_footer(const std::string &new_footer)
    {
        m_app->footer(new_footer);
    }

protected:
    CLI::App *m_app;
};

// Command that only contains list of subcommand
class ContainerCommand : public Command {
public:
    explicit ContainerCommand(CLI::App *app);
    virtual fleet_status execute() override final;

protected:

    template<typename CommandType>
    CommandType &add_subcommand()
    {
        auto command = std::make_shared<CommandType>(*m_app);
        m_subcommands.push_back(command);
        return *command;
    }

private:
    std::vector<std::shared_ptr<Command>> m_subcommands;
};

// Command that needs the local configuration
class ConfigCommand : public Command {
public:
    explicit ConfigCommand(CLI::App *app);
    virtual fleet_status execute() override final;

protected:
    ConfigOverrides m_overrides;

    virtual fleet_status execute_with_config(const Config &config) = 0;
};

// Command that talks to the Admin API
class ApiCommand : public ConfigCommand {
public:
    explicit ApiCommand(CLI::App *app);

protected:
    virtual fleet_status execute_with_config(const Config &config) override final;
    virtual fleet_status execute_with_api(const Config &config, AdminApi &api) = 0;
};

#endif /* _FLEET_COMMAND_HPP_ */
