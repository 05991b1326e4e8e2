/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file ledger_command.hpp
 * @brief Inspect and clear the local resumability records
 **/

#ifndef _FLEET_LEDGER_COMMAND_HPP_
#define _FLEET_LEDGER_COMMAND_HPP_

#include "fleetctl.hpp"
#include "command.hpp"

#include "CLI/CLI.hpp"


class LedgerListCommand : public ConfigCommand {
public:
    explicit LedgerListCommand(CLI::App &parent_app);

protected:
    virtual fleet_status execute_with_config(const Config &config) override;
};

class LedgerClearCommand : public ConfigCommand {
public:
    explicit LedgerClearCommand(CLI::App &parent_app);

protected:
    virtual fleet_status execute_with_config(const Config &config) override;

private:
    BinaryIdentity m_identity;
};

class LedgerCommand : public ContainerCommand {
public:
    explicit LedgerCommand(CLI::App &parent_app);
};

#endif /* _FLEET_LEDGER_COMMAND_HPP_ */
