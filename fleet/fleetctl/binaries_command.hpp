/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binaries_command.hpp
 * @brief Upload, verify and sign binaries
 **/

#ifndef _FLEET_BINARIES_COMMAND_HPP_
#define _FLEET_BINARIES_COMMAND_HPP_

#include "fleetctl.hpp"
#include "command.hpp"

#include "fleet/binary_pipeline.hpp"
#include "CLI/CLI.hpp"


class BinariesCreateCommand : public ApiCommand {
public:
    explicit BinariesCreateCommand(CLI::App &parent_app);

protected:
    virtual fleet_status execute_with_api(const Config &config, AdminApi &api) override;

private:
    PipelineParams m_params;
    signing_key_params m_signing_key_params;
    bool m_no_discard_stale;
    uint32_t m_poll_interval_sec;
    uint32_t m_poll_timeout_sec;
};

class BinariesGetCommand : public ApiCommand {
public:
    explicit BinariesGetCommand(CLI::App &parent_app);

protected:
    virtual fleet_status execute_with_api(const Config &config, AdminApi &api) override;

private:
    std::string m_binary_id;
};

class BinariesCommand : public ContainerCommand {
public:
    explicit BinariesCommand(CLI::App &parent_app);
};

#endif /* _FLEET_BINARIES_COMMAND_HPP_ */
