/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file binary_signatures_command.hpp
 * @brief Sign an already verified binary
 **/

#ifndef _FLEET_BINARY_SIGNATURES_COMMAND_HPP_
#define _FLEET_BINARY_SIGNATURES_COMMAND_HPP_

#include "fleetctl.hpp"
#include "command.hpp"

#include "CLI/CLI.hpp"


class BinarySignaturesCreateCommand : public ApiCommand {
public:
    explicit BinarySignaturesCreateCommand(CLI::App &parent_app);

protected:
    virtual fleet_status execute_with_api(const Config &config, AdminApi &api) override;

private:
    std::string m_binary_id;
    std::string m_content_path;
    signing_key_params m_signing_key_params;
};

class BinarySignaturesCommand : public ContainerCommand {
public:
    explicit BinarySignaturesCommand(CLI::App &parent_app);
};

#endif /* _FLEET_BINARY_SIGNATURES_COMMAND_HPP_ */
