/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleet.cpp
 * @brief Implementation of the fleet C API.
 **/

#include "fleet/fleet.h"

#include "common/utils.hpp"

#include "utils/fleet_logger.hpp"

using namespace fleet;

static const char *fleet_status_msg_format[] =
{
#define FLEET_STATUS__X(value, name) #name,
    FLEET_STATUS_VARIABLES
#undef FLEET_STATUS__X
};

const char* fleet_get_status_message(fleet_status status)
{
    if (status >= FLEET_STATUS_COUNT) {
        LOGGER__ERROR("Failed to get fleet_status message because of invalid fleet_status value. Max fleet_status value = {}, given value = {}",
            (FLEET_STATUS_COUNT-1), static_cast<int>(status));
        return nullptr;
    }
    return fleet_status_msg_format[status];
}

fleet_status fleet_init_logger(fleet_log_level_t console_level)
{
    TRY(const auto level, FleetLogger::to_spdlog_level(console_level));
    auto &logger = FleetLogger::get_instance(level);
    CHECK_NOT_NULL(logger, FLEET_OUT_OF_HOST_MEMORY);
    logger->set_console_level(level);
    return FLEET_SUCCESS;
}
