/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.hpp
 * @brief Utilities for OS methods
 **/

#ifndef _FLEET_OS_UTILS_HPP_
#define _FLEET_OS_UTILS_HPP_

#include "fleet/fleet.h"

#include <string>
#include <cstdint>


namespace fleet
{

class OsUtils final
{
public:
    OsUtils() = delete;

    static void set_current_thread_name(const std::string &name);
    // Number of hardware threads, at least 1
    static uint32_t get_available_parallelism();
    static bool is_stderr_terminal();
};

} /* namespace fleet */

#endif /* _FLEET_OS_UTILS_HPP_ */
