/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.cpp
 * @brief Utilities for Posix methods
 **/

#include "common/os_utils.hpp"

#include <unistd.h>
#include <pthread.h>
#include <thread>


namespace fleet
{

void OsUtils::set_current_thread_name(const std::string &name)
{
    // pthread_setname_np name size is limited to 16 chars (including null terminator)
    static const size_t MAX_THREAD_NAME_LENGTH = 15;
    const auto truncated = name.substr(0, MAX_THREAD_NAME_LENGTH);
    (void)pthread_setname_np(pthread_self(), truncated.c_str());
}

uint32_t OsUtils::get_available_parallelism()
{
    const auto count = std::thread::hardware_concurrency();
    return (0 == count) ? 1 : count;
}

bool OsUtils::is_stderr_terminal()
{
    return (1 == isatty(STDERR_FILENO));
}

} /* namespace fleet */
