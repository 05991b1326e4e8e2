/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleet_logger.hpp
 * @brief Declares logger used by fleet.
 **/

#ifndef _FLEET_LOGGER_HPP_
#define _FLEET_LOGGER_HPP_

#include "fleet/fleet.h"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "common/env_vars.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace fleet
{

class FleetLogger {
public:
#ifdef NDEBUG
    static std::unique_ptr<FleetLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::info, spdlog::level::level_enum flush_level = spdlog::level::warn)
#else
    static std::unique_ptr<FleetLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::debug, spdlog::level::level_enum flush_level = spdlog::level::debug)
#endif
    {
        static std::unique_ptr<FleetLogger> instance = nullptr;
        if (nullptr == instance) {
            instance = make_unique_nothrow<FleetLogger>(console_level, file_level, flush_level);
        }
        return instance;
    }

    FleetLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level);
    ~FleetLogger() = default;
    FleetLogger(FleetLogger const&) = delete;
    void operator=(FleetLogger const&) = delete;

    // The environment variable FLEET_CONSOLE_LOGGER_LEVEL takes precedence over @a console_level
    void set_console_level(spdlog::level::level_enum console_level);

    static std::string get_log_directory();
    static std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string &dir_path, const std::string &filename);
    static Expected<spdlog::level::level_enum> to_spdlog_level(fleet_log_level_t level);
    static Expected<spdlog::level::level_enum> get_console_logger_level_from_string(const std::string &user_console_logger_level)
    {
        static const std::unordered_map<std::string, spdlog::level::level_enum> log_level_map = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
        };
        if(log_level_map.find(user_console_logger_level) != log_level_map.end()) {
            return Expected<spdlog::level::level_enum>(log_level_map.at(user_console_logger_level));
        }
        return make_unexpected(FLEET_INVALID_ARGUMENT);
    }

private:
    std::shared_ptr<spdlog::sinks::sink> m_console_sink;
    std::shared_ptr<spdlog::sinks::sink> m_file_sink;
    std::shared_ptr<spdlog::logger> m_fleet_logger;
};

} /* namespace fleet */

#endif /* _FLEET_LOGGER_HPP_ */
