/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fleet_logger.cpp
 * @brief Implements logger used by fleet.
 **/

#include "common/utils.hpp"
#include "common/filesystem.hpp"
#include "common/env_vars.hpp"

#include "fleet/config.hpp"

#include "utils/fleet_logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <unistd.h>
#include <iostream>


namespace fleet
{

#define MAX_LOG_FILE_SIZE (1024 * 1024) // 1MB

#define FLEET_LOGGER_NAME ("fleet")
#define FLEET_LOGGER_FILENAME ("fleetctl.log")
#define FLEET_MAX_NUMBER_OF_LOG_FILES (1) // There will be 2 log files - 1 spare
#ifdef NDEBUG
#define FLEET_CONSOLE_LOGGER_PATTERN ("[%n] [%^%l%$] %v") // Console logger will print: [fleet] [log level] msg
#else
#define FLEET_CONSOLE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%^%l%$] [%s:%#] [%!] %v") // Console logger will print: [timestamp] [PID] [TID] [fleet] [log level] [source file:line number] [function name] msg
#endif
#define FLEET_FILE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%l] [%s:%#] [%!] %v") // File logger will print: [timestamp] [PID] [TID] [fleet] [log level] [source file:line number] [function name] msg

#define PERIODIC_FLUSH_INTERVAL_IN_SECONDS (5)


std::string FleetLogger::get_log_directory()
{
    auto log_path = get_env_variable(FLEET_LOGGER_PATH_ENV_VAR);
    if (log_path) {
        if ("NONE" == log_path.value()) {
            return "";
        }
        return log_path.release();
    }

    return Config::default_cache_directory();
}

std::shared_ptr<spdlog::sinks::sink> FleetLogger::create_file_sink(const std::string &dir_path, const std::string &filename)
{
    if ("" == dir_path) {
        return make_shared_nothrow<spdlog::sinks::null_sink_mt>();
    }

    auto status = Filesystem::create_directories(dir_path);
    if (FLEET_SUCCESS != status) {
        std::cerr << "fleet warning: Cannot create log file " << filename << "! Path " << dir_path << " is not valid." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_mt>();
    }

    const auto file_path = Filesystem::join(dir_path, filename);
    if (0 != access(dir_path.c_str(), W_OK) ||
        (Filesystem::does_file_exists(file_path) && (0 != access(file_path.c_str(), W_OK)))) {
        std::cerr << "fleet warning: Cannot create log file " << filename << "! Please check the directory " << dir_path << " write permissions." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_mt>();
    }

    return make_shared_nothrow<spdlog::sinks::rotating_file_sink_mt>(file_path, MAX_LOG_FILE_SIZE, FLEET_MAX_NUMBER_OF_LOG_FILES);
}

Expected<spdlog::level::level_enum> FleetLogger::to_spdlog_level(fleet_log_level_t level)
{
    switch (level) {
    case FLEET_LOG_LEVEL_TRACE:
        return Expected<spdlog::level::level_enum>(spdlog::level::trace);
    case FLEET_LOG_LEVEL_DEBUG:
        return Expected<spdlog::level::level_enum>(spdlog::level::debug);
    case FLEET_LOG_LEVEL_INFO:
        return Expected<spdlog::level::level_enum>(spdlog::level::info);
    case FLEET_LOG_LEVEL_WARNING:
        return Expected<spdlog::level::level_enum>(spdlog::level::warn);
    case FLEET_LOG_LEVEL_ERROR:
        return Expected<spdlog::level::level_enum>(spdlog::level::err);
    case FLEET_LOG_LEVEL_CRITICAL:
        return Expected<spdlog::level::level_enum>(spdlog::level::critical);
    default:
        LOGGER__ERROR("Invalid log level {}", static_cast<int>(level));
        return make_unexpected(FLEET_INVALID_ARGUMENT);
    }
}

FleetLogger::FleetLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level) :
    m_console_sink(make_shared_nothrow<spdlog::sinks::stderr_color_sink_mt>()),
    m_file_sink(create_file_sink(get_log_directory(), FLEET_LOGGER_FILENAME))
{
    if ((nullptr == m_console_sink) || (nullptr == m_file_sink)) {
        std::cerr << "Allocating memory on heap for logger sinks has failed! Please check if this host has enough memory. Writing to log will result in a SEGFAULT!" << std::endl;
        return;
    }

    m_console_sink->set_pattern(FLEET_CONSOLE_LOGGER_PATTERN);
    m_file_sink->set_pattern(FLEET_FILE_LOGGER_PATTERN);
    m_file_sink->set_level(file_level);

    std::vector<std::shared_ptr<spdlog::sinks::sink>> sink_vector = { m_console_sink, m_file_sink };
    m_fleet_logger = make_shared_nothrow<spdlog::logger>(FLEET_LOGGER_NAME, sink_vector.begin(), sink_vector.end());
    if (nullptr == m_fleet_logger) {
        std::cerr << "Allocating memory on heap for fleet logger has failed! Please check if this host has enough memory. Writing to log will result in a SEGFAULT!" << std::endl;
        return;
    }

    set_console_level(console_level);
    m_fleet_logger->flush_on(flush_level);

    // Setting logger level to min active level, as traces will only show if the sink level is set to their level
    m_fleet_logger->set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
    spdlog::set_default_logger(m_fleet_logger);
    spdlog::flush_every(std::chrono::seconds(PERIODIC_FLUSH_INTERVAL_IN_SECONDS));
}

void FleetLogger::set_console_level(spdlog::level::level_enum console_level)
{
    auto user_console_logger_level = get_env_variable(FLEET_CONSOLE_LOGGER_LEVEL_ENV_VAR);
    if (user_console_logger_level) {
        auto expected_console_level = get_console_logger_level_from_string(user_console_logger_level.value());
        if (expected_console_level) {
            console_level = expected_console_level.release();
        } else {
            LOGGER__WARNING("Failed to parse console logger level from environment variable: {}, status: {}",
                user_console_logger_level.value(), expected_console_level.status());
        }
    }

    if (nullptr != m_console_sink) {
        m_console_sink->set_level(console_level);
    }
}

} /* namespace fleet */
