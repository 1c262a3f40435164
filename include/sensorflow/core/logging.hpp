#pragma once

/**
 * @file logging.hpp
 * @brief Shared spdlog logger for the library
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sensorflow::log {

/**
 * @brief Name under which the library logger is registered with spdlog
 */
constexpr const char* LOGGER_NAME = "sensorflow";

/**
 * @brief Process logging setup
 */
struct LoggingConfig {
    spdlog::level::level_enum console_level{spdlog::level::info};
    std::string file;                                   // empty = no log file
    spdlog::level::level_enum file_level{spdlog::level::debug};
};

/**
 * @brief Get the library logger
 *
 * Falls back to a colored stdout logger when configure_logging() has not
 * been called.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Install console and optional file sinks on the library logger
 *
 * Replaces any logger registered earlier under LOGGER_NAME.
 */
void configure_logging(const LoggingConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 * @throws std::invalid_argument for an unknown name
 */
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace sensorflow::log
