/**
 * @file logging.cpp
 * @brief Library logger setup
 */

#include "sensorflow/core/logging.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sensorflow::log {

namespace {

constexpr const char* PATTERN = "%Y-%m-%d %H:%M:%S.%e [%t] [%l]  %v";

std::mutex g_setup_mutex;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(g_setup_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    auto fallback = spdlog::stdout_color_mt(LOGGER_NAME);
    fallback->set_pattern(PATTERN);
    fallback->set_level(spdlog::level::info);
    return fallback;
}

void configure_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_setup_mutex);

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(config.console_level);
    sinks.push_back(console);

    auto level = config.console_level;
    if (!config.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file);
        file->set_level(config.file_level);
        sinks.push_back(file);
        level = std::min(level, config.file_level);
    }

    auto configured = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    configured->set_pattern(PATTERN);
    configured->set_level(level);
    configured->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(configured);
}

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off, so only accept "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace sensorflow::log
