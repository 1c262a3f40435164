#pragma once

/**
 * @file config.hpp
 * @brief Application configuration loaded from JSON
 */

#include <string>

#include "sensorflow/core/logging.hpp"
#include "sensorflow/io/sources.hpp"
#include "sensorflow/monitor.hpp"

namespace sensorflow {

/**
 * @brief Everything the monitoring application needs to start
 */
struct AppConfig {
    MonitorConfig monitor;

    std::string locations_file{"locations.json"};
    std::string events_file{"-"};                       // "-" = standard input
    bool simulate{false};
    SimulatedEventStream::Config simulator;

    std::string average_output_csv{"averages.csv"};     // empty = no file
    std::string centroid_output_csv{"location_average.csv"};

    log::LoggingConfig logging;
};

/**
 * @brief Parse a JSON configuration document
 *
 * Missing keys keep their defaults. Keys of the wrong type or with
 * out-of-range values are rejected.
 *
 * @throws ConfigError naming the offending key
 */
AppConfig parse_config(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 * @throws ConfigError if the file cannot be read or is invalid
 */
AppConfig load_config(const std::string& path);

} // namespace sensorflow
