/**
 * @file sensor_monitor.cpp
 * @brief Example: bounded monitoring run over a sensor event feed
 *
 * Usage: sensor_monitor <config.json>
 *
 * Loads the known locations, filters and deduplicates the incoming events
 * for the configured run time, writes bin averages and the value-weighted
 * average location as CSV, and prints a run summary.
 */

#include <iostream>
#include <memory>
#include <vector>

#include "sensorflow/sensorflow.hpp"

namespace {

std::unique_ptr<sensorflow::EventStream> open_events(const sensorflow::AppConfig& config,
                                                     const std::vector<sensorflow::Location>& locations) {
    if (config.simulate) {
        return std::make_unique<sensorflow::SimulatedEventStream>(locations, config.simulator);
    }
    return sensorflow::JsonLinesEventStream::open(config.events_file);
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    sensorflow::AppConfig config;
    try {
        config = sensorflow::load_config(argv[1]);
    } catch (const sensorflow::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    try {
        sensorflow::log::configure_logging(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logging setup failed: " << e.what() << std::endl;
        return 1;
    }
    auto logger = sensorflow::log::logger();
    logger->info("sensorflow {} starting", sensorflow::VERSION);

    std::unique_ptr<sensorflow::Monitor> monitor;
    try {
        sensorflow::JsonFileLocationProvider provider(config.locations_file);
        auto locations = provider.locations();

        std::shared_ptr<sensorflow::AverageWriter> averages;
        if (!config.average_output_csv.empty()) {
            averages = std::make_shared<sensorflow::CsvAverageWriter>(config.average_output_csv);
        }
        std::shared_ptr<sensorflow::CentroidWriter> centroid;
        if (!config.centroid_output_csv.empty()) {
            centroid = std::make_shared<sensorflow::CsvCentroidWriter>(config.centroid_output_csv);
        }

        auto events = open_events(config, locations);
        monitor = std::make_unique<sensorflow::Monitor>(
            config.monitor, locations, sensorflow::SystemClock::instance(), averages, centroid
        );

        auto summary = monitor->run(std::move(events));
        std::cout << "\n" << summary.format() << "\n" << std::endl;
    } catch (const sensorflow::EmptyAggregateError& e) {
        logger->error("{}", e.what());
        std::cout << "\n" << monitor->summary().format() << "\n" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        logger->critical("Monitoring run failed: {}", e.what());
        return 1;
    }

    return 0;
}
