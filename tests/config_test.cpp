/**
 * @file config_test.cpp
 * @brief Tests for JSON configuration parsing
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "sensorflow/io/config.hpp"
#include "sensorflow/core/errors.hpp"

using namespace sensorflow;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {};

TEST_F(ConfigTest, EmptyObjectKeepsDefaults) {
    auto config = parse_config("{}");

    EXPECT_EQ(config.monitor.run_time, 60s);
    EXPECT_EQ(config.monitor.dedup_ttl, 30s);
    EXPECT_EQ(config.monitor.averager.averaging_period, 10s);
    EXPECT_EQ(config.monitor.averager.expiry, 30s);
    EXPECT_TRUE(config.monitor.averager.emit_empty_bins);
    EXPECT_EQ(config.monitor.averager.max_lead, 1h);
    EXPECT_EQ(config.locations_file, "locations.json");
    EXPECT_EQ(config.events_file, "-");
    EXPECT_FALSE(config.simulate);
    EXPECT_EQ(config.average_output_csv, "averages.csv");
    EXPECT_EQ(config.centroid_output_csv, "location_average.csv");
    EXPECT_EQ(config.logging.console_level, spdlog::level::info);
    EXPECT_TRUE(config.logging.file.empty());
}

TEST_F(ConfigTest, ParsesEverySection) {
    auto config = parse_config(R"({
        "run_time_seconds": 5,
        "locations": {"file": "sites.json"},
        "receiver": {"events_file": "events.jsonl", "simulate": true},
        "deduplicator": {"cache_time_to_live_seconds": 0},
        "averager": {
            "average_period_seconds": 2,
            "expiry_time_seconds": 6,
            "emit_empty_bins": false,
            "max_lead_seconds": 120,
            "output_csv": ""
        },
        "location_average": {"output_csv": "centroid.csv"},
        "logging": {"level": "warn", "file": "monitor.log", "file_level": "trace"},
        "simulator": {
            "events_per_second": 50,
            "duplicate_ratio": 0.5,
            "unknown_location_ratio": 0,
            "max_lag_ms": 250
        }
    })");

    EXPECT_EQ(config.monitor.run_time, 5s);
    EXPECT_EQ(config.locations_file, "sites.json");
    EXPECT_EQ(config.events_file, "events.jsonl");
    EXPECT_TRUE(config.simulate);
    EXPECT_EQ(config.monitor.dedup_ttl, 0s);
    EXPECT_EQ(config.monitor.averager.averaging_period, 2s);
    EXPECT_EQ(config.monitor.averager.expiry, 6s);
    EXPECT_FALSE(config.monitor.averager.emit_empty_bins);
    EXPECT_EQ(config.monitor.averager.max_lead, 120s);
    EXPECT_TRUE(config.average_output_csv.empty());
    EXPECT_EQ(config.centroid_output_csv, "centroid.csv");
    EXPECT_EQ(config.logging.console_level, spdlog::level::warn);
    EXPECT_EQ(config.logging.file_level, spdlog::level::trace);
    EXPECT_EQ(config.logging.file, "monitor.log");
    EXPECT_DOUBLE_EQ(config.simulator.events_per_second, 50.0);
    EXPECT_DOUBLE_EQ(config.simulator.duplicate_ratio, 0.5);
    EXPECT_DOUBLE_EQ(config.simulator.unknown_location_ratio, 0.0);
    EXPECT_EQ(config.simulator.max_lag, 250ms);
}

TEST_F(ConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(parse_config("{\"run_time_seconds\": "), ConfigError);
    EXPECT_THROW(parse_config("[1, 2]"), ConfigError);
}

TEST_F(ConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(parse_config(R"({"run_time_seconds": "ten"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"run_time_seconds": 1.5})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"receiver": {"simulate": "yes"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"locations": "sites.json"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"averager": {"output_csv": 3}})"), ConfigError);
}

TEST_F(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(parse_config(R"({"run_time_seconds": 0})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"deduplicator": {"cache_time_to_live_seconds": -1}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"averager": {"average_period_seconds": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"averager": {"expiry_time_seconds": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"simulator": {"duplicate_ratio": 1.1}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"simulator": {"events_per_second": -5}})"), ConfigError);
}

TEST_F(ConfigTest, RejectsDurationsThatOverflowMilliseconds) {
    EXPECT_THROW(parse_config(R"({"run_time_seconds": 18446744073709551615})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"run_time_seconds": 9223372036854775807})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"averager": {"expiry_time_seconds": 9223372036854776})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"simulator": {"max_lag_ms": 18446744073709551615}})"), ConfigError);

    auto config = parse_config(R"({"run_time_seconds": 9223372036854775})");
    EXPECT_EQ(config.monitor.run_time.count(), 9223372036854775000);
}

TEST_F(ConfigTest, OverflowErrorNamesOffendingKey) {
    try {
        parse_config(R"({"deduplicator": {"cache_time_to_live_seconds": 18446744073709551615}})");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("cache_time_to_live_seconds"), std::string::npos);
    }
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(parse_config(R"({"logging": {"level": "chatty"}})"), ConfigError);
}

TEST_F(ConfigTest, ErrorNamesOffendingKey) {
    try {
        parse_config(R"({"averager": {"expiry_time_seconds": "soon"}})");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("expiry_time_seconds"), std::string::npos);
    }
}

TEST_F(ConfigTest, LoadReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "sensorflow_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"run_time_seconds": 3, "receiver": {"simulate": true}})";
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(config.monitor.run_time, 3s);
    EXPECT_TRUE(config.simulate);
}

TEST_F(ConfigTest, LoadReportsMissingFile) {
    EXPECT_THROW(load_config("/nonexistent/sensorflow/config.json"), ConfigError);
}

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(log::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(log::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(log::parse_level("off"), spdlog::level::off);
    EXPECT_THROW(log::parse_level("loud"), std::invalid_argument);
}
