/**
 * @file config.cpp
 * @brief JSON configuration
 */

#include "sensorflow/io/config.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

#include <json/json.h>

#include "sensorflow/core/errors.hpp"

namespace sensorflow {

namespace {

const Json::Value* member(const Json::Value& object, const char* key) {
    if (!object.isObject() || !object.isMember(key)) {
        return nullptr;
    }
    return &object[key];
}

const Json::Value& section(const Json::Value& root, const char* key) {
    static const Json::Value empty(Json::objectValue);
    const Json::Value* value = member(root, key);
    if (!value) {
        return empty;
    }
    if (!value->isObject()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return *value;
}

void read_string(const Json::Value& object, const char* key, std::string& out) {
    if (const Json::Value* value = member(object, key)) {
        if (!value->isString()) {
            throw ConfigError(std::string("'") + key + "' must be a string");
        }
        out = value->asString();
    }
}

void read_bool(const Json::Value& object, const char* key, bool& out) {
    if (const Json::Value* value = member(object, key)) {
        if (!value->isBool()) {
            throw ConfigError(std::string("'") + key + "' must be a boolean");
        }
        out = value->asBool();
    }
}

void read_double(const Json::Value& object, const char* key, double& out, double min, double max) {
    if (const Json::Value* value = member(object, key)) {
        if (!value->isNumeric()) {
            throw ConfigError(std::string("'") + key + "' must be a number");
        }
        const double parsed = value->asDouble();
        if (parsed < min || parsed > max) {
            std::ostringstream oss;
            oss << "'" << key << "' must be within [" << min << ", " << max << "]";
            throw ConfigError(oss.str());
        }
        out = parsed;
    }
}

template<typename Duration>
void read_duration(const Json::Value& object, const char* key, std::chrono::milliseconds& out,
                   std::int64_t min) {
    // Largest count that still fits in milliseconds
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max()
        / std::chrono::duration_cast<std::chrono::milliseconds>(Duration(1)).count();

    if (const Json::Value* value = member(object, key)) {
        if (!value->isIntegral()) {
            throw ConfigError(std::string("'") + key + "' must be an integer");
        }
        if (!value->isInt64()) {
            throw ConfigError(std::string("'") + key + "' must be at most " + std::to_string(max));
        }
        const std::int64_t parsed = value->asInt64();
        if (parsed < min) {
            throw ConfigError(std::string("'") + key + "' must be at least " + std::to_string(min));
        }
        if (parsed > max) {
            throw ConfigError(std::string("'") + key + "' must be at most " + std::to_string(max));
        }
        out = Duration(parsed);
    }
}

void read_level(const Json::Value& object, const char* key, spdlog::level::level_enum& out) {
    std::string name;
    read_string(object, key, name);
    if (name.empty()) {
        return;
    }
    try {
        out = log::parse_level(name);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("'") + key + "': " + e.what());
    }
}

} // namespace

AppConfig parse_config(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw ConfigError("Malformed configuration: " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    AppConfig config;

    read_duration<std::chrono::seconds>(root, "run_time_seconds", config.monitor.run_time, 1);

    read_string(section(root, "locations"), "file", config.locations_file);

    const Json::Value& receiver = section(root, "receiver");
    read_string(receiver, "events_file", config.events_file);
    read_bool(receiver, "simulate", config.simulate);

    read_duration<std::chrono::seconds>(section(root, "deduplicator"), "cache_time_to_live_seconds",
                                        config.monitor.dedup_ttl, 0);

    const Json::Value& averager = section(root, "averager");
    read_duration<std::chrono::seconds>(averager, "average_period_seconds",
                                        config.monitor.averager.averaging_period, 1);
    read_duration<std::chrono::seconds>(averager, "expiry_time_seconds",
                                        config.monitor.averager.expiry, 1);
    read_duration<std::chrono::seconds>(averager, "max_lead_seconds",
                                        config.monitor.averager.max_lead, 0);
    read_bool(averager, "emit_empty_bins", config.monitor.averager.emit_empty_bins);
    read_string(averager, "output_csv", config.average_output_csv);

    read_string(section(root, "location_average"), "output_csv", config.centroid_output_csv);

    const Json::Value& logging = section(root, "logging");
    read_level(logging, "level", config.logging.console_level);
    read_level(logging, "file_level", config.logging.file_level);
    read_string(logging, "file", config.logging.file);

    const Json::Value& simulator = section(root, "simulator");
    read_double(simulator, "events_per_second", config.simulator.events_per_second, 0.0, 1e9);
    read_double(simulator, "duplicate_ratio", config.simulator.duplicate_ratio, 0.0, 1.0);
    read_double(simulator, "unknown_location_ratio", config.simulator.unknown_location_ratio, 0.0, 1.0);
    read_duration<std::chrono::milliseconds>(simulator, "max_lag_ms", config.simulator.max_lag, 0);

    return config;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open configuration file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_config(contents.str());
}

} // namespace sensorflow
