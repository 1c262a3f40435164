/**
 * @file sources.cpp
 * @brief JSON-lines and simulated event receivers
 */

#include "sensorflow/io/sources.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

#include <json/json.h>

#include "sensorflow/core/errors.hpp"
#include "sensorflow/core/logging.hpp"

namespace sensorflow {

namespace {

std::unique_ptr<Json::CharReader> make_reader() {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

const SimulatedEventStream::Config& validated(const SimulatedEventStream::Config& config) {
    if (config.duplicate_ratio < 0.0 || config.duplicate_ratio > 1.0
        || config.unknown_location_ratio < 0.0 || config.unknown_location_ratio > 1.0) {
        throw std::invalid_argument("Simulated event ratios must be within [0, 1]");
    }
    if (config.events_per_second < 0.0) {
        throw std::invalid_argument("Simulated event rate must not be negative");
    }
    if (config.value_stddev <= 0.0) {
        throw std::invalid_argument("Simulated value spread must be positive");
    }
    return config;
}

} // namespace

JsonLinesEventStream::JsonLinesEventStream(std::istream& in)
    : in_(in)
    , reader_(make_reader()) {}

JsonLinesEventStream::JsonLinesEventStream(std::unique_ptr<std::istream> owned)
    : owned_(std::move(owned))
    , in_(*owned_)
    , reader_(make_reader()) {}

JsonLinesEventStream::~JsonLinesEventStream() = default;

std::unique_ptr<JsonLinesEventStream> JsonLinesEventStream::open(const std::string& path) {
    if (path == "-") {
        return std::make_unique<JsonLinesEventStream>(std::cin);
    }

    auto file = std::make_unique<std::ifstream>(path);
    if (!*file) {
        throw SourceError("Cannot open event file: " + path);
    }
    return std::unique_ptr<JsonLinesEventStream>(new JsonLinesEventStream(std::move(file)));
}

std::optional<Event> JsonLinesEventStream::next() {
    std::string line;
    while (std::getline(in_, line)) {
        lines_++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        if (auto event = parse_line(line)) {
            return event;
        }
        malformed_.increment();
    }
    return std::nullopt;
}

std::optional<Event> JsonLinesEventStream::parse_line(const std::string& line) {
    Json::Value root;
    std::string errors;

    if (!reader_->parse(line.data(), line.data() + line.size(), &root, &errors)) {
        log::logger()->warn("Skipping unparseable event on line {}: {}", lines_, errors);
        return std::nullopt;
    }

    if (!root.isObject()
        || !root["locationId"].isString()
        || !root["eventId"].isString()
        || !root["timestamp"].isInt64()
        || !root["value"].isNumeric()) {
        log::logger()->warn("Skipping event with missing or mistyped fields on line {}", lines_);
        return std::nullopt;
    }

    return Event{
        root["locationId"].asString(),
        root["eventId"].asString(),
        static_cast<TimestampMs>(root["timestamp"].asInt64()),
        root["value"].asDouble()
    };
}

SimulatedEventStream::SimulatedEventStream(std::vector<Location> locations, Config config, const Clock& clock)
    : locations_(std::move(locations))
    , config_(validated(config))
    , clock_(clock)
    , rng_(config.seed != 0 ? config.seed : std::random_device{}())
    , value_dist_(config.value_mean, config.value_stddev)
    , next_emit_(std::chrono::steady_clock::now()) {
    if (locations_.empty()) {
        throw std::invalid_argument("Simulated events need at least one location");
    }
    location_dist_ = std::uniform_int_distribution<std::size_t>(0, locations_.size() - 1);
}

std::optional<Event> SimulatedEventStream::next() {
    if (generated_ >= config_.count) {
        return std::nullopt;
    }

    throttle();

    Event event;
    if (!recent_.empty() && unit_(rng_) < config_.duplicate_ratio) {
        std::uniform_int_distribution<std::size_t> pick(0, recent_.size() - 1);
        event = recent_[pick(rng_)];
        duplicates_sent_++;
    } else {
        event = fresh_event();
        recent_.push_back(event);
        if (recent_.size() > RECENT_CAPACITY) {
            recent_.pop_front();
        }
    }

    generated_++;
    return event;
}

Event SimulatedEventStream::fresh_event() {
    std::string location_id;
    if (unit_(rng_) < config_.unknown_location_ratio) {
        location_id = "unknown-" + std::to_string(sequence_);
        unknown_sent_++;
    } else {
        location_id = locations_[location_dist_(rng_)].id;
    }

    TimestampMs lag = 0;
    if (config_.max_lag.count() > 0) {
        std::uniform_int_distribution<TimestampMs> lag_dist(0, config_.max_lag.count());
        lag = lag_dist(rng_);
    }

    return Event{
        std::move(location_id),
        "sim-" + std::to_string(sequence_++),
        clock_.now_ms() - lag,
        value_dist_(rng_)
    };
}

void SimulatedEventStream::throttle() {
    if (config_.events_per_second <= 0.0) {
        return;
    }

    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / config_.events_per_second)
    );
    std::this_thread::sleep_until(next_emit_);
    next_emit_ += interval;
}

} // namespace sensorflow
