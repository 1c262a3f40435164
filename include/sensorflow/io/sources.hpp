#pragma once

/**
 * @file sources.hpp
 * @brief Event receivers feeding the pipeline
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <istream>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/metrics.hpp"
#include "sensorflow/core/stream.hpp"

namespace Json {
class CharReader;
}

namespace sensorflow {

/**
 * @brief Reads one JSON event per line
 *
 * Each line is an object with string `locationId` and `eventId`, integral
 * `timestamp` (epoch milliseconds) and numeric `value`. Blank lines are
 * ignored. Lines that do not parse are logged, counted and skipped.
 */
class JsonLinesEventStream : public EventStream {
public:
    /**
     * @brief Read from a caller-owned stream
     */
    explicit JsonLinesEventStream(std::istream& in);
    ~JsonLinesEventStream() override;

    /**
     * @brief Open a file, or standard input for "-"
     * @throws SourceError if the file cannot be opened
     */
    static std::unique_ptr<JsonLinesEventStream> open(const std::string& path);

    std::optional<Event> next() override;

    [[nodiscard]] std::uint64_t lines_read() const noexcept { return lines_; }
    [[nodiscard]] std::uint64_t malformed_lines() const noexcept { return malformed_.value(); }

private:
    explicit JsonLinesEventStream(std::unique_ptr<std::istream> owned);

    std::optional<Event> parse_line(const std::string& line);

    std::unique_ptr<std::istream> owned_;
    std::istream& in_;
    std::unique_ptr<Json::CharReader> reader_;
    std::uint64_t lines_{0};
    Counter malformed_;
};

/**
 * @brief Synthetic receiver producing readings over known locations
 *
 * Mimics a live feed: timestamps follow the clock with a random lag so
 * arrivals are only approximately ordered, a fraction of events repeat an
 * earlier id, and a fraction report a location nobody knows.
 */
class SimulatedEventStream : public EventStream {
public:
    struct Config {
        double events_per_second{200.0};    // 0 = as fast as pulled
        double duplicate_ratio{0.05};
        double unknown_location_ratio{0.02};
        std::chrono::milliseconds max_lag{2000};
        double value_mean{5.0};
        double value_stddev{2.0};
        std::uint64_t count{std::numeric_limits<std::uint64_t>::max()};
        std::uint64_t seed{0};              // 0 = seed from std::random_device
    };

    /**
     * @throws std::invalid_argument if there are no locations or a ratio is outside [0, 1]
     */
    SimulatedEventStream(std::vector<Location> locations, Config config,
                         const Clock& clock = SystemClock::instance());

    std::optional<Event> next() override;

    [[nodiscard]] std::uint64_t generated() const noexcept { return generated_; }
    [[nodiscard]] std::uint64_t duplicates_sent() const noexcept { return duplicates_sent_; }
    [[nodiscard]] std::uint64_t unknown_sent() const noexcept { return unknown_sent_; }

private:
    static constexpr std::size_t RECENT_CAPACITY = 64;

    Event fresh_event();
    void throttle();

    std::vector<Location> locations_;
    Config config_;
    const Clock& clock_;

    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
    std::normal_distribution<double> value_dist_;
    std::uniform_int_distribution<std::size_t> location_dist_;

    std::deque<Event> recent_;
    std::chrono::steady_clock::time_point next_emit_;
    std::uint64_t generated_{0};
    std::uint64_t sequence_{0};
    std::uint64_t duplicates_sent_{0};
    std::uint64_t unknown_sent_{0};
};

} // namespace sensorflow
