#pragma once

/**
 * @file test_support.hpp
 * @brief Scripted streams and recording collaborators shared by the tests
 */

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sensorflow/sensorflow.hpp"

namespace sensorflow::testing {

/**
 * @brief An event together with the wall-clock time it is pulled at
 */
struct Arrival {
    TimestampMs at;
    Event event;
};

/**
 * @brief Stream that moves a ManualClock to each event's arrival time
 */
class ScriptedStream : public EventStream {
public:
    ScriptedStream(ManualClock& clock, std::vector<Arrival> arrivals)
        : clock_(clock)
        , arrivals_(std::move(arrivals)) {}

    std::optional<Event> next() override {
        if (position_ >= arrivals_.size()) {
            return std::nullopt;
        }
        const auto& arrival = arrivals_[position_++];
        clock_.set(arrival.at);
        return arrival.event;
    }

    [[nodiscard]] std::size_t pulled() const noexcept { return position_; }

private:
    ManualClock& clock_;
    std::vector<Arrival> arrivals_;
    std::size_t position_{0};
};

/**
 * @brief Stream that counts how many times it was pulled, including the final empty pull
 */
class CountingStream : public EventStream {
public:
    explicit CountingStream(std::vector<Event> events)
        : events_(std::move(events)) {}

    std::optional<Event> next() override {
        pulls_++;
        if (position_ >= events_.size()) {
            return std::nullopt;
        }
        return events_[position_++];
    }

    [[nodiscard]] std::size_t pulls() const noexcept { return pulls_; }
    [[nodiscard]] std::size_t delivered() const noexcept { return position_; }

private:
    std::vector<Event> events_;
    std::size_t position_{0};
    std::size_t pulls_{0};
};

/**
 * @brief Sink that keeps every consumed event
 */
class RecordingSink : public Sink {
public:
    explicit RecordingSink(std::string name = "recording")
        : Sink(std::move(name)) {}

    void consume(const Event& event) override { events.push_back(event); }
    void finish() override { finished++; }

    std::vector<Event> events;
    int finished{0};
};

/**
 * @brief Average writer that records rows and can be told to fail
 */
class RecordingAverageWriter : public AverageWriter {
public:
    void write(const Average& average) override {
        if (failures_remaining > 0) {
            failures_remaining--;
            throw OutputError("disk full");
        }
        rows.push_back(average);
    }

    std::vector<Average> rows;
    int failures_remaining{0};
};

class RecordingCentroidWriter : public CentroidWriter {
public:
    void write(const Centroid& centroid) override { rows.push_back(centroid); }

    std::vector<Centroid> rows;
};

inline Event reading(const std::string& id, TimestampMs timestamp = 0, double value = 1.0,
                     const std::string& location = "loc-1") {
    return Event{location, id, timestamp, value};
}

inline std::vector<std::string> ids_of(const std::vector<Event>& events) {
    std::vector<std::string> ids;
    ids.reserve(events.size());
    for (const auto& event : events) {
        ids.push_back(event.event_id());
    }
    return ids;
}

} // namespace sensorflow::testing
