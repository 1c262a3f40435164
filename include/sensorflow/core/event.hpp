#pragma once

/**
 * @file event.hpp
 * @brief Sensor reading and location value types
 */

#include <cstdint>
#include <string>
#include <utility>

namespace sensorflow {

/**
 * @brief Milliseconds since the Unix epoch
 */
using TimestampMs = std::int64_t;

/**
 * @brief Opaque identifier of a sensor location
 */
using LocationId = std::string;

/**
 * @brief Opaque identifier of a single reading, used for deduplication
 */
using EventId = std::string;

/**
 * @brief A single sensor reading
 *
 * Events are immutable once produced. Stages observe and may drop them,
 * they never modify them.
 */
class Event {
public:
    Event() = default;

    Event(LocationId location_id, EventId event_id, TimestampMs timestamp, double value)
        : location_id_(std::move(location_id))
        , event_id_(std::move(event_id))
        , timestamp_(timestamp)
        , value_(value) {}

    [[nodiscard]] const LocationId& location_id() const noexcept { return location_id_; }
    [[nodiscard]] const EventId& event_id() const noexcept { return event_id_; }
    [[nodiscard]] TimestampMs timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] double value() const noexcept { return value_; }

    friend bool operator==(const Event& lhs, const Event& rhs) {
        return lhs.location_id_ == rhs.location_id_
            && lhs.event_id_ == rhs.event_id_
            && lhs.timestamp_ == rhs.timestamp_
            && lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const Event& lhs, const Event& rhs) {
        return !(lhs == rhs);
    }

private:
    LocationId location_id_;
    EventId event_id_;
    TimestampMs timestamp_{0};
    double value_{0.0};
};

/**
 * @brief A known sensor location with its planar coordinates
 */
struct Location {
    LocationId id;
    double x{0.0};
    double y{0.0};
};

} // namespace sensorflow
