/**
 * @file spatial_averager.cpp
 * @brief Value-weighted centroid
 */

#include "sensorflow/sinks/spatial_averager.hpp"

#include "sensorflow/core/errors.hpp"
#include "sensorflow/core/logging.hpp"

namespace sensorflow {

SpatialAverager::SpatialAverager(std::string name, const std::vector<Location>& locations,
                                 std::shared_ptr<CentroidWriter> writer)
    : Sink(std::move(name))
    , writer_(std::move(writer)) {
    locations_.reserve(locations.size());
    for (const auto& location : locations) {
        locations_.emplace(location.id, location);
    }
}

void SpatialAverager::consume(const Event& event) {
    auto it = locations_.find(event.location_id());
    if (it == locations_.end()) {
        log::logger()->debug("No coordinates for location {}, skipping event {}",
                             event.location_id(), event.event_id());
        unlocated_.increment();
        return;
    }

    weighted_x_ += it->second.x * event.value();
    weighted_y_ += it->second.y * event.value();
    total_value_ += event.value();
    events_++;
}

Centroid SpatialAverager::centroid() const {
    if (total_value_ == 0.0) {
        throw EmptyAggregateError("Cannot compute location average of " + std::to_string(events_)
                                  + " events: total value is zero");
    }
    return Centroid{weighted_x_ / total_value_, weighted_y_ / total_value_, events_};
}

void SpatialAverager::finish() {
    const Centroid result = centroid();
    log::logger()->info("Average location over {} events is ({}, {})", result.events, result.x, result.y);
    result_ = result;

    if (writer_) {
        writer_->write(result);
    }
}

} // namespace sensorflow
