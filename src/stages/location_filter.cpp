/**
 * @file location_filter.cpp
 * @brief Location validity filter
 */

#include "sensorflow/stages/location_filter.hpp"

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

namespace {

std::unordered_set<LocationId> collect_ids(const std::vector<Location>& locations) {
    std::unordered_set<LocationId> ids;
    ids.reserve(locations.size());
    for (const auto& location : locations) {
        ids.insert(location.id);
    }
    return ids;
}

} // namespace

LocationFilterStage::LocationFilterStage(std::unordered_set<LocationId> valid_locations)
    : FilterStage("location_filter")
    , valid_locations_(std::move(valid_locations)) {}

LocationFilterStage::LocationFilterStage(const std::vector<Location>& valid_locations)
    : LocationFilterStage(collect_ids(valid_locations)) {}

bool LocationFilterStage::admit(const Event& event) {
    if (is_valid(event.location_id())) {
        return true;
    }
    log::logger()->debug("Ignoring event with unknown location ID: {}", event.location_id());
    invalid_.increment();
    return false;
}

} // namespace sensorflow
