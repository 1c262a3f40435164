#pragma once

/**
 * @file location_filter.hpp
 * @brief Stage that drops events from unknown locations
 */

#include <unordered_set>
#include <vector>

#include "sensorflow/core/stage.hpp"

namespace sensorflow {

/**
 * @brief Keeps only events whose location id is in a fixed set
 */
class LocationFilterStage : public FilterStage {
public:
    explicit LocationFilterStage(std::unordered_set<LocationId> valid_locations);

    explicit LocationFilterStage(const std::vector<Location>& valid_locations);

    [[nodiscard]] bool is_valid(const LocationId& id) const {
        return valid_locations_.count(id) > 0;
    }

    [[nodiscard]] std::size_t location_count() const noexcept { return valid_locations_.size(); }

    [[nodiscard]] std::uint64_t invalid_events_filtered() const noexcept { return invalid_.value(); }

protected:
    bool admit(const Event& event) override;

private:
    const std::unordered_set<LocationId> valid_locations_;
    Counter invalid_;
};

} // namespace sensorflow
