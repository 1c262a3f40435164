#pragma once

/**
 * @file spatial_averager.hpp
 * @brief Value-weighted centroid of event locations
 */

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "sensorflow/core/sink.hpp"

namespace sensorflow {

/**
 * @brief Value-weighted average position over one pass
 */
struct Centroid {
    double x{0.0};
    double y{0.0};
    std::uint64_t events{0};
};

/**
 * @brief Output collaborator receiving the centroid of a pass
 */
class CentroidWriter {
public:
    virtual ~CentroidWriter() = default;

    /**
     * @throws OutputError if the row could not be written
     */
    virtual void write(const Centroid& centroid) = 0;
};

/**
 * @brief Computes x = sum(x * value) / sum(value), likewise for y
 *
 * Unlike bin averages, a pass whose values sum to zero has no defined
 * result: finish() and centroid() throw EmptyAggregateError instead of
 * reporting 0.
 */
class SpatialAverager : public Sink {
public:
    SpatialAverager(std::string name, const std::vector<Location>& locations,
                    std::shared_ptr<CentroidWriter> writer = nullptr);

    void consume(const Event& event) override;

    /**
     * @brief Compute the centroid of the pass and hand it to the writer
     * @throws EmptyAggregateError if the total value is zero
     */
    void finish() override;

    /**
     * @brief Centroid of everything consumed so far
     * @throws EmptyAggregateError if the total value is zero
     */
    [[nodiscard]] Centroid centroid() const;

    /**
     * @brief Result stored by the last successful finish()
     */
    [[nodiscard]] const std::optional<Centroid>& result() const noexcept { return result_; }

    [[nodiscard]] double total_value() const noexcept { return total_value_; }

    /**
     * @brief Events skipped because their location has no coordinates
     */
    [[nodiscard]] std::uint64_t unlocated_events() const noexcept { return unlocated_.value(); }

private:
    std::unordered_map<LocationId, Location> locations_;
    std::shared_ptr<CentroidWriter> writer_;

    double weighted_x_{0.0};
    double weighted_y_{0.0};
    double total_value_{0.0};
    std::uint64_t events_{0};
    Counter unlocated_;

    std::optional<Centroid> result_;
};

} // namespace sensorflow
