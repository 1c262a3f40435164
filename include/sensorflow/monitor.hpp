#pragma once

/**
 * @file monitor.hpp
 * @brief Bounded monitoring run: filtering pipeline feeding both aggregators
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/pipeline.hpp"
#include "sensorflow/sinks/spatial_averager.hpp"
#include "sensorflow/sinks/windowed_averager.hpp"
#include "sensorflow/stages/bounded_duration.hpp"
#include "sensorflow/stages/deduplication.hpp"
#include "sensorflow/stages/location_filter.hpp"

namespace sensorflow {

/**
 * @brief Monitor configuration
 */
struct MonitorConfig {
    std::chrono::milliseconds run_time{std::chrono::seconds(60)};
    std::chrono::milliseconds dedup_ttl{std::chrono::seconds(30)};
    WindowedAverager::Config averager;
};

/**
 * @brief Counters reported after a run
 */
struct RunSummary {
    std::chrono::milliseconds run_time{0};
    std::uint64_t events_processed{0};
    std::uint64_t invalid_locations{0};
    std::uint64_t duplicates{0};
    std::uint64_t late_events{0};
    std::uint64_t future_events{0};
    std::uint64_t averages_emitted{0};
    std::optional<Centroid> centroid;

    /**
     * @brief Processed events over the configured run time
     */
    [[nodiscard]] double events_per_second() const noexcept;

    [[nodiscard]] std::string format() const;
};

/**
 * @brief Wires BoundedDuration -> LocationFilter -> Deduplication into a
 *        WindowedAverager and a SpatialAverager
 *
 * Both aggregators receive one shared pass of the filtered stream through
 * a ParallelSink, so the stage counters reflect each event once.
 */
class Monitor {
public:
    Monitor(MonitorConfig config, std::vector<Location> locations,
            const Clock& clock = SystemClock::instance(),
            std::shared_ptr<AverageWriter> average_output = nullptr,
            std::shared_ptr<CentroidWriter> centroid_output = nullptr);

    /**
     * @brief Pull events until the run time elapses or the source ends
     * @throws EmptyAggregateError if no located event carried any value;
     *         summary() still reports the run
     */
    RunSummary run(std::unique_ptr<EventStream> events);

    /**
     * @brief Current counters, valid even after a failed run
     */
    [[nodiscard]] RunSummary summary() const;

    [[nodiscard]] const Pipeline& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const BoundedDurationStage& duration_stage() const noexcept { return *duration_; }
    [[nodiscard]] const LocationFilterStage& location_filter() const noexcept { return *location_filter_; }
    [[nodiscard]] const DeduplicationStage& deduplicator() const noexcept { return *deduplicator_; }
    [[nodiscard]] const WindowedAverager& averager() const noexcept { return *averager_; }
    [[nodiscard]] const SpatialAverager& spatial_averager() const noexcept { return *spatial_; }

private:
    MonitorConfig config_;
    std::shared_ptr<BoundedDurationStage> duration_;
    std::shared_ptr<LocationFilterStage> location_filter_;
    std::shared_ptr<DeduplicationStage> deduplicator_;
    std::shared_ptr<WindowedAverager> averager_;
    std::shared_ptr<SpatialAverager> spatial_;
    Pipeline pipeline_;
};

} // namespace sensorflow
