/**
 * @file monitor.cpp
 * @brief Monitoring run orchestration
 */

#include "sensorflow/monitor.hpp"

#include <iomanip>
#include <sstream>

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

double RunSummary::events_per_second() const noexcept {
    const double seconds = std::chrono::duration<double>(run_time).count();
    return seconds > 0.0 ? static_cast<double>(events_processed) / seconds : 0.0;
}

std::string RunSummary::format() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Processed " << events_processed << " events in "
        << std::chrono::duration<double>(run_time).count() << " seconds\n"
        << "Events/s: " << events_per_second() << "\n"
        << "Invalid locations skipped: " << invalid_locations << "\n"
        << "Duplicated events skipped: " << duplicates << "\n"
        << "Late events dropped: " << late_events << "\n"
        << "Future events dropped: " << future_events << "\n"
        << "Averages emitted: " << averages_emitted;
    if (centroid) {
        oss << "\nAverage location: (" << centroid->x << ", " << centroid->y << ")";
    }
    return oss.str();
}

Monitor::Monitor(MonitorConfig config, std::vector<Location> locations, const Clock& clock,
                 std::shared_ptr<AverageWriter> average_output,
                 std::shared_ptr<CentroidWriter> centroid_output)
    : config_(config)
    , duration_(std::make_shared<BoundedDurationStage>(config.run_time, clock))
    , location_filter_(std::make_shared<LocationFilterStage>(locations))
    , deduplicator_(std::make_shared<DeduplicationStage>(config.dedup_ttl, clock))
    , averager_(std::make_shared<WindowedAverager>("windowed_average", config.averager, clock,
                                                   std::move(average_output)))
    , spatial_(std::make_shared<SpatialAverager>("location_average", locations,
                                                 std::move(centroid_output)))
    , pipeline_(combine(duration_, location_filter_).combine(deduplicator_)) {}

RunSummary Monitor::run(std::unique_ptr<EventStream> events) {
    log::logger()->info("Monitoring {} locations", location_filter_->location_count());

    auto sinks = Sink::parallel({averager_, spatial_});
    pipeline_.sink(sinks).handle(std::move(events));

    return summary();
}

RunSummary Monitor::summary() const {
    RunSummary summary;
    summary.run_time = config_.run_time;
    summary.events_processed = duration_->events_processed();
    summary.invalid_locations = location_filter_->invalid_events_filtered();
    summary.duplicates = deduplicator_->duplicate_events_ignored();
    summary.late_events = averager_->late_events();
    summary.future_events = averager_->future_events();
    summary.averages_emitted = averager_->averages_emitted();
    summary.centroid = spatial_->result();
    return summary;
}

} // namespace sensorflow
