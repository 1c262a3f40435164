/**
 * @file bounded_duration.cpp
 * @brief Deadline-bounded stream
 */

#include "sensorflow/stages/bounded_duration.hpp"

#include <optional>
#include <stdexcept>

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

class BoundedDurationStage::DeadlineStream : public EventStream {
public:
    DeadlineStream(std::unique_ptr<EventStream> upstream, BoundedDurationStage& stage)
        : upstream_(std::move(upstream))
        , stage_(stage) {}

    std::optional<Event> next() override {
        if (finished_) {
            return std::nullopt;
        }

        if (!deadline_) {
            deadline_ = saturating_add(stage_.clock_.now_ms(), stage_.run_time_);
            log::logger()->info("Processing events for {} seconds",
                                std::chrono::duration<double>(stage_.run_time_).count());
        }

        auto event = upstream_->next();
        if (!event) {
            finished_ = true;
            log::logger()->info("Event source ended before the deadline");
            return std::nullopt;
        }

        stage_.record_received();
        if (stage_.clock_.now_ms() < *deadline_) {
            log::logger()->debug("Processing event: {} at {} (location {}, value {})",
                                 event->event_id(), event->timestamp(),
                                 event->location_id(), event->value());
            stage_.processed_.increment();
            stage_.record_emitted();
            return event;
        }

        stage_.record_dropped();
        finished_ = true;
        log::logger()->info("Finished processing events");
        return std::nullopt;
    }

private:
    std::unique_ptr<EventStream> upstream_;
    BoundedDurationStage& stage_;
    std::optional<TimestampMs> deadline_;
    bool finished_{false};
};

BoundedDurationStage::BoundedDurationStage(std::chrono::milliseconds run_time, const Clock& clock)
    : Stage("bounded_duration")
    , run_time_(run_time)
    , clock_(clock) {
    if (run_time_.count() <= 0) {
        throw std::invalid_argument("Run time must be positive");
    }
}

std::unique_ptr<EventStream> BoundedDurationStage::apply(std::unique_ptr<EventStream> upstream) {
    return std::make_unique<DeadlineStream>(std::move(upstream), *this);
}

} // namespace sensorflow
