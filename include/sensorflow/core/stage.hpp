#pragma once

/**
 * @file stage.hpp
 * @brief Base interface for lazy, order-preserving pipeline stages
 */

#include <memory>
#include <string>

#include "sensorflow/core/metrics.hpp"
#include "sensorflow/core/stream.hpp"

namespace sensorflow {

/**
 * @brief A transform from one event stream to another
 *
 * apply() wraps the upstream stream without pulling from it; work happens
 * only as the returned stream is pulled. Stages never reorder events.
 *
 * A stage owns its private state (caches, counters) and must outlive every
 * stream it returns.
 */
class Stage {
public:
    explicit Stage(std::string name)
        : name_(std::move(name)) {}

    virtual ~Stage() = default;

    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    /**
     * @brief Wrap an upstream stream with this stage's transform
     */
    virtual std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> upstream) = 0;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const StageStats& stats() const noexcept { return stats_; }

protected:
    void record_received() noexcept { stats_.events_received++; }
    void record_emitted() noexcept { stats_.events_emitted++; }
    void record_dropped() noexcept { stats_.events_dropped++; }

private:
    std::string name_;
    StageStats stats_;
};

/**
 * @brief Stage that passes or drops each event independently
 *
 * Subclasses decide per event through admit(); the stream returned by
 * apply() keeps pulling upstream until an event is admitted or upstream
 * ends.
 */
class FilterStage : public Stage {
public:
    using Stage::Stage;

    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> upstream) final;

protected:
    /**
     * @brief Decide whether an event continues downstream
     */
    virtual bool admit(const Event& event) = 0;

private:
    class FilteredStream;
};

} // namespace sensorflow
