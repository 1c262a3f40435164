#pragma once

/**
 * @file bounded_duration.hpp
 * @brief Stage that ends the stream once a wall-clock deadline passes
 */

#include <chrono>

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/stage.hpp"

namespace sensorflow {

/**
 * @brief Passes events through until the configured run time has elapsed
 *
 * The deadline is captured on the first pull of each applied stream. After
 * it passes, the stream ends without pulling further upstream elements.
 */
class BoundedDurationStage : public Stage {
public:
    /**
     * @throws std::invalid_argument if run_time is not positive
     */
    BoundedDurationStage(std::chrono::milliseconds run_time, const Clock& clock = SystemClock::instance());

    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> upstream) override;

    [[nodiscard]] std::chrono::milliseconds run_time() const noexcept { return run_time_; }

    /**
     * @brief Events passed downstream before the deadline
     */
    [[nodiscard]] std::uint64_t events_processed() const noexcept { return processed_.value(); }

private:
    class DeadlineStream;

    std::chrono::milliseconds run_time_;
    const Clock& clock_;
    Counter processed_;
};

} // namespace sensorflow
