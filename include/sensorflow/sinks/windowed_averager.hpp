#pragma once

/**
 * @file windowed_averager.hpp
 * @brief Time-bucketed moving average sink
 */

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/sink.hpp"

namespace sensorflow {

/**
 * @brief Final average of a retired bin
 */
struct Average {
    TimestampMs start{0};
    TimestampMs end{0};
    double value{0.0};
};

/**
 * @brief Half-open time interval [start, end) collecting event values
 */
struct Bin {
    TimestampMs start{0};
    TimestampMs end{0};
    std::vector<double> values;

    [[nodiscard]] bool contains(TimestampMs timestamp) const noexcept {
        return timestamp >= start && timestamp < end;
    }

    [[nodiscard]] bool empty() const noexcept { return values.empty(); }

    /**
     * @brief Arithmetic mean of the values, 0 if there are none
     */
    [[nodiscard]] Average average() const;
};

/**
 * @brief Output collaborator receiving each finalized average
 */
class AverageWriter {
public:
    virtual ~AverageWriter() = default;

    /**
     * @throws OutputError if the row could not be written
     */
    virtual void write(const Average& average) = 0;
};

/**
 * @brief Moving average over fixed-width, contiguous time bins
 *
 * Bins are created on demand as event timestamps move forward and retired
 * once their end lags the wall clock by more than the expiry period. Each
 * retired bin becomes an Average handed to the writer. At most one bin is
 * retired per consumed event.
 *
 * The bin sequence is never empty and has no gaps. It is seeded with a
 * zero-width bin ending at now - expiry; that seed is never reported as an
 * average.
 */
class WindowedAverager : public Sink {
public:
    struct Config {
        std::chrono::milliseconds averaging_period{std::chrono::seconds(10)};
        std::chrono::milliseconds expiry{std::chrono::seconds(30)};
        bool emit_empty_bins{true};     // retired bins without values report 0
        std::chrono::milliseconds max_lead{std::chrono::hours(1)};  // furthest an event may be ahead of the clock
    };

    /**
     * @throws std::invalid_argument if the period or expiry is not positive,
     *         or the lead is negative
     */
    WindowedAverager(std::string name, Config config, const Clock& clock = SystemClock::instance(),
                     std::shared_ptr<AverageWriter> writer = nullptr);

    /**
     * @brief Bin the event, then retire the oldest bin if it has expired
     * @throws OutputError if writing a retired average fails; the bin is
     *         already retired and the averager stays usable
     */
    void consume(const Event& event) override;

    /**
     * @brief Place an event's value into its bin, creating bins as needed
     * @return false if the event predates the retained window or lies more
     *         than max_lead ahead of the clock, and was dropped
     */
    bool add_to_bin(const Event& event);

    /**
     * @brief Remove and return the first bin if it has expired
     */
    std::optional<Bin> maybe_expire_first_bin();

    [[nodiscard]] const std::deque<Bin>& bins() const noexcept { return bins_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /**
     * @brief Running averages of open bins that hold at least one value
     */
    [[nodiscard]] std::vector<Average> open_averages() const;

    [[nodiscard]] std::uint64_t late_events() const noexcept { return late_events_.value(); }
    [[nodiscard]] std::uint64_t future_events() const noexcept { return future_events_.value(); }
    [[nodiscard]] std::uint64_t averages_emitted() const noexcept { return emitted_.value(); }

private:
    void emit(const Bin& bin);

    Config config_;
    const Clock& clock_;
    std::shared_ptr<AverageWriter> writer_;
    std::deque<Bin> bins_;
    Counter late_events_;
    Counter future_events_;
    Counter emitted_;
};

} // namespace sensorflow
