#pragma once

/**
 * @file clock.hpp
 * @brief Wall-clock sources for time-dependent stages and sinks
 */

#include <atomic>
#include <chrono>
#include <limits>

#include "sensorflow/core/event.hpp"

namespace sensorflow {

/**
 * @brief time + offset, clamped to the representable range
 */
inline TimestampMs saturating_add(TimestampMs time, std::chrono::milliseconds offset) noexcept {
    constexpr TimestampMs max = std::numeric_limits<TimestampMs>::max();
    constexpr TimestampMs min = std::numeric_limits<TimestampMs>::min();
    const TimestampMs delta = offset.count();
    if (delta > 0 && time > max - delta) {
        return max;
    }
    if (delta < 0 && time < min - delta) {
        return min;
    }
    return time + delta;
}

/**
 * @brief Abstract wall clock
 *
 * Event timestamps and clock readings share the same epoch so that
 * retention and deduplication windows can compare them directly.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current time in milliseconds since the Unix epoch
     */
    [[nodiscard]] virtual TimestampMs now_ms() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock final : public Clock {
public:
    [[nodiscard]] TimestampMs now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    /**
     * @brief Process-wide instance
     */
    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

/**
 * @brief Manually driven clock for deterministic tests and replays
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimestampMs start = 0) noexcept
        : now_(start) {}

    [[nodiscard]] TimestampMs now_ms() const override {
        return now_.load(std::memory_order_acquire);
    }

    void set(TimestampMs now) noexcept {
        now_.store(now, std::memory_order_release);
    }

    void advance(std::chrono::milliseconds delta) noexcept {
        now_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<TimestampMs> now_;
};

} // namespace sensorflow
