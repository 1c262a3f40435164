#pragma once

/**
 * @file metrics.hpp
 * @brief Counters kept by stages and sinks
 */

#include <atomic>
#include <cstdint>

namespace sensorflow {

/**
 * @brief Counter metric (monotonically increasing)
 *
 * Readable from any thread while the owning stage or sink is running.
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Per-stage flow statistics
 */
struct StageStats {
    std::uint64_t events_received{0};
    std::uint64_t events_emitted{0};
    std::uint64_t events_dropped{0};
};

} // namespace sensorflow
