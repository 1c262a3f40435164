/**
 * @file windowed_averager.cpp
 * @brief Time-bucketed moving average
 */

#include "sensorflow/sinks/windowed_averager.hpp"

#include <numeric>
#include <stdexcept>

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

Average Bin::average() const {
    double value = 0.0;
    if (!values.empty()) {
        value = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }
    return Average{start, end, value};
}

WindowedAverager::WindowedAverager(std::string name, Config config, const Clock& clock,
                                   std::shared_ptr<AverageWriter> writer)
    : Sink(std::move(name))
    , config_(config)
    , clock_(clock)
    , writer_(std::move(writer)) {
    if (config_.averaging_period.count() <= 0) {
        throw std::invalid_argument("Averaging period must be positive");
    }
    if (config_.expiry.count() <= 0) {
        throw std::invalid_argument("Expiry time must be positive");
    }
    if (config_.max_lead.count() < 0) {
        throw std::invalid_argument("Maximum lead must not be negative");
    }
    if (config_.expiry < config_.averaging_period) {
        log::logger()->warn("Expiry ({} ms) is shorter than the averaging period ({} ms); "
                            "bins may retire before covering a full period",
                            config_.expiry.count(), config_.averaging_period.count());
    }

    const TimestampMs seed = saturating_add(clock_.now_ms(), -config_.expiry);
    bins_.push_back(Bin{seed, seed, {}});
}

void WindowedAverager::consume(const Event& event) {
    add_to_bin(event);
    if (auto expired = maybe_expire_first_bin()) {
        emit(*expired);
    }
}

bool WindowedAverager::add_to_bin(const Event& event) {
    const TimestampMs timestamp = event.timestamp();

    if (timestamp < bins_.front().start) {
        log::logger()->debug("Not averaging old event at timestamp {}", timestamp);
        late_events_.increment();
        return false;
    }

    if (timestamp > saturating_add(clock_.now_ms(), config_.max_lead)) {
        log::logger()->warn("Not averaging event {} at timestamp {}: more than {} ms ahead of the clock",
                            event.event_id(), timestamp, config_.max_lead.count());
        future_events_.increment();
        return false;
    }

    const TimestampMs period = config_.averaging_period.count();
    while (timestamp >= bins_.back().end) {
        const TimestampMs last_end = bins_.back().end;
        log::logger()->debug("Adding new bin to deal with event at timestamp {} "
                             "(Current last bin is {} to {})",
                             timestamp, bins_.back().start, last_end);
        bins_.push_back(Bin{last_end, last_end + period, {}});
    }

    // Every bin but the zero-width seed spans one period, so count back
    // from the newest bin to find the one holding the timestamp
    const auto from_back = static_cast<std::size_t>((bins_.back().end - 1 - timestamp) / period);
    Bin& bin = bins_[bins_.size() - 1 - from_back];
    bin.values.push_back(event.value());
    return true;
}

std::optional<Bin> WindowedAverager::maybe_expire_first_bin() {
    const TimestampMs horizon = saturating_add(clock_.now_ms(), -config_.expiry);
    if (horizon <= bins_.front().end) {
        return std::nullopt;
    }

    if (bins_.size() == 1) {
        // Keep the sequence non-empty and contiguous
        const TimestampMs last_end = bins_.back().end;
        bins_.push_back(Bin{last_end, last_end + config_.averaging_period.count(), {}});
    }

    Bin expired = std::move(bins_.front());
    bins_.pop_front();
    return expired;
}

std::vector<Average> WindowedAverager::open_averages() const {
    std::vector<Average> averages;
    for (const auto& bin : bins_) {
        if (!bin.empty()) {
            averages.push_back(bin.average());
        }
    }
    return averages;
}

void WindowedAverager::emit(const Bin& bin) {
    if (bin.start == bin.end) {
        log::logger()->debug("Retiring seed bin ending at {}", bin.end);
        return;
    }
    if (bin.empty() && !config_.emit_empty_bins) {
        log::logger()->debug("Skipping empty bin {} to {}", bin.start, bin.end);
        return;
    }

    const Average average = bin.average();
    log::logger()->info("Average value for {} to {} is {}", average.start, average.end, average.value);

    if (writer_) {
        writer_->write(average);
    }
    emitted_.increment();
}

} // namespace sensorflow
