#pragma once

/**
 * @file stream.hpp
 * @brief Pull-driven event sequences
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "sensorflow/core/event.hpp"
#include "sensorflow/core/queue.hpp"

namespace sensorflow {

/**
 * @brief Lazy, single-pass sequence of events
 *
 * Each call to next() computes at most the next element. An exhausted
 * stream keeps returning nullopt.
 */
class EventStream {
public:
    virtual ~EventStream() = default;

    /**
     * @brief Produce the next event
     * @return nullopt once the stream has ended
     */
    virtual std::optional<Event> next() = 0;
};

/**
 * @brief Stream over an in-memory list of events
 */
class VectorEventStream : public EventStream {
public:
    explicit VectorEventStream(std::vector<Event> events)
        : events_(std::move(events)) {}

    std::optional<Event> next() override {
        if (position_ >= events_.size()) {
            return std::nullopt;
        }
        return events_[position_++];
    }

    /**
     * @brief Number of events handed out so far
     */
    [[nodiscard]] std::size_t pulled() const noexcept { return position_; }

private:
    std::vector<Event> events_;
    std::size_t position_{0};
};

/**
 * @brief Stream that drains a queue until it is closed and empty
 */
class QueueEventStream : public EventStream {
public:
    explicit QueueEventStream(std::shared_ptr<Queue> queue)
        : queue_(std::move(queue)) {}

    std::optional<Event> next() override {
        return queue_->pop();
    }

private:
    std::shared_ptr<Queue> queue_;
};

/**
 * @brief Pull every remaining element of a stream into a vector
 */
inline std::vector<Event> drain(EventStream& stream) {
    std::vector<Event> events;
    while (auto event = stream.next()) {
        events.push_back(std::move(*event));
    }
    return events;
}

} // namespace sensorflow
