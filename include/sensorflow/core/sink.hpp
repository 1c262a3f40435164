#pragma once

/**
 * @file sink.hpp
 * @brief Terminal consumers of a pipeline and the multi-sink tee
 */

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "sensorflow/core/metrics.hpp"
#include "sensorflow/core/stream.hpp"

namespace sensorflow {

class ParallelSink;

/**
 * @brief Base class for pipeline sinks
 *
 * A sink owns its aggregation state exclusively. handle() consumes one
 * full pass of a stream and then calls finish().
 */
class Sink {
public:
    explicit Sink(std::string name)
        : name_(std::move(name)) {}

    virtual ~Sink() = default;

    Sink(const Sink&) = delete;
    Sink& operator=(const Sink&) = delete;

    /**
     * @brief Consume a single event
     */
    virtual void consume(const Event& event) = 0;

    /**
     * @brief Called once after the last event of a pass
     */
    virtual void finish() {}

    /**
     * @brief Pull the stream to exhaustion, consuming every element
     */
    virtual void handle(EventStream& events);

    /**
     * @brief Combine sinks so that each receives every event of one pass
     */
    static std::shared_ptr<ParallelSink> parallel(std::vector<std::shared_ptr<Sink>> sinks);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint64_t consumed_count() const noexcept { return consumed_.value(); }

protected:
    void record_consumed() noexcept { consumed_.increment(); }

private:
    std::string name_;
    Counter consumed_;
};

/**
 * @brief Fan-out sink that tees one upstream pass into every member
 *
 * handle() runs each member sink on its own thread, reading from a private
 * bounded queue. The calling thread pulls the upstream stream exactly once
 * and pushes a copy of every event into each member's queue, so stage
 * counters upstream are never multiplied by the number of sinks.
 *
 * A slow member applies backpressure to the shared pump once its queue
 * fills, but never sees another member's state. A member that throws is
 * detached from the pump (its queue is closed) while the others keep
 * receiving events; the first captured failure is rethrown once every
 * member has finished.
 */
class ParallelSink : public Sink {
public:
    explicit ParallelSink(std::vector<std::shared_ptr<Sink>> sinks);

    /**
     * @brief Deliver an event synchronously to every member
     */
    void consume(const Event& event) override;

    void finish() override;

    void handle(EventStream& events) override;

    [[nodiscard]] const std::vector<std::shared_ptr<Sink>>& sinks() const noexcept {
        return sinks_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<Sink>> sinks_;
};

} // namespace sensorflow
