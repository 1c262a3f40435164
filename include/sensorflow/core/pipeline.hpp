#pragma once

/**
 * @file pipeline.hpp
 * @brief Composition of stages into pipelines and attachment of sinks
 */

#include <memory>
#include <vector>

#include "sensorflow/core/sink.hpp"
#include "sensorflow/core/stage.hpp"

namespace sensorflow {

class PipelineWithSink;

/**
 * @brief Ordered chain of stages
 *
 * A pipeline is a value: combining returns a new pipeline and leaves both
 * operands untouched. The chain is kept flat, so combine() is associative
 * by construction. The stages themselves are shared, which is how their
 * counters stay readable after a run.
 */
class Pipeline {
public:
    /**
     * @brief The identity pipeline (passes every event through)
     */
    Pipeline() = default;

    explicit Pipeline(std::shared_ptr<Stage> stage);

    /**
     * @brief Pipeline whose output is `stage` applied to this one's output
     */
    [[nodiscard]] Pipeline combine(std::shared_ptr<Stage> stage) const;

    /**
     * @brief Pipeline whose output is `other` applied to this one's output
     */
    [[nodiscard]] Pipeline combine(const Pipeline& other) const;

    /**
     * @brief Wrap a source stream with every stage, first to last
     *
     * Nothing is pulled until the returned stream is.
     */
    [[nodiscard]] std::unique_ptr<EventStream> handle(std::unique_ptr<EventStream> events) const;

    /**
     * @brief Attach a terminal sink
     */
    [[nodiscard]] PipelineWithSink sink(std::shared_ptr<Sink> sink) const;

    [[nodiscard]] const std::vector<std::shared_ptr<Stage>>& stages() const noexcept {
        return stages_;
    }

    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }

private:
    std::vector<std::shared_ptr<Stage>> stages_;
};

/**
 * @brief Compose two stages into a pipeline
 */
[[nodiscard]] Pipeline combine(std::shared_ptr<Stage> first, std::shared_ptr<Stage> second);

/**
 * @brief A pipeline terminated by a sink
 */
class PipelineWithSink {
public:
    PipelineWithSink(Pipeline pipeline, std::shared_ptr<Sink> sink);

    /**
     * @brief Run one pass: pull the source through the pipeline into the sink
     */
    void handle(std::unique_ptr<EventStream> events) const;

    [[nodiscard]] const Pipeline& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const std::shared_ptr<Sink>& sink() const noexcept { return sink_; }

private:
    Pipeline pipeline_;
    std::shared_ptr<Sink> sink_;
};

} // namespace sensorflow
