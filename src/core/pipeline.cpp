/**
 * @file pipeline.cpp
 * @brief Pipeline composition
 */

#include "sensorflow/core/pipeline.hpp"

#include <stdexcept>

namespace sensorflow {

namespace {

std::shared_ptr<Stage> require(std::shared_ptr<Stage> stage) {
    if (!stage) {
        throw std::invalid_argument("Pipeline stage must not be null");
    }
    return stage;
}

} // namespace

Pipeline::Pipeline(std::shared_ptr<Stage> stage) {
    stages_.push_back(require(std::move(stage)));
}

Pipeline Pipeline::combine(std::shared_ptr<Stage> stage) const {
    Pipeline combined(*this);
    combined.stages_.push_back(require(std::move(stage)));
    return combined;
}

Pipeline Pipeline::combine(const Pipeline& other) const {
    Pipeline combined(*this);
    combined.stages_.insert(combined.stages_.end(), other.stages_.begin(), other.stages_.end());
    return combined;
}

std::unique_ptr<EventStream> Pipeline::handle(std::unique_ptr<EventStream> events) const {
    for (const auto& stage : stages_) {
        events = stage->apply(std::move(events));
    }
    return events;
}

PipelineWithSink Pipeline::sink(std::shared_ptr<Sink> sink) const {
    return PipelineWithSink(*this, std::move(sink));
}

Pipeline combine(std::shared_ptr<Stage> first, std::shared_ptr<Stage> second) {
    return Pipeline(std::move(first)).combine(std::move(second));
}

PipelineWithSink::PipelineWithSink(Pipeline pipeline, std::shared_ptr<Sink> sink)
    : pipeline_(std::move(pipeline))
    , sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("Pipeline sink must not be null");
    }
}

void PipelineWithSink::handle(std::unique_ptr<EventStream> events) const {
    auto filtered = pipeline_.handle(std::move(events));
    sink_->handle(*filtered);
}

} // namespace sensorflow
