/**
 * @file stage.cpp
 * @brief Filter stage stream
 */

#include "sensorflow/core/stage.hpp"

namespace sensorflow {

class FilterStage::FilteredStream : public EventStream {
public:
    FilteredStream(std::unique_ptr<EventStream> upstream, FilterStage& stage)
        : upstream_(std::move(upstream))
        , stage_(stage) {}

    std::optional<Event> next() override {
        while (auto event = upstream_->next()) {
            stage_.record_received();
            if (stage_.admit(*event)) {
                stage_.record_emitted();
                return event;
            }
            stage_.record_dropped();
        }
        return std::nullopt;
    }

private:
    std::unique_ptr<EventStream> upstream_;
    FilterStage& stage_;
};

std::unique_ptr<EventStream> FilterStage::apply(std::unique_ptr<EventStream> upstream) {
    return std::make_unique<FilteredStream>(std::move(upstream), *this);
}

} // namespace sensorflow
