/**
 * @file pipeline_test.cpp
 * @brief Unit tests for stage composition and sink attachment
 */

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace sensorflow;
using namespace sensorflow::testing;

namespace {

/**
 * @brief Keeps events whose id does not start with a given prefix
 */
class DropPrefixStage : public FilterStage {
public:
    explicit DropPrefixStage(std::string prefix)
        : FilterStage("drop_" + prefix)
        , prefix_(std::move(prefix)) {}

protected:
    bool admit(const Event& event) override {
        return event.event_id().rfind(prefix_, 0) != 0;
    }

private:
    std::string prefix_;
};

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    std::vector<Event> events() const {
        return {
            reading("a1"), reading("b1"), reading("c1"), reading("a2"),
            reading("d1"), reading("b2"), reading("c2"), reading("e1")
        };
    }

    std::shared_ptr<Stage> drop_a_ = std::make_shared<DropPrefixStage>("a");
    std::shared_ptr<Stage> drop_b_ = std::make_shared<DropPrefixStage>("b");
    std::shared_ptr<Stage> drop_c_ = std::make_shared<DropPrefixStage>("c");
};

TEST_F(PipelineTest, IdentityPassesEverything) {
    Pipeline identity;
    EXPECT_TRUE(identity.empty());

    auto out = identity.handle(std::make_unique<VectorEventStream>(events()));
    EXPECT_EQ(ids_of(drain(*out)), ids_of(events()));
}

TEST_F(PipelineTest, CombineAppliesStagesInOrderAndPreservesOrder) {
    auto pipeline = combine(drop_a_, drop_b_);
    ASSERT_EQ(pipeline.stages().size(), 2u);
    EXPECT_EQ(pipeline.stages()[0], drop_a_);
    EXPECT_EQ(pipeline.stages()[1], drop_b_);

    auto out = pipeline.handle(std::make_unique<VectorEventStream>(events()));
    EXPECT_EQ(ids_of(drain(*out)), (std::vector<std::string>{"c1", "d1", "c2", "e1"}));
}

TEST_F(PipelineTest, CombineIsAssociative) {
    auto left = combine(drop_a_, drop_b_).combine(drop_c_);
    auto right = Pipeline(drop_a_).combine(combine(drop_b_, drop_c_));

    EXPECT_EQ(left.stages(), right.stages());

    auto left_out = drain(*left.handle(std::make_unique<VectorEventStream>(events())));
    auto right_out = drain(*right.handle(std::make_unique<VectorEventStream>(events())));
    EXPECT_EQ(left_out, right_out);
    EXPECT_EQ(ids_of(left_out), (std::vector<std::string>{"d1", "e1"}));
}

TEST_F(PipelineTest, CombineLeavesOperandsUntouched) {
    Pipeline base(drop_a_);
    auto extended = base.combine(drop_b_);

    EXPECT_EQ(base.stages().size(), 1u);
    EXPECT_EQ(extended.stages().size(), 2u);
}

TEST_F(PipelineTest, HandleIsLazy) {
    auto source = std::make_unique<CountingStream>(events());
    auto* source_ptr = source.get();

    auto out = combine(drop_a_, drop_b_).handle(std::move(source));
    EXPECT_EQ(source_ptr->pulls(), 0u);

    // a1 and b1 are dropped on the way to c1
    auto first = out->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->event_id(), "c1");
    EXPECT_EQ(source_ptr->pulls(), 3u);
}

TEST_F(PipelineTest, StageStatsTrackFlow) {
    auto out = Pipeline(drop_a_).handle(std::make_unique<VectorEventStream>(events()));
    drain(*out);

    EXPECT_EQ(drop_a_->stats().events_received, 8u);
    EXPECT_EQ(drop_a_->stats().events_emitted, 6u);
    EXPECT_EQ(drop_a_->stats().events_dropped, 2u);
}

TEST_F(PipelineTest, SinkReceivesFilteredStream) {
    auto sink = std::make_shared<RecordingSink>();

    combine(drop_a_, drop_c_).sink(sink).handle(std::make_unique<VectorEventStream>(events()));

    EXPECT_EQ(ids_of(sink->events), (std::vector<std::string>{"b1", "d1", "b2", "e1"}));
    EXPECT_EQ(sink->finished, 1);
    EXPECT_EQ(sink->consumed_count(), 4u);
}

TEST_F(PipelineTest, RejectsNullStageAndSink) {
    EXPECT_THROW(Pipeline(nullptr), std::invalid_argument);
    EXPECT_THROW(Pipeline(drop_a_).combine(std::shared_ptr<Stage>()), std::invalid_argument);
    EXPECT_THROW(Pipeline(drop_a_).sink(nullptr), std::invalid_argument);
}
