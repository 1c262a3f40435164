/**
 * @file parallel_sink_test.cpp
 * @brief Unit tests for the multi-sink tee
 */

#include <gtest/gtest.h>
#include <thread>

#include "test_support.hpp"

using namespace sensorflow;
using namespace sensorflow::testing;

namespace {

class ThrowingSink : public Sink {
public:
    explicit ThrowingSink(std::size_t fail_at)
        : Sink("throwing")
        , fail_at_(fail_at) {}

    void consume(const Event& /*event*/) override {
        if (++seen_ == fail_at_) {
            throw std::runtime_error("sink exploded");
        }
    }

private:
    std::size_t fail_at_;
    std::size_t seen_{0};
};

class SlowSink : public RecordingSink {
public:
    SlowSink() : RecordingSink("slow") {}

    void consume(const Event& event) override {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        RecordingSink::consume(event);
    }
};

class FailingSource : public EventStream {
public:
    explicit FailingSource(std::size_t fail_after)
        : fail_after_(fail_after) {}

    std::optional<Event> next() override {
        if (produced_ == fail_after_) {
            throw std::runtime_error("receiver lost");
        }
        return reading("e" + std::to_string(produced_++));
    }

private:
    std::size_t fail_after_;
    std::size_t produced_{0};
};

std::vector<Event> numbered(int count) {
    std::vector<Event> events;
    events.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; i++) {
        events.push_back(reading("e" + std::to_string(i), i, 1.0, i % 5 == 0 ? "bad" : "good"));
    }
    return events;
}

} // namespace

class ParallelSinkTest : public ::testing::Test {};

TEST_F(ParallelSinkTest, EveryMemberSeesEveryEventInOrder) {
    auto a = std::make_shared<RecordingSink>("a");
    auto b = std::make_shared<RecordingSink>("b");
    auto parallel = Sink::parallel({a, b});
    EXPECT_EQ(parallel->size(), 2u);

    VectorEventStream events(numbered(100));
    parallel->handle(events);

    EXPECT_EQ(ids_of(a->events), ids_of(numbered(100)));
    EXPECT_EQ(ids_of(b->events), ids_of(numbered(100)));
    EXPECT_EQ(a->finished, 1);
    EXPECT_EQ(b->finished, 1);
}

TEST_F(ParallelSinkTest, PullsUpstreamOnce) {
    auto a = std::make_shared<RecordingSink>("a");
    auto b = std::make_shared<RecordingSink>("b");
    auto c = std::make_shared<RecordingSink>("c");

    CountingStream events(numbered(50));
    Sink::parallel({a, b, c})->handle(events);

    EXPECT_EQ(events.delivered(), 50u);
    EXPECT_EQ(events.pulls(), 51u);
}

TEST_F(ParallelSinkTest, StageCountersAreNotMultiplied) {
    auto filter = std::make_shared<LocationFilterStage>(std::unordered_set<LocationId>{"good"});
    auto a = std::make_shared<RecordingSink>("a");
    auto b = std::make_shared<RecordingSink>("b");

    Pipeline(filter).sink(Sink::parallel({a, b}))
        .handle(std::make_unique<VectorEventStream>(numbered(100)));

    EXPECT_EQ(filter->invalid_events_filtered(), 20u);
    EXPECT_EQ(filter->stats().events_received, 100u);
    EXPECT_EQ(a->events.size(), 80u);
    EXPECT_EQ(b->events.size(), 80u);
}

TEST_F(ParallelSinkTest, SlowMemberStillReceivesEverythingPastQueueCapacity) {
    const int count = static_cast<int>(Queue::capacity()) * 2 + 17;
    auto fast = std::make_shared<RecordingSink>("fast");
    auto slow = std::make_shared<SlowSink>();

    VectorEventStream events(numbered(count));
    Sink::parallel({fast, slow})->handle(events);

    EXPECT_EQ(fast->events.size(), static_cast<std::size_t>(count));
    EXPECT_EQ(slow->events.size(), static_cast<std::size_t>(count));
    EXPECT_EQ(ids_of(slow->events), ids_of(fast->events));
}

TEST_F(ParallelSinkTest, FailingMemberDoesNotStarveOthers) {
    const int count = static_cast<int>(Queue::capacity()) + 500;
    auto healthy = std::make_shared<RecordingSink>("healthy");
    auto failing = std::make_shared<ThrowingSink>(3);

    VectorEventStream events(numbered(count));
    EXPECT_THROW(Sink::parallel({failing, healthy})->handle(events), std::runtime_error);

    EXPECT_EQ(healthy->events.size(), static_cast<std::size_t>(count));
    EXPECT_EQ(healthy->finished, 1);
}

TEST_F(ParallelSinkTest, UpstreamFailureStopsMembersCleanly) {
    auto a = std::make_shared<RecordingSink>("a");
    auto b = std::make_shared<RecordingSink>("b");
    FailingSource events(10);

    try {
        Sink::parallel({a, b})->handle(events);
        FAIL() << "Expected the upstream failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "receiver lost");
    }

    // Workers were joined after draining what had been pushed
    EXPECT_EQ(a->events.size(), 10u);
    EXPECT_EQ(b->events.size(), 10u);
    EXPECT_EQ(a->finished, 1);
    EXPECT_EQ(b->finished, 1);
}

TEST_F(ParallelSinkTest, SynchronousConsumeFansOut) {
    auto a = std::make_shared<RecordingSink>("a");
    auto b = std::make_shared<RecordingSink>("b");
    auto parallel = Sink::parallel({a, b});

    parallel->consume(reading("x"));
    parallel->finish();

    EXPECT_EQ(a->events.size(), 1u);
    EXPECT_EQ(b->events.size(), 1u);
    EXPECT_EQ(a->finished, 1);
}

TEST_F(ParallelSinkTest, RejectsNullMember) {
    EXPECT_THROW(Sink::parallel({std::make_shared<RecordingSink>(), nullptr}), std::invalid_argument);
}
