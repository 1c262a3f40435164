/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for sensorflow stages and sinks
 */

#include <benchmark/benchmark.h>
#include <optional>
#include <vector>

#include "sensorflow/sensorflow.hpp"

using namespace sensorflow;

namespace {

std::vector<Location> grid(std::size_t count) {
    std::vector<Location> locations;
    locations.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        locations.push_back(Location{"loc-" + std::to_string(i), static_cast<double>(i % 100),
                                     static_cast<double>(i / 100)});
    }
    return locations;
}

std::vector<Event> feed(std::size_t count, std::size_t locations, TimestampMs start) {
    std::vector<Event> events;
    events.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        events.emplace_back("loc-" + std::to_string(i % locations), "evt-" + std::to_string(i),
                            start + static_cast<TimestampMs>(i), 1.0 + static_cast<double>(i % 7));
    }
    return events;
}

/**
 * @brief Endless stream in which every id arrives twice in a row
 */
class RepeatingStream : public EventStream {
public:
    std::optional<Event> next() override {
        const std::uint64_t n = position_++ / 2;
        return Event{"loc-0", "evt-" + std::to_string(n), static_cast<TimestampMs>(n), 1.0};
    }

private:
    std::uint64_t position_{0};
};

void quiet() {
    log::logger()->set_level(spdlog::level::warn);
}

} // namespace

static void BM_QueuePushPop(benchmark::State& state) {
    BoundedQueue<4096> queue;
    const Event event{"loc-0", "evt-0", 0, 1.0};

    for (auto _ : state) {
        queue.push(event);
        auto result = queue.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPop);

static void BM_Deduplication(benchmark::State& state) {
    quiet();
    ManualClock clock(0);
    DeduplicationStage stage(std::chrono::milliseconds(state.range(0)), clock);
    auto stream = stage.apply(std::make_unique<RepeatingStream>());

    for (auto _ : state) {
        clock.advance(std::chrono::milliseconds(1));
        auto event = stream->next();
        benchmark::DoNotOptimize(event);
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["cache"] = static_cast<double>(stage.cache_size());
}
BENCHMARK(BM_Deduplication)->Arg(100)->Arg(10'000)->Arg(1'000'000);

static void BM_LocationFilter(benchmark::State& state) {
    quiet();
    const auto locations = grid(static_cast<std::size_t>(state.range(0)));
    auto stage = std::make_shared<LocationFilterStage>(locations);
    const auto events = feed(4096, locations.size() * 2, 0);

    for (auto _ : state) {
        auto stream = stage->apply(std::make_unique<VectorEventStream>(events));
        auto admitted = drain(*stream);
        benchmark::DoNotOptimize(admitted);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(events.size()));
}
BENCHMARK(BM_LocationFilter)->Arg(10)->Arg(1000);

static void BM_WindowedAverager(benchmark::State& state) {
    quiet();
    ManualClock clock(0);
    WindowedAverager::Config config;
    config.averaging_period = std::chrono::milliseconds(state.range(0));
    config.expiry = std::chrono::seconds(30);
    WindowedAverager averager("bench", config, clock);

    TimestampMs now = 0;
    for (auto _ : state) {
        clock.set(++now);
        averager.consume(Event{"loc-0", "evt", now, 2.0});
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["bins"] = static_cast<double>(averager.bins().size());
}
BENCHMARK(BM_WindowedAverager)->Arg(10)->Arg(1000);

static void BM_SpatialAverager(benchmark::State& state) {
    quiet();
    const auto locations = grid(1000);
    SpatialAverager averager("bench", locations);
    const auto events = feed(4096, locations.size(), 0);

    std::size_t i = 0;
    for (auto _ : state) {
        averager.consume(events[i++ & 4095]);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SpatialAverager);

static void BM_MonitorPipeline(benchmark::State& state) {
    quiet();
    const auto locations = grid(100);
    const auto count = static_cast<std::size_t>(state.range(0));
    // Every third id repeats and every tenth location is unknown
    auto events = feed(count, locations.size() + locations.size() / 10, 0);
    for (std::size_t i = 2; i < events.size(); i += 3) {
        events[i] = events[i - 1];
    }

    ManualClock clock(static_cast<TimestampMs>(count));
    MonitorConfig config;
    config.run_time = std::chrono::hours(1);

    for (auto _ : state) {
        state.PauseTiming();
        Monitor monitor(config, locations, clock);
        auto source = std::make_unique<VectorEventStream>(events);
        state.ResumeTiming();

        auto summary = monitor.run(std::move(source));
        benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(count));
}
BENCHMARK(BM_MonitorPipeline)->Arg(10'000)->Arg(100'000);

BENCHMARK_MAIN();
