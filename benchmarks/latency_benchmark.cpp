/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for sensorflow pipelines
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <unordered_set>
#include <vector>

#include "sensorflow/sensorflow.hpp"

using namespace sensorflow;

namespace {

/**
 * @brief Sink that only counts, so timing reflects the pipeline itself
 */
class CountingSink : public Sink {
public:
    CountingSink() : Sink("counting") {}

    void consume(const Event& /*event*/) override { count_++; }

    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

private:
    std::uint64_t count_{0};
};

std::vector<Event> feed(std::size_t count) {
    std::vector<Event> events;
    events.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        events.emplace_back("loc-" + std::to_string(i % 8), "evt-" + std::to_string(i),
                            static_cast<TimestampMs>(i), 1.0);
    }
    return events;
}

} // namespace

static void BM_PipelineDepthLatency(benchmark::State& state) {
    log::logger()->set_level(spdlog::level::warn);
    const int depth = static_cast<int>(state.range(0));
    const auto events = feed(1000);

    std::unordered_set<LocationId> known;
    for (int i = 0; i < 8; i++) {
        known.insert("loc-" + std::to_string(i));
    }

    ManualClock clock(0);

    for (auto _ : state) {
        state.PauseTiming();
        Pipeline pipeline;
        for (int i = 0; i < depth; i++) {
            pipeline = pipeline.combine(std::make_shared<LocationFilterStage>(known));
        }
        pipeline = pipeline.combine(std::make_shared<DeduplicationStage>(std::chrono::seconds(30), clock));
        auto sink = std::make_shared<CountingSink>();
        auto source = std::make_unique<VectorEventStream>(events);
        state.ResumeTiming();

        auto start = std::chrono::high_resolution_clock::now();
        pipeline.sink(sink).handle(std::move(source));
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e6);
        auto consumed = sink->count();
        benchmark::DoNotOptimize(consumed);
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_PipelineDepthLatency)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseManualTime();

static void BM_ParallelSinkLatency(benchmark::State& state) {
    log::logger()->set_level(spdlog::level::warn);
    const auto members = static_cast<std::size_t>(state.range(0));
    const auto events = feed(10'000);

    for (auto _ : state) {
        state.PauseTiming();
        std::vector<std::shared_ptr<Sink>> sinks;
        for (std::size_t i = 0; i < members; i++) {
            sinks.push_back(std::make_shared<CountingSink>());
        }
        auto parallel = Sink::parallel(std::move(sinks));
        VectorEventStream source(events);
        state.ResumeTiming();

        auto start = std::chrono::high_resolution_clock::now();
        parallel->handle(source);
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * 10'000);
}
BENCHMARK(BM_ParallelSinkLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

BENCHMARK_MAIN();
