/**
 * @file sink.cpp
 * @brief Sink pass driver and the parallel tee
 */

#include "sensorflow/core/sink.hpp"

#include <stdexcept>
#include <thread>

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

void Sink::handle(EventStream& events) {
    while (auto event = events.next()) {
        consume(*event);
        record_consumed();
    }
    finish();
}

std::shared_ptr<ParallelSink> Sink::parallel(std::vector<std::shared_ptr<Sink>> sinks) {
    return std::make_shared<ParallelSink>(std::move(sinks));
}

ParallelSink::ParallelSink(std::vector<std::shared_ptr<Sink>> sinks)
    : Sink("parallel")
    , sinks_(std::move(sinks)) {
    for (const auto& sink : sinks_) {
        if (!sink) {
            throw std::invalid_argument("ParallelSink member must not be null");
        }
    }
}

void ParallelSink::consume(const Event& event) {
    for (auto& sink : sinks_) {
        sink->consume(event);
    }
}

void ParallelSink::finish() {
    for (auto& sink : sinks_) {
        sink->finish();
    }
}

void ParallelSink::handle(EventStream& events) {
    const std::size_t n = sinks_.size();

    std::vector<std::shared_ptr<Queue>> queues;
    std::vector<std::exception_ptr> failures(n);
    std::vector<std::thread> workers;
    queues.reserve(n);
    workers.reserve(n);

    for (std::size_t i = 0; i < n; i++) {
        queues.push_back(std::make_shared<Queue>());
    }

    auto close_and_join = [&]() {
        for (auto& queue : queues) {
            queue->close();
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    try {
        for (std::size_t i = 0; i < n; i++) {
            workers.emplace_back([this, i, &queues, &failures]() {
                QueueEventStream stream(queues[i]);
                try {
                    sinks_[i]->handle(stream);
                } catch (...) {
                    failures[i] = std::current_exception();
                    // Stop the pump from waiting on a queue nobody reads
                    queues[i]->close();
                }
            });
        }

        while (auto event = events.next()) {
            record_consumed();
            for (auto& queue : queues) {
                // A closed queue belongs to a failed member; skip it
                queue->push(*event);
            }
        }
    } catch (...) {
        // Covers a worker that failed to start as well as a throwing upstream
        close_and_join();
        throw;
    }

    close_and_join();

    std::exception_ptr first;
    for (std::size_t i = 0; i < n; i++) {
        if (!failures[i]) {
            continue;
        }
        try {
            std::rethrow_exception(failures[i]);
        } catch (const std::exception& e) {
            log::logger()->error("Sink '{}' failed: {}", sinks_[i]->name(), e.what());
        }
        if (!first) {
            first = failures[i];
        }
    }

    if (first) {
        std::rethrow_exception(first);
    }
}

} // namespace sensorflow
