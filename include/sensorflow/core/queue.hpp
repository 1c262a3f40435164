#pragma once

/**
 * @file queue.hpp
 * @brief Bounded, closable channel carrying events between threads
 */

#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

#include "sensorflow/core/event.hpp"

namespace sensorflow {

/**
 * @brief Channel statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_blocked_count{0};
    std::uint64_t rejected_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Bounded FIFO of events with blocking backpressure
 *
 * A ring buffer guarded by a mutex and two condition variables. Producers
 * block while the buffer is full; consumers block while it is empty. Once
 * closed, pushes are rejected and pops drain what is left before reporting
 * end of stream.
 *
 * @tparam Capacity Static capacity (must be a power of 2)
 */
template<std::size_t Capacity = 1024>
class BoundedQueue {
    static_assert(Capacity > 0, "Capacity must be positive");
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

public:
    BoundedQueue() = default;

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /**
     * @brief Append an event, waiting for space if the queue is full
     * @return false if the queue was closed before the event could be stored
     */
    bool push(Event event) {
        std::unique_lock<std::mutex> lock(mutex_);

        while (size_ == Capacity && !closed_) {
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }

        if (closed_) {
            stats_.rejected_count++;
            return false;
        }

        store(std::move(event));

        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Append an event only if there is room right now
     */
    bool try_push(Event event) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_ || size_ == Capacity) {
            stats_.rejected_count++;
            return false;
        }

        store(std::move(event));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest event, waiting while the queue is open and empty
     * @return nullopt once the queue is closed and drained
     */
    std::optional<Event> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        not_empty_.wait(lock, [this] { return size_ > 0 || closed_; });

        if (size_ == 0) {
            return std::nullopt;
        }

        Event event = take();

        lock.unlock();
        not_full_.notify_one();
        return event;
    }

    /**
     * @brief Remove the oldest event without waiting
     */
    std::optional<Event> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (size_ == 0) {
            return std::nullopt;
        }

        Event event = take();
        not_full_.notify_one();
        return event;
    }

    /**
     * @brief Reject further pushes and wake every waiter
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == 0;
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == Capacity;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity;
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.capacity = Capacity;
        s.current_size = size_;
        return s;
    }

private:
    // Caller holds mutex_ and has checked for space
    void store(Event event) {
        buffer_[tail_] = std::move(event);
        tail_ = (tail_ + 1) & (Capacity - 1);
        size_++;
        stats_.push_count++;
        if (size_ > stats_.high_watermark) {
            stats_.high_watermark = size_;
        }
    }

    // Caller holds mutex_ and has checked size_ > 0
    Event take() {
        Event event = std::move(buffer_[head_]);
        head_ = (head_ + 1) & (Capacity - 1);
        size_--;
        stats_.pop_count++;
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

    std::array<Event, Capacity> buffer_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
    bool closed_{false};

    QueueStats stats_;
};

/**
 * @brief Per-sink buffer used by the fan-out tee
 */
using Queue = BoundedQueue<4096>;

} // namespace sensorflow
