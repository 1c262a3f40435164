#pragma once

/**
 * @file deduplication.hpp
 * @brief Stage that drops events whose id was seen within a time-to-live
 */

#include <chrono>
#include <deque>
#include <unordered_set>

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/stage.hpp"

namespace sensorflow {

/**
 * @brief Cache entry: when an admitted id stops counting as seen
 */
struct DeduplicationRecord {
    TimestampMs expiry;
    EventId id;
};

/**
 * @brief Time-bounded deduplication cache
 *
 * For every event, records whose expiry is strictly before the current
 * time are evicted first, then the id is tested against the live set.
 * Admitted ids are remembered until now + ttl.
 *
 * The TTL is constant, so records enter the expiry queue in non-decreasing
 * expiry order and eviction only ever inspects the front. The live set
 * holds exactly the ids of the records still in the queue.
 *
 * The cache is private to this stage and is not meant to be shared across
 * concurrently pulled streams.
 */
class DeduplicationStage : public FilterStage {
public:
    /**
     * @throws std::invalid_argument if ttl is negative
     */
    explicit DeduplicationStage(std::chrono::milliseconds ttl, const Clock& clock = SystemClock::instance());

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

    [[nodiscard]] std::uint64_t duplicate_events_ignored() const noexcept { return duplicates_.value(); }

    /**
     * @brief Number of ids currently remembered
     */
    [[nodiscard]] std::size_t cache_size() const noexcept { return id_cache_.size(); }

    [[nodiscard]] bool contains(const EventId& id) const { return id_cache_.count(id) > 0; }

    [[nodiscard]] const std::deque<DeduplicationRecord>& expiry_queue() const noexcept {
        return expiry_queue_;
    }

protected:
    bool admit(const Event& event) override;

private:
    void evict_expired(TimestampMs now);

    std::chrono::milliseconds ttl_;
    const Clock& clock_;
    std::deque<DeduplicationRecord> expiry_queue_;
    std::unordered_set<EventId> id_cache_;
    Counter duplicates_;
};

} // namespace sensorflow
