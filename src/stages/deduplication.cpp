/**
 * @file deduplication.cpp
 * @brief TTL deduplication cache
 */

#include "sensorflow/stages/deduplication.hpp"

#include <stdexcept>

#include "sensorflow/core/logging.hpp"

namespace sensorflow {

DeduplicationStage::DeduplicationStage(std::chrono::milliseconds ttl, const Clock& clock)
    : FilterStage("deduplication")
    , ttl_(ttl)
    , clock_(clock) {
    if (ttl_.count() < 0) {
        throw std::invalid_argument("Deduplication TTL must not be negative");
    }
}

void DeduplicationStage::evict_expired(TimestampMs now) {
    while (!expiry_queue_.empty() && now > expiry_queue_.front().expiry) {
        log::logger()->debug("Expiring deduplication record (Cache size: {})", id_cache_.size());
        id_cache_.erase(expiry_queue_.front().id);
        expiry_queue_.pop_front();
    }
}

bool DeduplicationStage::admit(const Event& event) {
    const TimestampMs now = clock_.now_ms();
    evict_expired(now);

    if (id_cache_.count(event.event_id()) > 0) {
        log::logger()->debug("Found duplicated event: {}", event.event_id());
        duplicates_.increment();
        return false;
    }

    id_cache_.insert(event.event_id());
    expiry_queue_.push_back(DeduplicationRecord{saturating_add(now, ttl_), event.event_id()});
    return true;
}

} // namespace sensorflow
