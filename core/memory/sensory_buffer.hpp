#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "memory/memory_store.hpp"
#include "state/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace vita {

/// Result of a non-destructive promotion scan. `consumed` lists the
/// sequence numbers that acknowledge() will remove.
struct PromotionBatch {
    std::vector<Event> events;
    std::vector<uint64_t> consumed;

    bool empty() const { return events.empty(); }
};

struct SensoryTypeStats {
    size_t count = 0;
    double mean_intensity = 0.0;
    double max_abs_intensity = 0.0;
};

// ─── Sensory Buffer ────────────────────────────────────────────
// Bounded ring of raw events, the lowest memory tier. Entries leave
// by eviction (oldest first), expiry (TTL) or promotion.

class SensoryBuffer : public MemoryStore {
public:
    explicit SensoryBuffer(const SensoryConfig& config = {},
                           std::shared_ptr<Clock> clock = defaultClock());

    MemoryLevel level() const override { return MemoryLevel::SENSORY; }
    size_t size() const override;
    void clear() override;
    bool empty() const { return size() == 0; }
    size_t capacity() const { return config_.capacity; }

    /// Append an event, evicting the oldest entry when full.
    void push(const Event& event);

    /// Scan for promotable events without removing anything.
    /// High-salience entries promote one by one; any event type with at
    /// least `repetition_threshold` remaining entries promotes once as
    /// its most recent occurrence, tagged with `repetitions`.
    PromotionBatch peekPromotable(double threshold_intensity,
                                  int repetition_threshold) const;

    /// Remove the entries a batch consumed. Already evicted ones are skipped.
    void acknowledge(const PromotionBatch& batch);

    /// peekPromotable + acknowledge.
    std::vector<Event> drainPromotable(double threshold_intensity,
                                       int repetition_threshold);

    /// Oldest-first copy of up to `max` live events (0 for all).
    std::vector<Event> peekEvents(size_t max = 0) const;

    /// Remove and return up to `max` live events, oldest first.
    std::vector<Event> takeEvents(size_t max = 0);

    SensoryTypeStats typeStats(const std::string& event_type) const;

    nlohmann::json status() const;

    uint64_t totalAdded() const;
    uint64_t totalEvicted() const;
    uint64_t totalExpired() const;
    uint64_t totalPromoted() const;

private:
    struct Entry {
        uint64_t seq;
        double entered_at;
        Event event;
    };

    /// Drop entries older than the TTL. Caller holds the unique lock.
    void purgeExpiredLocked();

    /// True when `entry` is older than the TTL at `now`.
    bool isExpired(const Entry& entry, double now) const;

    SensoryConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::deque<Entry> entries_;
    uint64_t next_seq_ = 1;
    uint64_t added_ = 0;
    uint64_t evicted_ = 0;
    uint64_t expired_ = 0;
    uint64_t promoted_ = 0;
};

} // namespace vita
