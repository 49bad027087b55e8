#include "memory/sensory_buffer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <unordered_set>

namespace vita {

SensoryBuffer::SensoryBuffer(const SensoryConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : defaultClock()) {
    if (config_.capacity == 0) {
        throw ConfigurationError("sensory buffer capacity must be positive");
    }
}

bool SensoryBuffer::isExpired(const Entry& entry, double now) const {
    return config_.ttl_seconds > 0.0 && now - entry.entered_at > config_.ttl_seconds;
}

void SensoryBuffer::purgeExpiredLocked() {
    double now = clock_->now();
    while (!entries_.empty() && isExpired(entries_.front(), now)) {
        entries_.pop_front();
        expired_++;
    }
}

size_t SensoryBuffer::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();
    return std::count_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return !isExpired(e, now); });
}

void SensoryBuffer::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

void SensoryBuffer::push(const Event& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    purgeExpiredLocked();
    if (entries_.size() >= config_.capacity) {
        entries_.pop_front();
        evicted_++;
    }
    entries_.push_back(Entry{next_seq_++, clock_->now(), event});
    added_++;
}

PromotionBatch SensoryBuffer::peekPromotable(double threshold_intensity,
                                             int repetition_threshold) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();
    PromotionBatch batch;

    // Pass 1: high-salience entries promote individually
    std::map<std::string, std::vector<const Entry*>> groups;
    for (const auto& entry : entries_) {
        if (isExpired(entry, now)) continue;
        if (std::abs(entry.event.intensity()) >= threshold_intensity) {
            batch.events.push_back(entry.event);
            batch.consumed.push_back(entry.seq);
        } else {
            groups[entry.event.type()].push_back(&entry);
        }
    }

    // Pass 2: repeated types promote once, as their latest occurrence
    std::vector<const std::vector<const Entry*>*> ready;
    for (const auto& [type, members] : groups) {
        if (static_cast<int>(members.size()) >= repetition_threshold) {
            ready.push_back(&members);
        }
    }
    std::sort(ready.begin(), ready.end(), [](const auto* a, const auto* b) {
        return a->back()->seq < b->back()->seq;
    });
    for (const auto* members : ready) {
        const Entry* latest = members->back();
        batch.events.push_back(latest->event.withMetadata(
            "repetitions", std::to_string(members->size())));
        for (const Entry* e : *members) batch.consumed.push_back(e->seq);
    }

    return batch;
}

void SensoryBuffer::acknowledge(const PromotionBatch& batch) {
    if (batch.consumed.empty()) return;
    std::unordered_set<uint64_t> consumed(batch.consumed.begin(), batch.consumed.end());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto removed = std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return consumed.count(e.seq) > 0; });
    entries_.erase(removed, entries_.end());
    promoted_ += batch.events.size();
    spdlog::debug("sensory: promoted {} events, {} entries consumed",
                  batch.events.size(), batch.consumed.size());
}

std::vector<Event> SensoryBuffer::drainPromotable(double threshold_intensity,
                                                  int repetition_threshold) {
    PromotionBatch batch = peekPromotable(threshold_intensity, repetition_threshold);
    acknowledge(batch);
    return batch.events;
}

std::vector<Event> SensoryBuffer::peekEvents(size_t max) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();
    std::vector<Event> out;
    for (const auto& entry : entries_) {
        if (isExpired(entry, now)) continue;
        out.push_back(entry.event);
        if (max > 0 && out.size() >= max) break;
    }
    return out;
}

std::vector<Event> SensoryBuffer::takeEvents(size_t max) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    purgeExpiredLocked();
    size_t n = (max == 0) ? entries_.size() : std::min(max, entries_.size());
    std::vector<Event> out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) out.push_back(entries_[i].event);
    entries_.erase(entries_.begin(), entries_.begin() + n);
    return out;
}

SensoryTypeStats SensoryBuffer::typeStats(const std::string& event_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();
    SensoryTypeStats stats;
    double total = 0.0;
    for (const auto& entry : entries_) {
        if (isExpired(entry, now) || entry.event.type() != event_type) continue;
        stats.count++;
        total += entry.event.intensity();
        stats.max_abs_intensity = std::max(stats.max_abs_intensity,
                                           std::abs(entry.event.intensity()));
    }
    if (stats.count > 0) stats.mean_intensity = total / stats.count;
    return stats;
}

nlohmann::json SensoryBuffer::status() const {
    size_t live = size();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {
        {"size", live},
        {"capacity", config_.capacity},
        {"utilization", static_cast<double>(live) / config_.capacity},
        {"ttl_seconds", config_.ttl_seconds},
        {"total_added", added_},
        {"total_evicted", evicted_},
        {"total_expired", expired_},
        {"total_promoted", promoted_},
    };
}

uint64_t SensoryBuffer::totalAdded() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return added_;
}

uint64_t SensoryBuffer::totalEvicted() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return evicted_;
}

uint64_t SensoryBuffer::totalExpired() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return expired_;
}

uint64_t SensoryBuffer::totalPromoted() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return promoted_;
}

} // namespace vita
