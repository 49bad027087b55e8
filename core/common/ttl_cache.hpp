#pragma once

#include "common/clock.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace vita {

// ─── TTL Cache ─────────────────────────────────────────────────
// Small memo table whose entries expire `ttl_seconds` after insertion
// according to an injected clock. Safe to share between threads.

template <typename Key, typename Value>
class TtlCache {
public:
    TtlCache(double ttl_seconds, std::shared_ptr<Clock> clock, size_t max_entries = 128)
        : ttl_seconds_(ttl_seconds), clock_(std::move(clock)), max_entries_(max_entries) {}

    std::optional<Value> get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (clock_->now() - it->second.inserted_at > ttl_seconds_) return std::nullopt;
        return it->second.value;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ttl_seconds_ <= 0.0) return;
        double now = clock_->now();
        if (entries_.size() >= max_entries_ && !entries_.count(key)) {
            evictExpired(now);
            if (entries_.size() >= max_entries_) entries_.erase(entries_.begin());
        }
        entries_[key] = Entry{std::move(value), now};
    }

    void invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        Value value;
        double inserted_at = 0.0;
    };

    void evictExpired(double now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.inserted_at > ttl_seconds_) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    double ttl_seconds_;
    std::shared_ptr<Clock> clock_;
    size_t max_entries_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
};

} // namespace vita
