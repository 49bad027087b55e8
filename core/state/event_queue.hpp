#pragma once

#include "state/event.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace vita {

// ─── Event Queue ───────────────────────────────────────────────
// Bounded input queue. The only cross-thread write path into the
// tick loop: producers push, the tick thread drains.

class EventQueue {
public:
    explicit EventQueue(size_t capacity = 100);

    /// Enqueue an event. Returns false (and counts a drop) when full.
    bool push(const Event& event);

    std::optional<Event> pop();

    /// Drain up to `max` events in FIFO order (0 drains everything).
    std::vector<Event> popAll(size_t max = 0);

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }
    uint64_t droppedCount() const;
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Event> events_;
    uint64_t dropped_ = 0;
};

} // namespace vita
