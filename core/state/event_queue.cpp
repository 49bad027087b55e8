#include "state/event_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vita {

EventQueue::EventQueue(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

bool EventQueue::push(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        dropped_++;
        spdlog::warn("event queue full ({}), dropping '{}' event", capacity_, event.type());
        return false;
    }
    events_.push_back(event);
    return true;
}

std::optional<Event> EventQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;
    Event e = events_.front();
    events_.pop_front();
    return e;
}

std::vector<Event> EventQueue::popAll(size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = (max == 0) ? events_.size() : std::min(max, events_.size());
    std::vector<Event> out(events_.begin(), events_.begin() + n);
    events_.erase(events_.begin(), events_.begin() + n);
    return out;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace vita
