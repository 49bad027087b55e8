#pragma once

#include <chrono>
#include <memory>

namespace vita {

// ─── Clock ─────────────────────────────────────────────────────
// Seconds since the Unix epoch as a double. Injected everywhere time
// matters so tests can drive TTLs, recency and intervals by hand.

class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class SystemClock : public Clock {
public:
    double now() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }
};

/// Manually advanced clock for tests and replay.
class ManualClock : public Clock {
public:
    explicit ManualClock(double start = 1000.0) : now_(start) {}

    double now() const override { return now_; }
    void advance(double seconds) { now_ += seconds; }
    void set(double t) { now_ = t; }

private:
    double now_;
};

/// Shared default used when a component is constructed without a clock.
inline std::shared_ptr<Clock> defaultClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace vita
