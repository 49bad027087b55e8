#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "feedback/feedback_record.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace vita {

struct SelfState;

/// An action waiting for its consequences to settle.
struct PendingAction {
    std::string action_id;
    ActionPattern action_pattern = ActionPattern::IGNORE;
    StateVitals state_before;
    double timestamp = 0.0;         // registration time
    int check_after_ticks = 0;
    int ticks_waited = 0;
    Attributes context;
    std::vector<std::string> associated_events;
};

struct FeedbackStats {
    uint64_t registered = 0;
    uint64_t resolved = 0;
    uint64_t suppressed = 0;     // resolved below the noise floor
    uint64_t timed_out = 0;
};

// ─── FeedbackTracker ──────────────────────────────────────────
// Delayed causal attribution. Each registered action waits a random
// number of ticks, then the change in vitals since registration is
// attributed to it.
//
// Per pending action, once per tick:
//   1. ticks_waited += 1
//   2. ticks_waited >= check_after_ticks: compute delta vs state_before
//      - max |delta| >= noise floor → emit FeedbackRecord
//      - otherwise drop silently (suppressed)
//   3. ticks_waited > timeout: drop (timed out)
//
// Tick-thread only; no locking.

class FeedbackTracker {
public:
    explicit FeedbackTracker(const FeedbackConfig& config = {},
                             std::shared_ptr<Clock> clock = defaultClock());
    FeedbackTracker(const FeedbackConfig& config, uint32_t seed,
                    std::shared_ptr<Clock> clock = defaultClock());

    /// Start tracking an action. Returns false and changes nothing when
    /// `action_id` is already pending.
    bool registerAction(const std::string& action_id, ActionPattern action_pattern,
                        const StateVitals& state_before, double timestamp,
                        const Attributes& context = {},
                        std::optional<int> check_after_ticks = std::nullopt);

    /// Note an event type against every pending action.
    void recordEvent(const std::string& event_type);

    /// Advance all pending actions by one tick and resolve the due ones,
    /// in registration order. Records are stamped with the resolution time.
    std::vector<FeedbackRecord> observeConsequences(const SelfState& current);

    size_t pendingCount() const { return pending_.size(); }
    bool isPending(const std::string& action_id) const;
    std::vector<PendingAction> pending() const { return pending_; }
    const FeedbackStats& stats() const { return stats_; }
    void clear() { pending_.clear(); }

private:
    FeedbackConfig config_;
    std::shared_ptr<Clock> clock_;
    std::mt19937 rng_;
    std::vector<PendingAction> pending_;
    FeedbackStats stats_;
};

} // namespace vita
