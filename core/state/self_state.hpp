#pragma once

#include "feedback/feedback_record.hpp"
#include "memory/episodic_store.hpp"
#include "meaning/action_pattern.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <string>

namespace vita {

// ─── Self State ────────────────────────────────────────────────
// The organism's mutable root. Owned by the TickEngine and mutated
// only inside a tick; other threads see copies.

struct SelfState {
    static constexpr double MAX_ENERGY = 100.0;
    static constexpr size_t RECENT_EVENTS = 32;

    double energy = 100.0;
    double stability = 1.0;
    double integrity = 1.0;
    uint64_t ticks = 0;
    double age = 0.0;
    double subjective_time = 0.0;

    EpisodicMemory memory;
    uint64_t pending_actions = 0;   // mirrors FeedbackTracker::pendingCount()

    ActionPattern last_pattern = ActionPattern::IGNORE;
    double last_significance = 0.0;
    double last_event_intensity = 0.0;
    std::deque<std::string> recent_events;

    /// Add deltas and clamp. Fields: energy, stability, integrity, age,
    /// subjective_time. Unknown names throw InvalidArgumentError and
    /// leave the state untouched.
    void applyDelta(const std::map<std::string, double>& delta);

    StateVitals vitals() const { return {energy, stability, integrity}; }

    /// Remember an event type in the bounded recent list.
    void noteEvent(const std::string& event_type);

    /// Alive while both energy and integrity remain above zero.
    bool isAlive() const { return energy > 0.0 && integrity > 0.0; }
};

/// Full snapshot document, episodic memory included.
nlohmann::json selfStateToJson(const SelfState& state);
SelfState selfStateFromJson(const nlohmann::json& j);

} // namespace vita
