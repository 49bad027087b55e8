#pragma once

#include "meaning/action_pattern.hpp"

#include <map>
#include <string>

namespace vita {

class Event;
struct SelfState;

/// Interpretation of one event against the current state.
/// `impact` holds raw deltas; the tick engine scales them by the pattern.
struct Meaning {
    ActionPattern pattern = ActionPattern::IGNORE;
    std::map<std::string, double> impact;
    double significance = 0.0;
};

// ─── MeaningEngine ─────────────────────────────────────────────
// Collaborator that appraises events. Implementations must not
// mutate the state.

class MeaningEngine {
public:
    virtual ~MeaningEngine() = default;
    virtual Meaning interpret(const Event& event, const SelfState& state) const = 0;
};

} // namespace vita
