#pragma once

#include "common/attributes.hpp"
#include "meaning/action_pattern.hpp"

#include <map>
#include <string>
#include <vector>

namespace vita {

/// The three vital fields that feedback compares.
struct StateVitals {
    double energy = 0.0;
    double stability = 0.0;
    double integrity = 0.0;
};

/// Consequence of a past action, attributed after its observation delay.
/// Produced once per resolved PendingAction and never mutated afterwards.
struct FeedbackRecord {
    std::string action_id;
    ActionPattern action_pattern = ActionPattern::IGNORE;
    std::map<std::string, double> state_delta;   // energy / stability / integrity
    int delay_ticks = 0;
    std::vector<std::string> associated_events;
    Attributes context;
    double timestamp = 0.0;

    double delta(const std::string& field) const {
        auto it = state_delta.find(field);
        return it != state_delta.end() ? it->second : 0.0;
    }

    bool operator==(const FeedbackRecord& o) const {
        return action_id == o.action_id && action_pattern == o.action_pattern &&
               state_delta == o.state_delta && delay_ticks == o.delay_ticks &&
               associated_events == o.associated_events && context == o.context &&
               timestamp == o.timestamp;
    }
};

} // namespace vita
