#pragma once

#include "common/errors.hpp"

#include <string>

namespace vita {

/// Response pattern chosen for an event. Closed set: every switch over
/// it is exhaustive.
enum class ActionPattern {
    IGNORE,
    DAMPEN,
    ABSORB,
    AMPLIFY
};

inline std::string toString(ActionPattern pattern) {
    switch (pattern) {
        case ActionPattern::IGNORE:  return "ignore";
        case ActionPattern::DAMPEN:  return "dampen";
        case ActionPattern::ABSORB:  return "absorb";
        case ActionPattern::AMPLIFY: return "amplify";
    }
    return "ignore";
}

/// Throws InvalidArgumentError for names outside the closed set.
inline ActionPattern parseActionPattern(const std::string& name) {
    if (name == "ignore") return ActionPattern::IGNORE;
    if (name == "dampen") return ActionPattern::DAMPEN;
    if (name == "absorb") return ActionPattern::ABSORB;
    if (name == "amplify") return ActionPattern::AMPLIFY;
    throw InvalidArgumentError("unknown action pattern: " + name);
}

/// Multiplier applied to a meaning's impact before it reaches SelfState.
inline double impactScale(ActionPattern pattern) {
    switch (pattern) {
        case ActionPattern::IGNORE:  return 0.0;
        case ActionPattern::DAMPEN:  return 0.5;
        case ActionPattern::ABSORB:  return 1.0;
        case ActionPattern::AMPLIFY: return 1.5;
    }
    return 0.0;
}

} // namespace vita
