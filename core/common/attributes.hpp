#pragma once

#include <map>
#include <string>

namespace vita {

/// String key/value map used for event metadata, trigger conditions,
/// decision conditions, action parameters and query contexts.
/// Ordered so that serialization and equality are deterministic.
using Attributes = std::map<std::string, std::string>;

/// Fraction of `conditions` whose value equals the one in `context`.
/// Empty conditions match nothing.
inline double conditionMatch(const Attributes& conditions, const Attributes& context) {
    if (conditions.empty()) return 0.0;
    int matches = 0;
    for (const auto& [key, expected] : conditions) {
        auto it = context.find(key);
        if (it != context.end() && it->second == expected) matches++;
    }
    return static_cast<double>(matches) / conditions.size();
}

/// True when every condition is present in `context` with an equal value.
inline bool conditionsSatisfied(const Attributes& conditions, const Attributes& context) {
    for (const auto& [key, expected] : conditions) {
        auto it = context.find(key);
        if (it == context.end() || it->second != expected) return false;
    }
    return true;
}

} // namespace vita
