#include "meaning/meaning_engine.hpp"
#include "state/event.hpp"
#include "state/self_state.hpp"

#include <algorithm>
#include <cmath>

namespace vita {

DefaultMeaningEngine::DefaultMeaningEngine()
    : type_weights_{
          {"shock", 1.5},
          {"noise", 0.5},
          {"recovery", 1.0},
          {"decay", 1.0},
          {"idle", 0.2},
      },
      base_impacts_{
          {"shock",    {{"energy", -1.5}, {"stability", -0.10}, {"integrity", -0.05}}},
          {"noise",    {{"energy", -0.3}, {"stability", -0.02}, {"integrity", 0.0}}},
          {"recovery", {{"energy", 1.0},  {"stability", 0.05},  {"integrity", 0.02}}},
          {"decay",    {{"energy", -0.5}, {"stability", -0.01}, {"integrity", -0.01}}},
          {"idle",     {{"energy", -0.1}, {"stability", 0.0},   {"integrity", 0.0}}},
      } {}

double DefaultMeaningEngine::appraise(const Event& event, const SelfState& state) const {
    auto it = type_weights_.find(event.type());
    double weight = it != type_weights_.end() ? it->second : 1.0;
    double significance = std::abs(event.intensity()) * weight;

    if (state.integrity < 0.3) significance *= 1.5;
    if (state.stability < 0.5) significance *= 1.2;

    return std::max(0.0, std::min(1.0, significance));
}

std::map<std::string, double> DefaultMeaningEngine::impactModel(const Event& event,
                                                                double significance) const {
    std::map<std::string, double> impact = {{"energy", 0.0}, {"stability", 0.0}, {"integrity", 0.0}};
    auto it = base_impacts_.find(event.type());
    if (it == base_impacts_.end()) return impact;

    double scale = std::abs(event.intensity()) * significance;
    for (const auto& [field, base] : it->second) {
        impact[field] = base * scale;
    }
    return impact;
}

ActionPattern DefaultMeaningEngine::responsePattern(double significance,
                                                    const SelfState& state) const {
    if (significance < IGNORE_BELOW) return ActionPattern::IGNORE;
    if (state.stability > 0.8) return ActionPattern::DAMPEN;
    if (state.stability < 0.3) return ActionPattern::AMPLIFY;
    return ActionPattern::ABSORB;
}

Meaning DefaultMeaningEngine::interpret(const Event& event, const SelfState& state) const {
    Meaning m;
    m.significance = appraise(event, state);
    m.pattern = responsePattern(m.significance, state);
    m.impact = impactModel(event, m.significance);
    return m;
}

void DefaultMeaningEngine::setTypeWeight(const std::string& event_type, double weight) {
    type_weights_[event_type] = weight;
}

} // namespace vita
