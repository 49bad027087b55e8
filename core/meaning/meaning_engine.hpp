#pragma once

#include "meaning/meaning.hpp"

#include <map>
#include <string>

namespace vita {

// ─── DefaultMeaningEngine ──────────────────────────────────────
// Appraisal → impact → response.
//
//   significance = |intensity| * type_weight, boosted when the organism
//                  is damaged (integrity < 0.3) or unsettled
//                  (stability < 0.5), clamped to [0,1]
//   impact       = base delta for the type * |intensity| * significance
//   response     = ignore below 0.1 significance, otherwise chosen
//                  from stability: dampen (> 0.8), amplify (< 0.3),
//                  absorb in between

class DefaultMeaningEngine : public MeaningEngine {
public:
    static constexpr double IGNORE_BELOW = 0.1;

    DefaultMeaningEngine();

    Meaning interpret(const Event& event, const SelfState& state) const override;

    double appraise(const Event& event, const SelfState& state) const;
    std::map<std::string, double> impactModel(const Event& event, double significance) const;
    ActionPattern responsePattern(double significance, const SelfState& state) const;

    /// Override the weight of one event type (unknown types weigh 1.0).
    void setTypeWeight(const std::string& event_type, double weight);

private:
    std::map<std::string, double> type_weights_;
    std::map<std::string, std::map<std::string, double>> base_impacts_;
};

} // namespace vita
