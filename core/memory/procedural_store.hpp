#pragma once

#include "common/attributes.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "memory/memory_store.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace vita {

struct ProceduralAction {
    std::string action_type;
    Attributes params;

    bool operator==(const ProceduralAction& o) const {
        return action_type == o.action_type && params == o.params;
    }
};

// ─── Procedural Pattern ────────────────────────────────────────
// A learned action sequence with its trigger conditions and execution
// history. Automation level rises with sustained success and falls
// with failure; only highly automated patterns run without a decision.

struct ProceduralPattern {
    std::string pattern_id;
    std::string name;
    std::string description;
    std::vector<ProceduralAction> action_sequence;
    Attributes trigger_conditions;
    int success_count = 0;
    int failure_count = 0;
    int total_executions = 0;
    double success_rate = 0.0;
    double automation_level = 0.0;
    double min_automation_threshold = 0.8;
    double average_execution_time = 0.0;
    double created_at = 0.0;
    double last_execution = 0.0;       // 0: never executed
    double last_success = 0.0;

    /// 0.5*success_rate + 0.3*automation + 0.2*min(1, executions/10).
    /// Zero for a pattern that never ran.
    double effectiveness() const;

    /// Automated, and every trigger condition equals the context's value.
    bool canAutomate(const Attributes& context) const;

    /// Fold one execution into the counters and derived metrics.
    void recordExecution(double execution_time, bool success, double now);

    /// Recompute success_rate from counts and step automation_level.
    void updateMetrics();

    bool operator==(const ProceduralPattern& o) const;
};

struct DecisionPattern {
    std::string pattern_id;
    Attributes conditions;
    std::string decision;
    std::string outcome;
    double confidence = 0.5;
    int usage_count = 0;

    /// Fraction of condition keys matched by `current`; 0 for no conditions.
    double matches(const Attributes& current) const { return conditionMatch(conditions, current); }

    bool operator==(const DecisionPattern& o) const {
        return pattern_id == o.pattern_id && conditions == o.conditions &&
               decision == o.decision && outcome == o.outcome &&
               confidence == o.confidence && usage_count == o.usage_count;
    }
};

struct PatternExecution {
    std::string pattern_id;
    bool success = false;
    bool automated = false;
    double execution_time = 0.0;
    std::vector<ProceduralAction> actions;
    std::string error;
};

/// Runs one action of an automated sequence. Returning false or
/// throwing marks the execution failed.
using ActionExecutor = std::function<bool(const ProceduralAction&, const Attributes&)>;

// ─── Procedural Store ──────────────────────────────────────────
// Highest tier: pattern library plus decision associations.

class ProceduralStore : public MemoryStore {
public:
    explicit ProceduralStore(const ProceduralConfig& config = {},
                             std::shared_ptr<Clock> clock = defaultClock());

    MemoryLevel level() const override { return MemoryLevel::PROCEDURAL; }
    size_t size() const override { return patternCount(); }
    void clear() override;

    void setExecutor(ActionExecutor executor);

    /// Insert a pattern, or merge its counts into an existing id.
    void addPattern(const ProceduralPattern& pattern);

    std::optional<ProceduralPattern> getPattern(const std::string& pattern_id) const;
    std::vector<ProceduralPattern> patterns() const;
    std::vector<DecisionPattern> decisionPatterns() const;
    size_t patternCount() const;
    size_t decisionPatternCount() const;

    /// Patterns with relevance > 0, best first (ties by id).
    std::vector<std::pair<ProceduralPattern, double>> findApplicablePatterns(
        const Attributes& context) const;

    /// Run the top-ranked pattern if it may be automated in `context`.
    /// nullopt means no automatic action: defer to the decision layer.
    std::optional<PatternExecution> executeBestPattern(const Attributes& context);

    /// Record an experience as a fresh pattern plus a decision pattern.
    /// Returns the new pattern id.
    std::string learnFromExperience(const Attributes& context,
                                    const std::vector<ProceduralAction>& actions,
                                    const std::string& outcome, bool success);

    void addDecisionPattern(const DecisionPattern& pattern);

    /// Decision of the best-matching decision pattern above the match threshold.
    std::optional<std::string> getDecisionRecommendation(const Attributes& conditions) const;

    /// Remove weak patterns, decay failing ones, merge duplicates.
    /// Returns the number of patterns touched.
    virtual int optimizePatterns();

    /// Replace the whole store content (deserialization).
    void restore(const std::vector<ProceduralPattern>& patterns,
                 const std::vector<DecisionPattern>& decisions);

    nlohmann::json statistics() const;

private:
    double relevance(const ProceduralPattern& pattern, const Attributes& context,
                     double now) const;
    std::string nextId(const std::string& prefix);

    ProceduralConfig config_;
    std::shared_ptr<Clock> clock_;
    ActionExecutor executor_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, ProceduralPattern> patterns_;
    std::map<std::string, DecisionPattern> decisions_;
    uint64_t id_counter_ = 0;
    uint64_t automated_executions_ = 0;
    uint64_t manual_executions_ = 0;
};

nlohmann::json patternToJson(const ProceduralPattern& pattern);
ProceduralPattern patternFromJson(const nlohmann::json& j);
nlohmann::json decisionToJson(const DecisionPattern& decision);
DecisionPattern decisionFromJson(const nlohmann::json& j);

} // namespace vita
