#include "memory/procedural_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <set>

namespace vita {

// ─── ProceduralPattern ─────────────────────────────────────────

double ProceduralPattern::effectiveness() const {
    if (total_executions == 0) return 0.0;
    double experience = std::min(1.0, total_executions / 10.0);
    return 0.5 * success_rate + 0.3 * automation_level + 0.2 * experience;
}

bool ProceduralPattern::canAutomate(const Attributes& context) const {
    if (automation_level < min_automation_threshold) return false;
    return conditionsSatisfied(trigger_conditions, context);
}

void ProceduralPattern::updateMetrics() {
    int attempts = success_count + failure_count;
    if (attempts > 0) {
        success_rate = static_cast<double>(success_count) / attempts;
    }
    if (success_rate > 0.9 && total_executions >= 5) {
        automation_level = std::min(1.0, automation_level + 0.1);
    } else if (success_rate < 0.5) {
        automation_level = std::max(0.0, automation_level - 0.1);
    }
}

void ProceduralPattern::recordExecution(double execution_time, bool success, double now) {
    if (average_execution_time == 0.0) {
        average_execution_time = execution_time;
    } else {
        average_execution_time = 0.1 * execution_time + 0.9 * average_execution_time;
    }
    total_executions++;
    if (success) {
        success_count++;
        last_success = now;
    } else {
        failure_count++;
    }
    last_execution = now;
    updateMetrics();
}

bool ProceduralPattern::operator==(const ProceduralPattern& o) const {
    return pattern_id == o.pattern_id && name == o.name && description == o.description &&
           action_sequence == o.action_sequence && trigger_conditions == o.trigger_conditions &&
           success_count == o.success_count && failure_count == o.failure_count &&
           total_executions == o.total_executions && success_rate == o.success_rate &&
           automation_level == o.automation_level &&
           min_automation_threshold == o.min_automation_threshold &&
           average_execution_time == o.average_execution_time &&
           created_at == o.created_at && last_execution == o.last_execution &&
           last_success == o.last_success;
}

// ─── ProceduralStore ───────────────────────────────────────────

namespace {

std::vector<std::string> actionTypes(const ProceduralPattern& p) {
    std::vector<std::string> types;
    for (const auto& a : p.action_sequence) types.push_back(a.action_type);
    return types;
}

/// Stable key for a condition set; decision patterns with the same
/// conditions replace each other.
std::string conditionKey(const Attributes& conditions) {
    std::string key;
    for (const auto& [k, v] : conditions) {
        key += k;
        key += '=';
        key += v;
        key += ';';
    }
    return key;
}

} // namespace

ProceduralStore::ProceduralStore(const ProceduralConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : defaultClock()) {}

void ProceduralStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_.clear();
    decisions_.clear();
    automated_executions_ = 0;
    manual_executions_ = 0;
}

void ProceduralStore::setExecutor(ActionExecutor executor) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    executor_ = std::move(executor);
}

std::string ProceduralStore::nextId(const std::string& prefix) {
    std::string id;
    do {
        id = prefix + "_" + std::to_string(++id_counter_);
    } while (patterns_.count(id) || decisions_.count(id));
    return id;
}

void ProceduralStore::addPattern(const ProceduralPattern& pattern) {
    if (pattern.pattern_id.empty()) {
        throw InvalidArgumentError("pattern id must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = patterns_.find(pattern.pattern_id);
    if (it != patterns_.end()) {
        auto& existing = it->second;
        existing.success_count += pattern.success_count;
        existing.failure_count += pattern.failure_count;
        existing.total_executions += pattern.total_executions;
        existing.updateMetrics();
        spdlog::debug("procedural: merged into pattern '{}'", pattern.pattern_id);
        return;
    }

    ProceduralPattern p = pattern;
    if (p.created_at == 0.0) p.created_at = clock_->now();
    patterns_.emplace(p.pattern_id, std::move(p));
    spdlog::debug("procedural: added pattern '{}' (automation {:.2f})",
                  pattern.pattern_id, pattern.automation_level);
}

std::optional<ProceduralPattern> ProceduralStore::getPattern(const std::string& pattern_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = patterns_.find(pattern_id);
    if (it == patterns_.end()) return std::nullopt;
    return it->second;
}

std::vector<ProceduralPattern> ProceduralStore::patterns() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ProceduralPattern> out;
    for (const auto& [id, p] : patterns_) out.push_back(p);
    return out;
}

std::vector<DecisionPattern> ProceduralStore::decisionPatterns() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DecisionPattern> out;
    for (const auto& [key, d] : decisions_) out.push_back(d);
    return out;
}

size_t ProceduralStore::patternCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

size_t ProceduralStore::decisionPatternCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return decisions_.size();
}

double ProceduralStore::relevance(const ProceduralPattern& pattern, const Attributes& context,
                                  double now) const {
    double match = conditionMatch(pattern.trigger_conditions, context);
    double recency = 1.0;
    if (pattern.last_execution > 0.0) {
        double hours = std::max(0.0, now - pattern.last_execution) / 3600.0;
        recency = std::pow(0.9, hours);
    }
    return 0.4 * match + 0.4 * pattern.effectiveness() + 0.2 * recency;
}

std::vector<std::pair<ProceduralPattern, double>> ProceduralStore::findApplicablePatterns(
        const Attributes& context) const {
    double now = clock_->now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<ProceduralPattern, double>> ranked;
    for (const auto& [id, p] : patterns_) {
        double r = relevance(p, context, now);
        if (r > 0.0) ranked.emplace_back(p, r);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first.pattern_id < b.first.pattern_id;
    });
    return ranked;
}

std::optional<PatternExecution> ProceduralStore::executeBestPattern(const Attributes& context) {
    auto ranked = findApplicablePatterns(context);
    if (ranked.empty()) return std::nullopt;

    const ProceduralPattern& best = ranked.front().first;
    ActionExecutor executor;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!best.canAutomate(context)) {
            manual_executions_++;
            return std::nullopt;
        }
        automated_executions_++;
        executor = executor_;
    }

    // Run outside the lock: executors may query the store
    PatternExecution exec;
    exec.pattern_id = best.pattern_id;
    exec.automated = true;
    exec.success = true;
    auto start = std::chrono::steady_clock::now();
    for (const auto& action : best.action_sequence) {
        if (!executor) {
            exec.actions.push_back(action);
            continue;
        }
        try {
            if (!executor(action, context)) {
                exec.success = false;
                exec.error = "action '" + action.action_type + "' reported failure";
                break;
            }
            exec.actions.push_back(action);
        } catch (const std::exception& e) {
            exec.success = false;
            exec.error = "action '" + action.action_type + "' threw: " + e.what();
            break;
        }
    }
    exec.execution_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = patterns_.find(exec.pattern_id);
        if (it != patterns_.end()) {
            it->second.recordExecution(exec.execution_time, exec.success, clock_->now());
        }
    }

    if (exec.success) {
        spdlog::debug("procedural: automated '{}' ({} actions)", exec.pattern_id, exec.actions.size());
    } else {
        spdlog::warn("procedural: automated '{}' failed: {}", exec.pattern_id, exec.error);
    }
    return exec;
}

std::string ProceduralStore::learnFromExperience(const Attributes& context,
                                                 const std::vector<ProceduralAction>& actions,
                                                 const std::string& outcome, bool success) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();

    ProceduralPattern p;
    p.pattern_id = nextId("pattern");
    p.name = std::string("learned from ") + (success ? "successful" : "failed") + " experience";
    p.description = "outcome: " + outcome;
    p.action_sequence = actions;
    p.trigger_conditions = context;
    p.min_automation_threshold = config_.min_automation_threshold;
    p.total_executions = 1;
    if (success) {
        p.success_count = 1;
        p.success_rate = 1.0;
        p.automation_level = config_.initial_success_automation;
        p.last_success = now;
    } else {
        p.failure_count = 1;
        p.automation_level = config_.initial_failure_automation;
    }
    p.created_at = now;
    p.last_execution = now;
    std::string id = p.pattern_id;
    patterns_.emplace(id, std::move(p));

    // Decision association for the same conditions
    std::string key = conditionKey(context);
    DecisionPattern d;
    d.pattern_id = "decision_" + key;
    d.conditions = context;
    d.decision = actions.empty() ? "unknown" : actions.front().action_type;
    d.outcome = outcome;
    d.confidence = success ? 0.8 : 0.3;
    auto prev = decisions_.find(key);
    d.usage_count = prev != decisions_.end() ? prev->second.usage_count + 1 : 1;
    decisions_[key] = d;

    return id;
}

void ProceduralStore::addDecisionPattern(const DecisionPattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    decisions_[conditionKey(pattern.conditions)] = pattern;
}

std::optional<std::string> ProceduralStore::getDecisionRecommendation(
        const Attributes& conditions) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const DecisionPattern* best = nullptr;
    double best_score = 0.0;
    for (const auto& [key, d] : decisions_) {
        double score = d.matches(conditions);
        if (score > best_score && score > config_.decision_match_threshold) {
            best_score = score;
            best = &d;
        }
    }
    if (!best) return std::nullopt;
    return best->decision;
}

int ProceduralStore::optimizePatterns() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::set<std::string> touched;

    // 1. Remove weak, rarely used patterns; decay failing ones
    for (auto it = patterns_.begin(); it != patterns_.end();) {
        auto& p = it->second;
        if (p.effectiveness() < config_.removal_effectiveness &&
            p.total_executions < config_.removal_min_executions) {
            touched.insert(it->first);
            it = patterns_.erase(it);
            continue;
        }
        if (p.success_rate < config_.decay_success_rate && p.automation_level > 0.2) {
            p.automation_level = std::max(0.0, p.automation_level - 0.1);
            touched.insert(it->first);
        }
        ++it;
    }

    // 2. Merge duplicates (same action types, same triggers) into the oldest
    std::vector<ProceduralPattern*> ordered;
    for (auto& [id, p] : patterns_) ordered.push_back(&p);
    std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->pattern_id < b->pattern_id;
    });

    std::vector<std::string> merged_away;
    std::set<std::string> absorbed;
    for (size_t i = 0; i < ordered.size(); i++) {
        ProceduralPattern* keep = ordered[i];
        if (absorbed.count(keep->pattern_id)) continue;
        auto types = actionTypes(*keep);
        bool changed = false;
        for (size_t j = i + 1; j < ordered.size(); j++) {
            ProceduralPattern* dup = ordered[j];
            if (absorbed.count(dup->pattern_id)) continue;
            if (dup->trigger_conditions != keep->trigger_conditions ||
                actionTypes(*dup) != types) {
                continue;
            }
            keep->success_count += dup->success_count;
            keep->failure_count += dup->failure_count;
            keep->total_executions += dup->total_executions;
            keep->last_execution = std::max(keep->last_execution, dup->last_execution);
            keep->last_success = std::max(keep->last_success, dup->last_success);
            absorbed.insert(dup->pattern_id);
            merged_away.push_back(dup->pattern_id);
            touched.insert(dup->pattern_id);
            changed = true;
        }
        if (changed) {
            keep->updateMetrics();
            touched.insert(keep->pattern_id);
        }
    }
    for (const auto& id : merged_away) patterns_.erase(id);

    int count = static_cast<int>(touched.size());
    if (count > 0) {
        spdlog::info("procedural: optimized {} patterns ({} remain)", count, patterns_.size());
    }
    return count;
}

void ProceduralStore::restore(const std::vector<ProceduralPattern>& patterns,
                              const std::vector<DecisionPattern>& decisions) {
    std::map<std::string, ProceduralPattern> p_map;
    for (const auto& p : patterns) p_map[p.pattern_id] = p;
    std::map<std::string, DecisionPattern> d_map;
    for (const auto& d : decisions) d_map[conditionKey(d.conditions)] = d;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_ = std::move(p_map);
    decisions_ = std::move(d_map);
}

nlohmann::json ProceduralStore::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    uint64_t total = automated_executions_ + manual_executions_;
    double avg_eff = 0.0;
    size_t automated_patterns = 0;
    for (const auto& [id, p] : patterns_) {
        avg_eff += p.effectiveness();
        if (p.automation_level >= p.min_automation_threshold) automated_patterns++;
    }
    if (!patterns_.empty()) avg_eff /= patterns_.size();
    return {
        {"total_patterns", patterns_.size()},
        {"total_decision_patterns", decisions_.size()},
        {"automated_patterns", automated_patterns},
        {"automated_executions", automated_executions_},
        {"manual_executions", manual_executions_},
        {"automation_rate", total > 0 ? static_cast<double>(automated_executions_) / total : 0.0},
        {"average_pattern_effectiveness", avg_eff},
    };
}

// ─── JSON ──────────────────────────────────────────────────────

nlohmann::json patternToJson(const ProceduralPattern& p) {
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& a : p.action_sequence) {
        actions.push_back({{"action_type", a.action_type}, {"params", a.params}});
    }
    return {
        {"pattern_id", p.pattern_id},
        {"name", p.name},
        {"description", p.description},
        {"action_sequence", actions},
        {"trigger_conditions", p.trigger_conditions},
        {"success_count", p.success_count},
        {"failure_count", p.failure_count},
        {"total_executions", p.total_executions},
        {"success_rate", p.success_rate},
        {"automation_level", p.automation_level},
        {"min_automation_threshold", p.min_automation_threshold},
        {"average_execution_time", p.average_execution_time},
        {"created_at", p.created_at},
        {"last_execution", p.last_execution},
        {"last_success", p.last_success},
    };
}

ProceduralPattern patternFromJson(const nlohmann::json& j) {
    ProceduralPattern p;
    p.pattern_id = j.at("pattern_id").get<std::string>();
    p.name = j.value("name", std::string());
    p.description = j.value("description", std::string());
    if (j.contains("action_sequence")) {
        for (const auto& a : j.at("action_sequence")) {
            p.action_sequence.push_back({a.at("action_type").get<std::string>(),
                                         a.value("params", Attributes{})});
        }
    }
    p.trigger_conditions = j.value("trigger_conditions", Attributes{});
    p.success_count = j.value("success_count", 0);
    p.failure_count = j.value("failure_count", 0);
    p.total_executions = j.value("total_executions", 0);
    p.success_rate = j.value("success_rate", 0.0);
    p.automation_level = j.value("automation_level", 0.0);
    p.min_automation_threshold = j.value("min_automation_threshold", 0.8);
    p.average_execution_time = j.value("average_execution_time", 0.0);
    p.created_at = j.value("created_at", 0.0);
    p.last_execution = j.value("last_execution", 0.0);
    p.last_success = j.value("last_success", 0.0);
    return p;
}

nlohmann::json decisionToJson(const DecisionPattern& d) {
    return {
        {"pattern_id", d.pattern_id},
        {"conditions", d.conditions},
        {"decision", d.decision},
        {"outcome", d.outcome},
        {"confidence", d.confidence},
        {"usage_count", d.usage_count},
    };
}

DecisionPattern decisionFromJson(const nlohmann::json& j) {
    DecisionPattern d;
    d.pattern_id = j.at("pattern_id").get<std::string>();
    d.conditions = j.value("conditions", Attributes{});
    d.decision = j.value("decision", std::string());
    d.outcome = j.value("outcome", std::string());
    d.confidence = j.value("confidence", 0.5);
    d.usage_count = j.value("usage_count", 0);
    return d;
}

} // namespace vita
