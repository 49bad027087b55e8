#include "memory/hierarchy_manager.hpp"
#include "runtime/structured_log.hpp"
#include "state/self_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>

namespace vita {

namespace {

constexpr size_t DEFAULT_QUERY_LIMIT = 10;

/// Parse `params[key]` as a positive integer; absent keys give `fallback`.
size_t positiveParam(const Attributes& params, const std::string& key, size_t fallback) {
    auto it = params.find(key);
    if (it == params.end()) return fallback;
    const std::string& text = it->second;
    long long value = 0;
    size_t consumed = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidArgumentError("query parameter '" + key + "' must be an integer, got '" +
                                   text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidArgumentError("query parameter '" + key + "' must be an integer, got '" +
                                   text + "'");
    }
    if (value <= 0) {
        throw InvalidArgumentError("query parameter '" + key + "' must be positive");
    }
    return static_cast<size_t>(value);
}

} // namespace

nlohmann::json ConsolidationResult::toJson() const {
    return {
        {"sensory_to_episodic_transfers", sensory_to_episodic_transfers},
        {"episodic_to_semantic_transfers", episodic_to_semantic_transfers},
        {"semantic_consolidations", semantic_consolidations},
        {"procedural_optimizations", procedural_optimizations},
        {"duration", duration},
        {"success", success},
        {"error_message", error_message},
        {"details", details},
    };
}

MemoryHierarchyManager::MemoryHierarchyManager(const VitaConfig& config,
                                               std::shared_ptr<Clock> clock,
                                               std::shared_ptr<StructuredLog> log)
    : config_(config),
      clock_(clock ? std::move(clock) : defaultClock()),
      log_(log ? std::move(log) : std::make_shared<StructuredLog>()),
      search_cache_(config.hierarchy.query_cache_ttl_seconds, clock_) {
    sensory_ = std::make_shared<SensoryBuffer>(config_.sensory, clock_);
    semantic_ = std::make_shared<SemanticStore>(config_.semantic, clock_);
    procedural_ = std::make_shared<ProceduralStore>(config_.procedural, clock_);
}

// ─── Consolidation ─────────────────────────────────────────────

int MemoryHierarchyManager::promoteSensoryToEpisodic(SelfState& self_state) {
    PromotionBatch batch = sensory_->peekPromotable(
        config_.hierarchy.high_salience_intensity,
        config_.hierarchy.sensory_to_episodic_threshold);
    if (batch.empty()) return 0;

    for (const auto& event : batch.events) {
        MemoryEntry entry;
        entry.event_type = event.type();
        entry.meaning_significance = std::min(1.0, std::abs(event.intensity()));
        entry.timestamp = event.timestamp();
        entry.subjective_timestamp = self_state.subjective_time;
        self_state.memory.append(entry);
    }
    sensory_->acknowledge(batch);
    return static_cast<int>(batch.events.size());
}

int MemoryHierarchyManager::promoteEpisodicToSemantic(const SelfState& self_state) {
    auto recent = self_state.memory.retrieveRecent(config_.hierarchy.semantic_window);
    if (recent.empty()) return 0;

    std::map<std::string, int> counts;
    for (const auto& e : recent) counts[e.event_type]++;

    std::vector<std::string> promoted;
    for (const auto& [type, count] : counts) {
        if (count < config_.hierarchy.episodic_to_semantic_threshold) continue;

        std::string id = "concept_" + type;
        double frequency = static_cast<double>(count) / recent.size();
        if (!semantic_->reinforceConcept(id, frequency, config_.hierarchy.semantic_smoothing)) {
            SemanticConcept c;
            c.concept_id = id;
            c.name = type;
            c.description = "recurring " + type + " events";
            c.confidence = frequency;
            c.activation_count = 1;
            c.properties = {{"event_type", type}, {"source", "episodic"}};
            semantic_->addConcept(c);
        }
        promoted.push_back(id);
    }

    for (size_t i = 0; i < promoted.size(); i++) {
        for (size_t j = i + 1; j < promoted.size(); j++) {
            semantic_->addAssociation(promoted[i], promoted[j], "co_occurs",
                                      config_.hierarchy.co_occurrence_strength);
        }
    }
    return static_cast<int>(promoted.size());
}

ConsolidationResult MemoryHierarchyManager::consolidateMemory(SelfState& self_state) {
    std::lock_guard<std::mutex> lock(consolidation_mutex_);
    auto start = std::chrono::steady_clock::now();

    ConsolidationResult result;
    int attempted = 0;
    int failed = 0;
    std::vector<std::string> failures;

    auto runStage = [&](const std::string& stage, bool available,
                        const std::function<void()>& body) {
        if (!available) {
            result.details[stage] = "unavailable";
            return;
        }
        attempted++;
        try {
            body();
            result.details[stage] = "ok";
        } catch (const std::exception& e) {
            TransientStoreFailure failure(stage, e.what());
            failed++;
            failures.push_back(failure.what());
            result.details[stage] = failure.what();
            spdlog::warn("consolidation stage failed: {}", failure.what());
        }
    };

    runStage("sensory_to_episodic", sensory_ && sensory_->isAvailable(), [&] {
        result.sensory_to_episodic_transfers = promoteSensoryToEpisodic(self_state);
    });

    runStage("episodic_to_semantic", semantic_ && semantic_->isAvailable(), [&] {
        result.episodic_to_semantic_transfers = promoteEpisodicToSemantic(self_state);
    });

    double now = clock_->now();
    if (now - last_semantic_consolidation_ >= config_.hierarchy.semantic_consolidation_interval) {
        runStage("semantic_consolidation", semantic_ && semantic_->isAvailable(), [&] {
            result.semantic_consolidations = semantic_->consolidateKnowledge();
            last_semantic_consolidation_ = now;
        });
    } else {
        result.details["semantic_consolidation"] = "not due";
    }

    runStage("procedural_optimization", procedural_ && procedural_->isAvailable(), [&] {
        result.procedural_optimizations = procedural_->optimizePatterns();
    });

    result.success = attempted == 0 || failed < attempted;
    for (size_t i = 0; i < failures.size(); i++) {
        if (i > 0) result.error_message += "; ";
        result.error_message += failures[i];
    }
    result.duration = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    stats_.consolidation_passes++;
    stats_.sensory_to_episodic += result.sensory_to_episodic_transfers;
    stats_.episodic_to_semantic += result.episodic_to_semantic_transfers;
    stats_.semantic_consolidations += result.semantic_consolidations;
    stats_.procedural_optimizations += result.procedural_optimizations;
    stats_.failed_stages += failed;

    search_cache_.invalidate();

    nlohmann::json fields = result.toJson();
    fields["tick"] = self_state.ticks;
    log_->record("memory_consolidation_completed", fields);
    spdlog::debug("consolidation: {} sensory, {} semantic, {} procedural in {:.4f}s",
                  result.sensory_to_episodic_transfers, result.episodic_to_semantic_transfers,
                  result.procedural_optimizations, result.duration);
    return result;
}

// ─── Sensory path ──────────────────────────────────────────────

bool MemoryHierarchyManager::addSensoryEvent(const Event& event) {
    if (!sensory_ || !sensory_->isAvailable()) return false;
    sensory_->push(event);
    return true;
}

std::vector<Event> MemoryHierarchyManager::processSensoryEvents(size_t max) {
    if (!sensory_ || !sensory_->isAvailable()) return {};
    return sensory_->takeEvents(max);
}

// ─── Procedural path ───────────────────────────────────────────

std::optional<std::string> MemoryHierarchyManager::learnFromFeedback(const FeedbackRecord& record) {
    if (!procedural_ || !procedural_->isAvailable()) return std::nullopt;

    double energy = record.delta("energy");
    double integrity = record.delta("integrity");
    bool success = energy + integrity * 100.0 >= 0.0;

    ProceduralAction action{toString(record.action_pattern), {{"action_id", record.action_id}}};
    std::string outcome = "energy " + std::to_string(energy) +
                          ", integrity " + std::to_string(integrity);
    std::string id = procedural_->learnFromExperience(record.context, {action}, outcome, success);

    log_->record("procedural_pattern_learned", {
        {"pattern_id", id},
        {"action_id", record.action_id},
        {"action_pattern", toString(record.action_pattern)},
        {"success", success},
    });
    return id;
}

std::optional<ActionPattern> MemoryHierarchyManager::automatedResponse(const Attributes& context) {
    if (!procedural_ || !procedural_->isAvailable()) return std::nullopt;

    auto exec = procedural_->executeBestPattern(context);
    if (!exec || !exec->success || exec->actions.empty()) return std::nullopt;

    log_->record("procedural_pattern_automated", {
        {"pattern_id", exec->pattern_id},
        {"execution_time", exec->execution_time},
    });

    const std::string& name = exec->actions.front().action_type;
    if (name != "ignore" && name != "dampen" && name != "absorb" && name != "amplify") {
        spdlog::debug("automated pattern '{}' names no response: {}", exec->pattern_id, name);
        return std::nullopt;
    }
    return parseActionPattern(name);
}

// ─── Query surface ─────────────────────────────────────────────

MemoryQueryResult MemoryHierarchyManager::queryMemory(const std::string& level,
                                                      const Attributes& params) const {
    MemoryLevel tier = parseMemoryLevel(level);
    size_t limit = positiveParam(params, "limit", DEFAULT_QUERY_LIMIT);
    size_t max_events = positiveParam(params, "max_events", limit);

    auto start = std::chrono::steady_clock::now();
    MemoryQueryResult result;
    result.level = level;

    auto unavailable = [&result, &level] {
        result.success = false;
        result.error_message = level + " memory is unavailable";
    };

    try {
        switch (tier) {
            case MemoryLevel::SENSORY: {
                if (!sensory_ || !sensory_->isAvailable()) { unavailable(); break; }
                for (const auto& e : sensory_->peekEvents(max_events)) {
                    result.results.push_back(eventToJson(e));
                }
                break;
            }
            case MemoryLevel::EPISODIC: {
                if (!episodic_) { unavailable(); break; }
                auto it = params.find("event_type");
                std::vector<MemoryEntry> entries;
                if (it != params.end()) {
                    entries = episodic_->retrieve(0, it->second);
                    if (entries.size() > limit) {
                        entries.erase(entries.begin(), entries.end() - limit);
                    }
                } else {
                    entries = episodic_->retrieveRecent(limit);
                }
                for (const auto& e : entries) result.results.push_back(memoryEntryToJson(e));
                break;
            }
            case MemoryLevel::SEMANTIC: {
                if (!semantic_ || !semantic_->isAvailable()) { unavailable(); break; }
                auto q = params.find("query");
                std::string text = q != params.end() ? q->second : "";
                std::string key = text + "|" + std::to_string(limit);
                if (auto cached = search_cache_.get(key)) {
                    result.results = *cached;
                    break;
                }
                for (const auto& [c, score] : semantic_->search(text, limit)) {
                    result.results.push_back({{"concept", conceptToJson(c)}, {"score", score}});
                }
                search_cache_.put(key, result.results);
                break;
            }
            case MemoryLevel::PROCEDURAL: {
                if (!procedural_ || !procedural_->isAvailable()) { unavailable(); break; }
                Attributes context;
                for (const auto& [k, v] : params) {
                    if (k == "limit" || k == "max_events" || k == "query" || k == "event_type") {
                        continue;
                    }
                    context[k] = v;
                }
                auto ranked = procedural_->findApplicablePatterns(context);
                if (ranked.size() > limit) ranked.resize(limit);
                for (const auto& [p, relevance] : ranked) {
                    result.results.push_back({{"pattern", patternToJson(p)}, {"relevance", relevance}});
                }
                break;
            }
        }
    } catch (const InvalidArgumentError&) {
        throw;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
        result.results = nlohmann::json::array();
        spdlog::warn("{} memory query failed: {}", level, e.what());
    }

    result.total_count = result.results.size();
    result.execution_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

// ─── Status ────────────────────────────────────────────────────

nlohmann::json MemoryHierarchyManager::hierarchyStatus() const {
    nlohmann::json status;

    if (sensory_ && sensory_->isAvailable()) {
        status["sensory"] = sensory_->status();
        status["sensory"]["available"] = true;
    } else {
        status["sensory"] = {{"available", false}};
    }

    if (episodic_) {
        status["episodic"] = {
            {"available", true},
            {"size", episodic_->count()},
            {"feedback_entries", episodic_->feedbackCount()},
            {"average_significance", episodic_->averageSignificance()},
        };
    } else {
        status["episodic"] = {{"available", false}};
    }

    if (semantic_ && semantic_->isAvailable()) {
        status["semantic"] = semantic_->statistics();
        status["semantic"]["available"] = true;
    } else {
        status["semantic"] = {{"available", false}};
    }

    if (procedural_ && procedural_->isAvailable()) {
        status["procedural"] = procedural_->statistics();
        status["procedural"]["available"] = true;
    } else {
        status["procedural"] = {{"available", false}};
    }

    TransferStats t = transferStats();
    status["transfers"] = {
        {"sensory_to_episodic", t.sensory_to_episodic},
        {"episodic_to_semantic", t.episodic_to_semantic},
        {"semantic_consolidations", t.semantic_consolidations},
        {"procedural_optimizations", t.procedural_optimizations},
        {"consolidation_passes", t.consolidation_passes},
        {"failed_stages", t.failed_stages},
    };
    return status;
}

void MemoryHierarchyManager::resetHierarchy() {
    // Owner lock first: the tick thread holds it while consolidating
    std::unique_lock<std::mutex> owner_lock;
    std::mutex* owner = nullptr;
    {
        std::lock_guard<std::mutex> lock(consolidation_mutex_);
        owner = episodic_owner_mutex_;
    }
    if (owner) owner_lock = std::unique_lock<std::mutex>(*owner);
    std::lock_guard<std::mutex> lock(consolidation_mutex_);
    if (sensory_) sensory_->clear();
    if (episodic_) episodic_->clear();
    if (semantic_) semantic_->clear();
    if (procedural_) procedural_->clear();
    stats_ = TransferStats{};
    last_semantic_consolidation_ = 0.0;
    search_cache_.invalidate();
    spdlog::info("memory hierarchy reset");
}

TransferStats MemoryHierarchyManager::transferStats() const {
    std::lock_guard<std::mutex> lock(consolidation_mutex_);
    return stats_;
}

} // namespace vita
