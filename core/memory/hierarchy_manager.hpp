#pragma once

#include "common/attributes.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/ttl_cache.hpp"
#include "feedback/feedback_record.hpp"
#include "memory/episodic_store.hpp"
#include "memory/procedural_store.hpp"
#include "memory/semantic_store.hpp"
#include "memory/sensory_buffer.hpp"
#include "meaning/action_pattern.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vita {

class StructuredLog;
struct SelfState;

struct ConsolidationResult {
    int sensory_to_episodic_transfers = 0;
    int episodic_to_semantic_transfers = 0;
    int semantic_consolidations = 0;
    int procedural_optimizations = 0;
    double duration = 0.0;          // wall seconds
    bool success = true;
    std::string error_message;
    std::map<std::string, std::string> details;   // stage → "ok" | "unavailable" | failure

    nlohmann::json toJson() const;
};

struct MemoryQueryResult {
    std::string level;
    nlohmann::json results = nlohmann::json::array();
    size_t total_count = 0;
    double execution_time = 0.0;
    bool success = true;
    std::string error_message;
};

struct TransferStats {
    uint64_t sensory_to_episodic = 0;
    uint64_t episodic_to_semantic = 0;
    uint64_t semantic_consolidations = 0;
    uint64_t procedural_optimizations = 0;
    uint64_t consolidation_passes = 0;
    uint64_t failed_stages = 0;
};

// ─── MemoryHierarchyManager ────────────────────────────────────
// Orchestrates the four tiers:
//
//   sensory ──(salience / repetition)──▶ episodic
//   episodic ──(recurring type)────────▶ semantic concept
//   semantic ──(interval)──────────────▶ association decay
//   procedural ────────────────────────▶ optimize, learn, automate
//
// Each stage of a consolidation pass is isolated: a failing or
// unavailable store is recorded and the remaining stages still run.
// Passes are serialized; queries may run concurrently with them.
//
// Store slots may be empty. Install stores before the engine starts.

class MemoryHierarchyManager {
public:
    explicit MemoryHierarchyManager(const VitaConfig& config = {},
                                    std::shared_ptr<Clock> clock = defaultClock(),
                                    std::shared_ptr<StructuredLog> log = nullptr);

    void setSensoryBuffer(std::shared_ptr<SensoryBuffer> store) { sensory_ = std::move(store); }
    void setSemanticStore(std::shared_ptr<SemanticStore> store) { semantic_ = std::move(store); }
    void setProceduralStore(std::shared_ptr<ProceduralStore> store) { procedural_ = std::move(store); }

    /// Episodic memory read by queries (normally SelfState::memory).
    /// Not owned; must outlive the manager's use of it. `owner_mutex` is
    /// the lock its owner mutates the state under; resetHierarchy takes it
    /// so a reset from another thread lands between ticks.
    void attachEpisodicMemory(EpisodicMemory* memory, std::mutex* owner_mutex = nullptr) {
        std::lock_guard<std::mutex> lock(consolidation_mutex_);
        episodic_ = memory;
        episodic_owner_mutex_ = memory ? owner_mutex : nullptr;
    }

    std::shared_ptr<SensoryBuffer> sensoryBuffer() const { return sensory_; }
    std::shared_ptr<SemanticStore> semanticStore() const { return semantic_; }
    std::shared_ptr<ProceduralStore> proceduralStore() const { return procedural_; }

    /// One consolidation pass over all tiers. Promoted episodic entries
    /// are appended to `self_state.memory`.
    ConsolidationResult consolidateMemory(SelfState& self_state);

    /// Push a raw event into the sensory tier. False if unavailable.
    bool addSensoryEvent(const Event& event);

    /// Remove and return up to `max` raw sensory events (0 for all).
    std::vector<Event> processSensoryEvents(size_t max = 0);

    /// Turn a resolved feedback record into a learned procedural pattern.
    /// Returns the new pattern id, or nullopt when procedural memory is
    /// unavailable.
    std::optional<std::string> learnFromFeedback(const FeedbackRecord& record);

    /// Run the best automatable pattern for `context`; on success return
    /// the response it encodes.
    std::optional<ActionPattern> automatedResponse(const Attributes& context);

    /// Query one tier. Unknown levels and malformed `limit`/`max_events`
    /// throw InvalidArgumentError.
    MemoryQueryResult queryMemory(const std::string& level, const Attributes& params = {}) const;

    nlohmann::json hierarchyStatus() const;

    /// Clear every tier, including the attached episodic memory. Blocks
    /// until the owner of that memory releases its lock.
    void resetHierarchy();
    TransferStats transferStats() const;

private:
    int promoteSensoryToEpisodic(SelfState& self_state);
    int promoteEpisodicToSemantic(const SelfState& self_state);

    const VitaConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<StructuredLog> log_;

    std::shared_ptr<SensoryBuffer> sensory_;
    std::shared_ptr<SemanticStore> semantic_;
    std::shared_ptr<ProceduralStore> procedural_;
    EpisodicMemory* episodic_ = nullptr;
    std::mutex* episodic_owner_mutex_ = nullptr;

    mutable std::mutex consolidation_mutex_;
    TransferStats stats_;
    double last_semantic_consolidation_ = 0.0;

    mutable TtlCache<std::string, nlohmann::json> search_cache_;
};

} // namespace vita
