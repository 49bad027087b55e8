#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "memory/hierarchy_manager.hpp"
#include "state/self_state.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace vita;

namespace {

class FailingSemanticStore : public SemanticStore {
public:
    using SemanticStore::SemanticStore;
    int consolidateKnowledge() override { throw std::runtime_error("semantic disk offline"); }
};

class FailingProceduralStore : public ProceduralStore {
public:
    using ProceduralStore::ProceduralStore;
    int optimizePatterns() override { throw std::runtime_error("pattern index corrupt"); }
};

class OfflineSemanticStore : public SemanticStore {
public:
    using SemanticStore::SemanticStore;
    bool isAvailable() const override { return false; }
};

struct HierarchyFixture : public ::testing::Test {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    SelfState state;
    MemoryHierarchyManager manager{VitaConfig{}, clock};

    void SetUp() override { manager.attachEpisodicMemory(&state.memory); }

    void appendEpisodes(const std::string& type, int n) {
        for (int i = 0; i < n; i++) {
            MemoryEntry e;
            e.event_type = type;
            e.meaning_significance = 0.4;
            e.timestamp = clock->now();
            state.memory.append(e);
        }
    }
};

} // namespace

// ─── Consolidation ─────────────────────────────────────────────

TEST_F(HierarchyFixture, SalientEventTransfersExactlyOnce) {
    ASSERT_TRUE(manager.addSensoryEvent(Event("shock", 0.9, clock->now())));

    auto first = manager.consolidateMemory(state);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.sensory_to_episodic_transfers, 1);
    ASSERT_EQ(state.memory.count(), 1u);
    auto entry = state.memory.retrieve().front();
    EXPECT_EQ(entry.event_type, "shock");
    EXPECT_NEAR(entry.meaning_significance, 0.9, 1e-12);

    auto second = manager.consolidateMemory(state);
    EXPECT_EQ(second.sensory_to_episodic_transfers, 0);
    EXPECT_EQ(state.memory.count(), 1u);
}

TEST_F(HierarchyFixture, RepeatedEventsPromoteAsOneEntry) {
    for (int i = 0; i < 4; i++) manager.addSensoryEvent(Event("noise", 0.3, clock->now()));
    EXPECT_EQ(manager.consolidateMemory(state).sensory_to_episodic_transfers, 0);

    manager.addSensoryEvent(Event("noise", 0.3, clock->now()));
    auto result = manager.consolidateMemory(state);
    EXPECT_EQ(result.sensory_to_episodic_transfers, 1);
    ASSERT_EQ(state.memory.count(), 1u);
    EXPECT_EQ(state.memory.retrieve().front().event_type, "noise");
    EXPECT_NEAR(state.memory.retrieve().front().meaning_significance, 0.3, 1e-12);
    EXPECT_TRUE(manager.sensoryBuffer()->empty());
}

TEST_F(HierarchyFixture, RecurringEpisodesBecomeConcepts) {
    appendEpisodes("decay", 10);
    auto first = manager.consolidateMemory(state);
    EXPECT_EQ(first.episodic_to_semantic_transfers, 1);

    auto concept_decay = manager.semanticStore()->getConcept("concept_decay");
    ASSERT_TRUE(concept_decay.has_value());
    EXPECT_EQ(concept_decay->name, "decay");
    EXPECT_NEAR(concept_decay->confidence, 1.0, 1e-12);

    appendEpisodes("noise", 10);
    auto second = manager.consolidateMemory(state);
    EXPECT_EQ(second.episodic_to_semantic_transfers, 2);

    // 20 recent entries, half of them decay: 1.0 + 0.2 * (0.5 - 1.0)
    EXPECT_NEAR(manager.semanticStore()->getConcept("concept_decay")->confidence, 0.9, 1e-12);
    EXPECT_NEAR(manager.semanticStore()->getConcept("concept_noise")->confidence, 0.5, 1e-12);

    auto link = manager.semanticStore()->getAssociation("concept_decay", "concept_noise");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->association_type, "co_occurs");
}

TEST_F(HierarchyFixture, SemanticConsolidationRunsOnInterval) {
    auto first = manager.consolidateMemory(state);
    EXPECT_EQ(first.details.at("semantic_consolidation"), "ok");

    clock->advance(10.0);
    auto second = manager.consolidateMemory(state);
    EXPECT_EQ(second.details.at("semantic_consolidation"), "not due");

    clock->advance(60.0);
    auto third = manager.consolidateMemory(state);
    EXPECT_EQ(third.details.at("semantic_consolidation"), "ok");
}

TEST_F(HierarchyFixture, FailingStageDoesNotStopOthers) {
    manager.setSemanticStore(std::make_shared<FailingSemanticStore>(SemanticConfig{}, clock));
    manager.addSensoryEvent(Event("shock", -0.95, clock->now()));

    auto result = manager.consolidateMemory(state);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.sensory_to_episodic_transfers, 1);
    EXPECT_EQ(result.details.at("sensory_to_episodic"), "ok");
    EXPECT_EQ(result.details.at("procedural_optimization"), "ok");
    EXPECT_NE(result.details.at("semantic_consolidation").find("semantic disk offline"),
              std::string::npos);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(manager.transferStats().failed_stages, 1u);
}

TEST_F(HierarchyFixture, PassFailsOnlyWhenEveryStageFails) {
    manager.setSensoryBuffer(nullptr);
    manager.setSemanticStore(nullptr);
    manager.setProceduralStore(std::make_shared<FailingProceduralStore>(ProceduralConfig{}, clock));

    auto result = manager.consolidateMemory(state);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.details.at("sensory_to_episodic"), "unavailable");
    EXPECT_EQ(result.details.at("episodic_to_semantic"), "unavailable");
    EXPECT_NE(result.error_message.find("pattern index corrupt"), std::string::npos);
}

TEST_F(HierarchyFixture, NoStoresIsAnEmptySuccess) {
    manager.setSensoryBuffer(nullptr);
    manager.setSemanticStore(nullptr);
    manager.setProceduralStore(nullptr);

    auto result = manager.consolidateMemory(state);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.details.size(), 4u);
    for (const auto& [stage, status] : result.details) {
        EXPECT_EQ(status, "unavailable") << stage;
    }
    EXPECT_FALSE(manager.addSensoryEvent(Event("noise", 0.1, clock->now())));
    EXPECT_TRUE(manager.processSensoryEvents().empty());
}

// ─── Queries ───────────────────────────────────────────────────

TEST_F(HierarchyFixture, QueryRejectsUnknownLevelAndBadLimits) {
    EXPECT_THROW(manager.queryMemory("working"), InvalidArgumentError);
    EXPECT_THROW(manager.queryMemory("episodic", {{"limit", "abc"}}), InvalidArgumentError);
    EXPECT_THROW(manager.queryMemory("episodic", {{"limit", "0"}}), InvalidArgumentError);
    EXPECT_THROW(manager.queryMemory("episodic", {{"limit", "-3"}}), InvalidArgumentError);
    EXPECT_THROW(manager.queryMemory("sensory", {{"max_events", "5x"}}), InvalidArgumentError);
}

TEST_F(HierarchyFixture, QueryEpisodicNewestWithinLimit) {
    appendEpisodes("noise", 3);
    appendEpisodes("shock", 2);

    auto recent = manager.queryMemory("episodic", {{"limit", "2"}});
    ASSERT_TRUE(recent.success);
    ASSERT_EQ(recent.total_count, 2u);
    EXPECT_EQ(recent.results[0]["event_type"], "shock");

    auto filtered = manager.queryMemory("episodic", {{"event_type", "noise"}});
    EXPECT_EQ(filtered.total_count, 3u);
}

TEST_F(HierarchyFixture, QuerySensoryReturnsLiveEvents) {
    manager.addSensoryEvent(Event("noise", 0.1, clock->now()));
    manager.addSensoryEvent(Event("decay", -0.2, clock->now()));

    auto result = manager.queryMemory("sensory", {{"max_events", "1"}});
    ASSERT_EQ(result.total_count, 1u);
    EXPECT_EQ(result.results[0]["type"], "noise");
    EXPECT_EQ(manager.sensoryBuffer()->size(), 2u);
}

TEST_F(HierarchyFixture, QuerySemanticSearchesConcepts) {
    appendEpisodes("recovery", 10);
    manager.consolidateMemory(state);

    auto result = manager.queryMemory("semantic", {{"query", "RECOV"}});
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.total_count, 1u);
    EXPECT_EQ(result.results[0]["concept"]["concept_id"], "concept_recovery");
    EXPECT_GT(result.results[0]["score"].get<double>(), 1.0);
}

TEST_F(HierarchyFixture, QueryUnavailableTierReportsFailure) {
    manager.setSemanticStore(std::make_shared<OfflineSemanticStore>(SemanticConfig{}, clock));
    auto semantic = manager.queryMemory("semantic", {{"query", "x"}});
    EXPECT_FALSE(semantic.success);
    EXPECT_TRUE(semantic.results.empty());

    MemoryHierarchyManager detached(VitaConfig{}, clock);
    auto episodic = detached.queryMemory("episodic");
    EXPECT_FALSE(episodic.success);
    EXPECT_FALSE(episodic.error_message.empty());
}

// ─── Procedural path ───────────────────────────────────────────

TEST_F(HierarchyFixture, FeedbackBecomesLearnedPattern) {
    FeedbackRecord good;
    good.action_id = "action_1_absorb_0";
    good.action_pattern = ActionPattern::ABSORB;
    good.state_delta = {{"energy", 2.0}, {"stability", 0.0}, {"integrity", 0.0}};
    good.context = {{"event_type", "recovery"}};

    auto id = manager.learnFromFeedback(good);
    ASSERT_TRUE(id.has_value());
    auto p = manager.proceduralStore()->getPattern(*id);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->automation_level, 0.3, 1e-12);
    ASSERT_EQ(p->action_sequence.size(), 1u);
    EXPECT_EQ(p->action_sequence[0].action_type, "absorb");
    EXPECT_EQ(p->action_sequence[0].params.at("action_id"), "action_1_absorb_0");

    FeedbackRecord bad = good;
    bad.action_id = "action_2_amplify_0";
    bad.action_pattern = ActionPattern::AMPLIFY;
    bad.state_delta = {{"energy", 1.0}, {"integrity", -0.05}};
    auto bad_id = manager.learnFromFeedback(bad);
    ASSERT_TRUE(bad_id.has_value());
    EXPECT_EQ(manager.proceduralStore()->getPattern(*bad_id)->failure_count, 1);

    manager.setProceduralStore(nullptr);
    EXPECT_FALSE(manager.learnFromFeedback(good).has_value());
}

TEST_F(HierarchyFixture, AutomatedResponseNeedsAutomatedKnownAction) {
    Attributes ctx = {{"event_type", "shock"}};
    EXPECT_FALSE(manager.automatedResponse(ctx).has_value());

    ProceduralPattern p;
    p.pattern_id = "reflex";
    p.action_sequence = {{"dampen", {}}};
    p.trigger_conditions = ctx;
    p.automation_level = 0.95;
    manager.proceduralStore()->addPattern(p);
    EXPECT_EQ(manager.automatedResponse(ctx), std::optional<ActionPattern>(ActionPattern::DAMPEN));

    MemoryHierarchyManager other(VitaConfig{}, clock);
    p.action_sequence = {{"retreat", {}}};
    other.proceduralStore()->addPattern(p);
    EXPECT_FALSE(other.automatedResponse(ctx).has_value());
}

// ─── Status / reset ────────────────────────────────────────────

TEST_F(HierarchyFixture, StatusReportsEveryTier) {
    manager.addSensoryEvent(Event("noise", 0.1, clock->now()));
    appendEpisodes("decay", 2);
    manager.consolidateMemory(state);

    auto status = manager.hierarchyStatus();
    EXPECT_TRUE(status["sensory"]["available"].get<bool>());
    EXPECT_EQ(status["episodic"]["size"], 2);
    EXPECT_TRUE(status["semantic"]["available"].get<bool>());
    EXPECT_TRUE(status["procedural"]["available"].get<bool>());
    EXPECT_EQ(status["transfers"]["consolidation_passes"], 1);

    manager.setSemanticStore(nullptr);
    EXPECT_FALSE(manager.hierarchyStatus()["semantic"]["available"].get<bool>());
}

TEST_F(HierarchyFixture, ResetClearsAllTiers) {
    manager.addSensoryEvent(Event("noise", 0.1, clock->now()));
    appendEpisodes("decay", 10);
    manager.consolidateMemory(state);
    manager.learnFromFeedback(FeedbackRecord{});
    ASSERT_GT(manager.semanticStore()->size(), 0u);

    manager.resetHierarchy();
    EXPECT_TRUE(manager.sensoryBuffer()->empty());
    EXPECT_TRUE(state.memory.empty());
    EXPECT_EQ(manager.semanticStore()->size(), 0u);
    EXPECT_EQ(manager.proceduralStore()->size(), 0u);
    EXPECT_EQ(manager.transferStats().consolidation_passes, 0u);
}

TEST_F(HierarchyFixture, ResetWaitsForEpisodicOwner) {
    std::mutex owner;
    manager.attachEpisodicMemory(&state.memory, &owner);
    appendEpisodes("decay", 3);

    std::unique_lock<std::mutex> held(owner);
    auto reset = std::async(std::launch::async, [this] { manager.resetHierarchy(); });
    EXPECT_EQ(reset.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    EXPECT_EQ(state.memory.count(), 3u);

    held.unlock();
    reset.get();
    EXPECT_TRUE(state.memory.empty());
}

// ─── Concurrency ───────────────────────────────────────────────

TEST(HierarchyConcurrencyTest, QueriesAndConsolidationAlongsidePushes) {
    constexpr int EVENTS = 2000;
    VitaConfig config;
    config.sensory.capacity = 4096;
    auto clock = std::make_shared<ManualClock>();
    MemoryHierarchyManager manager(config, clock);
    SelfState state;
    manager.attachEpisodicMemory(&state.memory);

    std::atomic<bool> pushing{true};

    std::thread pusher([&] {
        for (int i = 0; i < EVENTS; i++) {
            manager.addSensoryEvent(Event(i % 2 ? "shock" : "recovery", 0.9, clock->now()));
        }
        pushing = false;
    });

    auto consolidate = [&] {
        while (pushing) {
            ConsolidationResult r = manager.consolidateMemory(state);
            EXPECT_TRUE(r.success);
        }
    };
    std::thread consolidator_a(consolidate);
    std::thread consolidator_b(consolidate);

    std::thread reader([&] {
        const Attributes params = {{"limit", "5"}};
        while (pushing) {
            for (const char* level : {"sensory", "episodic", "semantic", "procedural"}) {
                MemoryQueryResult r = manager.queryMemory(level, params);
                EXPECT_TRUE(r.success) << level;
                EXPECT_LE(r.total_count, 5u);
            }
        }
    });

    pusher.join();
    consolidator_a.join();
    consolidator_b.join();
    reader.join();
    manager.consolidateMemory(state);

    // Every event promoted exactly once
    EXPECT_EQ(state.memory.count(), static_cast<size_t>(EVENTS));
    EXPECT_EQ(manager.transferStats().sensory_to_episodic, static_cast<uint64_t>(EVENTS));
    EXPECT_EQ(manager.sensoryBuffer()->totalPromoted(), static_cast<uint64_t>(EVENTS));
    EXPECT_TRUE(manager.sensoryBuffer()->empty());
    EXPECT_EQ(manager.transferStats().failed_stages, 0u);
}
