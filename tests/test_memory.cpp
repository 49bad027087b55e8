#include <gtest/gtest.h>
#include "memory/episodic_store.hpp"
#include "memory/semantic_store.hpp"

#include <cmath>
#include <cstdio>
#include <thread>

using namespace vita;

namespace {

MemoryEntry entry(const std::string& type, double significance = 0.5) {
    MemoryEntry e;
    e.event_type = type;
    e.meaning_significance = significance;
    e.timestamp = 100.0;
    return e;
}

SemanticConcept makeConcept(const std::string& id, const std::string& name,
                            const std::string& description = "") {
    SemanticConcept c;
    c.concept_id = id;
    c.name = name;
    c.description = description;
    c.confidence = 1.0;
    return c;
}

} // namespace

// ─── Episodic Memory Tests ─────────────────────────────────────

TEST(MemoryTest, EpisodicAppendAndRetrieve) {
    EpisodicMemory memory;
    EXPECT_EQ(memory.count(), 0u);

    for (int i = 0; i < 5; i++) {
        memory.append(entry(i % 2 == 0 ? "noise" : "shock", 0.1 * i));
    }
    EXPECT_EQ(memory.count(), 5u);

    auto noise = memory.retrieve(0, "noise");
    EXPECT_EQ(noise.size(), 3u);   // indices 0, 2, 4

    auto limited = memory.retrieve(2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].event_type, "noise");

    auto recent = memory.retrieveRecent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_NEAR(recent[1].meaning_significance, 0.4, 1e-12);
}

TEST(MemoryTest, EpisodicAggregates) {
    EpisodicMemory memory;
    memory.append(entry("noise", 0.2));
    memory.append(entry("noise", 0.4));
    MemoryEntry fb = entry("feedback", 0.0);
    fb.feedback_data = FeedbackRecord{};
    memory.append(fb);

    EXPECT_NEAR(memory.averageSignificance(), 0.2, 1e-12);
    EXPECT_EQ(memory.feedbackCount(), 1u);

    auto counts = memory.countByType(2);
    EXPECT_EQ(counts["noise"], 1);
    EXPECT_EQ(counts["feedback"], 1);
}

TEST(MemoryTest, EpisodicExportImport) {
    EpisodicMemory memory;
    memory.append(entry("noise", 0.3));
    MemoryEntry fb = entry("feedback", 0.0);
    FeedbackRecord r;
    r.action_id = "action_3_dampen_1";
    r.action_pattern = ActionPattern::DAMPEN;
    r.state_delta = {{"energy", -0.5}};
    r.context = {{"event_type", "noise"}};
    fb.feedback_data = r;
    memory.append(fb);

    std::string path = ::testing::TempDir() + "vita_episodic.jsonl";
    memory.exportToFile(path);

    EpisodicMemory loaded;
    loaded.importFromFile(path);
    ASSERT_EQ(loaded.count(), 2u);
    auto all = loaded.retrieve();
    EXPECT_EQ(all[0], memory.retrieve()[0]);
    ASSERT_TRUE(all[1].feedback_data.has_value());
    EXPECT_EQ(all[1].feedback_data->action_pattern, ActionPattern::DAMPEN);
    std::remove(path.c_str());
}

TEST(MemoryTest, EpisodicConcurrentReadersDuringAppend) {
    EpisodicMemory memory;
    std::thread writer([&memory] {
        for (int i = 0; i < 500; i++) memory.append(entry("noise"));
    });
    size_t last = 0;
    for (int i = 0; i < 200; i++) {
        size_t n = memory.retrieveRecent(10).size();
        EXPECT_LE(n, 10u);
        size_t c = memory.count();
        EXPECT_GE(c, last);
        last = c;
    }
    writer.join();
    EXPECT_EQ(memory.count(), 500u);
}

TEST(MemoryTest, EpisodicClear) {
    EpisodicMemory memory;
    memory.append(entry("idle"));
    memory.clear();
    EXPECT_TRUE(memory.empty());
}

// ─── Semantic Store Tests ──────────────────────────────────────

TEST(MemoryTest, SemanticAddAndReinforce) {
    auto clock = std::make_shared<ManualClock>();
    SemanticStore store({}, clock);

    EXPECT_TRUE(store.addConcept(makeConcept("concept_noise", "noise")));
    EXPECT_FALSE(store.addConcept(makeConcept("concept_noise", "other")));
    EXPECT_EQ(store.getConcept("concept_noise")->name, "noise");

    SemanticConcept c = makeConcept("concept_decay", "decay");
    c.confidence = 0.5;
    store.addConcept(c);
    EXPECT_TRUE(store.reinforceConcept("concept_decay", 1.0, 0.2));
    auto updated = store.getConcept("concept_decay");
    EXPECT_NEAR(updated->confidence, 0.6, 1e-12);
    EXPECT_EQ(updated->activation_count, 1);
    EXPECT_FALSE(store.reinforceConcept("missing", 1.0, 0.2));
}

TEST(MemoryTest, SemanticActivationStrengthDecays) {
    SemanticConcept c = makeConcept("c", "c");
    c.confidence = 0.8;
    c.last_activation = 0.0;
    EXPECT_NEAR(c.activationStrength(0.0), 0.8, 1e-12);
    EXPECT_NEAR(c.activationStrength(3600.0 * 10), 0.8 * std::pow(0.99, 10), 1e-9);
}

TEST(MemoryTest, SemanticAssociationsStrengthenAndMirror) {
    auto clock = std::make_shared<ManualClock>();
    SemanticStore store({}, clock);
    store.addConcept(makeConcept("a", "a"));
    store.addConcept(makeConcept("b", "b"));

    store.addAssociation("a", "b", "co_occurs", 0.1);
    store.addAssociation("a", "b", "co_occurs", 0.1);
    auto assoc = store.getAssociation("a", "b");
    ASSERT_TRUE(assoc.has_value());
    EXPECT_NEAR(assoc->strength, 0.2, 1e-12);
    EXPECT_EQ(assoc->evidence_count, 2);
    EXPECT_TRUE(store.getConcept("a")->related_concepts.count("b"));
    EXPECT_TRUE(store.getConcept("b")->related_concepts.count("a"));

    EXPECT_THROW(store.addAssociation("a", "missing", "related_to", 0.5), InvalidArgumentError);
}

TEST(MemoryTest, SemanticConsolidationDecaysStaleAssociationsOnly) {
    auto clock = std::make_shared<ManualClock>(0.0);
    SemanticConfig config;
    SemanticStore store(config, clock);
    store.addConcept(makeConcept("a", "a"));
    store.addConcept(makeConcept("b", "b"));
    store.addConcept(makeConcept("c", "c"));
    store.addAssociation("a", "b", "co_occurs", 0.5);
    store.addAssociation("a", "c", "co_occurs", 0.05);

    EXPECT_EQ(store.consolidateKnowledge(), 0);   // nothing stale yet

    clock->advance(config.association_stale_seconds + 1.0);
    EXPECT_EQ(store.consolidateKnowledge(), 2);
    EXPECT_NEAR(store.getAssociation("a", "b")->strength, 0.45, 1e-12);
    EXPECT_FALSE(store.getAssociation("a", "c").has_value());   // 0.045 < 0.05
    EXPECT_FALSE(store.getConcept("c")->related_concepts.count("a"));

    EXPECT_EQ(store.conceptCount(), 3u);    // concepts are never dropped
}

TEST(MemoryTest, SemanticSearchRanksNameOverDescription) {
    auto clock = std::make_shared<ManualClock>();
    SemanticStore store({}, clock);
    store.addConcept(makeConcept("concept_shock", "shock", "sudden impact"));
    store.addConcept(makeConcept("concept_decay", "decay", "slow shock aftermath"));
    store.addConcept(makeConcept("concept_idle", "idle", "nothing happens"));

    auto results = store.search("SHOCK");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].first.concept_id, "concept_shock");
    EXPECT_GT(results[0].second, results[1].second);

    EXPECT_EQ(store.search("shock", 1).size(), 1u);
    EXPECT_TRUE(store.search("zebra").empty());
}

TEST(MemoryTest, SemanticFindRelatedAttenuates) {
    auto clock = std::make_shared<ManualClock>();
    SemanticStore store({}, clock);
    for (const char* id : {"a", "b", "c", "d"}) store.addConcept(makeConcept(id, id));
    store.addAssociation("a", "b", "related_to", 0.5);
    store.addAssociation("b", "c", "related_to", 0.5);
    store.addAssociation("c", "d", "related_to", 0.5);

    auto related = store.findRelated("a", 2);
    EXPECT_DOUBLE_EQ(related["a"], 1.0);
    EXPECT_NEAR(related["b"], 0.5, 1e-12);
    EXPECT_NEAR(related["c"], 0.5 * 0.5 * 0.8, 1e-12);
    EXPECT_FALSE(related.count("d"));
    EXPECT_TRUE(store.findRelated("missing").empty());
}
