#include <gtest/gtest.h>
#include "memory/procedural_store.hpp"
#include "common/errors.hpp"

#include <stdexcept>

using namespace vita;

namespace {

ProceduralPattern makePattern(const std::string& id, const std::string& action,
                              const Attributes& triggers) {
    ProceduralPattern p;
    p.pattern_id = id;
    p.name = id;
    p.action_sequence = {{action, {}}};
    p.trigger_conditions = triggers;
    return p;
}

} // namespace

// ─── Pattern metrics ───────────────────────────────────────────

TEST(ProceduralTest, EffectivenessFormula) {
    ProceduralPattern p = makePattern("p", "absorb", {});
    EXPECT_DOUBLE_EQ(p.effectiveness(), 0.0);   // never executed

    p.success_count = 9;
    p.failure_count = 1;
    p.total_executions = 10;
    p.success_rate = 0.9;
    p.automation_level = 0.5;
    EXPECT_NEAR(p.effectiveness(), 0.45 + 0.15 + 0.2, 1e-12);
}

TEST(ProceduralTest, AutomationRisesOnlyWithSustainedSuccess) {
    ProceduralPattern p = makePattern("p", "absorb", {});
    p.automation_level = 0.7;
    p.success_count = 4;
    p.total_executions = 4;
    p.updateMetrics();
    EXPECT_NEAR(p.automation_level, 0.7, 1e-12);    // too few executions

    p.success_count = 10;
    p.total_executions = 10;
    p.updateMetrics();
    EXPECT_NEAR(p.automation_level, 0.8, 1e-12);

    p.success_count = 1;
    p.failure_count = 3;
    p.total_executions = 4;
    p.updateMetrics();
    EXPECT_NEAR(p.success_rate, 0.25, 1e-12);
    EXPECT_NEAR(p.automation_level, 0.7, 1e-12);
}

TEST(ProceduralTest, CanAutomateRequiresLevelAndExactTriggers) {
    ProceduralPattern p = makePattern("p", "dampen", {{"event_type", "shock"}});
    p.automation_level = 0.79;
    EXPECT_FALSE(p.canAutomate({{"event_type", "shock"}}));

    p.automation_level = 0.8;
    EXPECT_TRUE(p.canAutomate({{"event_type", "shock"}}));
    EXPECT_TRUE(p.canAutomate({{"event_type", "shock"}, {"extra", "x"}}));
    EXPECT_FALSE(p.canAutomate({{"event_type", "noise"}}));
    EXPECT_FALSE(p.canAutomate({}));
}

// ─── Store ─────────────────────────────────────────────────────

TEST(ProceduralTest, FindApplicablePatternsRanksByRelevance) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    store.addPattern(makePattern("a", "dampen", {{"event_type", "shock"}}));
    store.addPattern(makePattern("b", "absorb", {{"event_type", "noise"}}));

    auto ranked = store.findApplicablePatterns({{"event_type", "shock"}});
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].first.pattern_id, "a");
    EXPECT_NEAR(ranked[0].second, 0.4 + 0.2, 1e-12);
    EXPECT_NEAR(ranked[1].second, 0.2, 1e-12);
}

TEST(ProceduralTest, RecencyFactorDecaysHourly) {
    auto clock = std::make_shared<ManualClock>(0.0);
    ProceduralStore store({}, clock);
    ProceduralPattern p = makePattern("a", "absorb", {});
    p.last_execution = 1.0;
    store.addPattern(p);

    clock->set(1.0 + 2 * 3600.0);
    auto ranked = store.findApplicablePatterns({});
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_NEAR(ranked[0].second, 0.2 * 0.81, 1e-9);
}

TEST(ProceduralTest, ExecuteBestPatternDefersWhenNotAutomated) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    ProceduralPattern p = makePattern("a", "dampen", {{"event_type", "shock"}});
    p.automation_level = 0.5;
    store.addPattern(p);

    EXPECT_FALSE(store.executeBestPattern({{"event_type", "shock"}}).has_value());
    EXPECT_EQ(store.statistics()["manual_executions"], 1);
    EXPECT_EQ(store.getPattern("a")->total_executions, 0);
}

TEST(ProceduralTest, ExecuteBestPatternRunsAutomatedSequence) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    ProceduralPattern p = makePattern("a", "dampen", {{"event_type", "shock"}});
    p.automation_level = 0.9;
    store.addPattern(p);

    std::vector<std::string> seen;
    store.setExecutor([&seen](const ProceduralAction& action, const Attributes&) {
        seen.push_back(action.action_type);
        return true;
    });

    auto exec = store.executeBestPattern({{"event_type", "shock"}});
    ASSERT_TRUE(exec.has_value());
    EXPECT_TRUE(exec->success);
    EXPECT_TRUE(exec->automated);
    EXPECT_EQ(seen, std::vector<std::string>{"dampen"});

    auto updated = store.getPattern("a");
    EXPECT_EQ(updated->total_executions, 1);
    EXPECT_EQ(updated->success_count, 1);
    EXPECT_DOUBLE_EQ(updated->last_execution, clock->now());
    EXPECT_EQ(store.statistics()["automated_executions"], 1);
}

TEST(ProceduralTest, ExecutorExceptionMarksFailure) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    ProceduralPattern p = makePattern("a", "dampen", {});
    p.automation_level = 1.0;
    store.addPattern(p);
    store.setExecutor([](const ProceduralAction&, const Attributes&) -> bool {
        throw std::runtime_error("actuator offline");
    });

    auto exec = store.executeBestPattern({});
    ASSERT_TRUE(exec.has_value());
    EXPECT_FALSE(exec->success);
    EXPECT_NE(exec->error.find("actuator offline"), std::string::npos);
    EXPECT_EQ(store.getPattern("a")->failure_count, 1);
}

TEST(ProceduralTest, LearnFromExperienceSeedsPatternsAndDecisions) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    Attributes ctx = {{"event_type", "shock"}};

    std::string good = store.learnFromExperience(ctx, {{"absorb", {}}}, "recovered", true);
    auto p = store.getPattern(good);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->automation_level, 0.3, 1e-12);
    EXPECT_EQ(p->success_count, 1);
    EXPECT_EQ(p->total_executions, 1);
    EXPECT_EQ(p->trigger_conditions, ctx);

    std::string bad = store.learnFromExperience({{"event_type", "noise"}}, {}, "worse", false);
    EXPECT_NE(good, bad);
    EXPECT_NEAR(store.getPattern(bad)->automation_level, 0.1, 1e-12);
    EXPECT_EQ(store.getPattern(bad)->failure_count, 1);

    EXPECT_EQ(store.patternCount(), 2u);
    EXPECT_EQ(store.decisionPatternCount(), 2u);
    EXPECT_EQ(store.getDecisionRecommendation(ctx), std::optional<std::string>("absorb"));
    EXPECT_EQ(store.getDecisionRecommendation({{"event_type", "noise"}}),
              std::optional<std::string>("unknown"));
}

TEST(ProceduralTest, DecisionRecommendationNeedsStrongMatch) {
    ProceduralStore store;
    DecisionPattern d;
    d.pattern_id = "d1";
    d.conditions = {{"a", "1"}, {"b", "2"}};
    d.decision = "dampen";
    store.addDecisionPattern(d);

    EXPECT_FALSE(store.getDecisionRecommendation({{"a", "1"}}).has_value());   // 0.5
    EXPECT_EQ(*store.getDecisionRecommendation({{"a", "1"}, {"b", "2"}}), "dampen");
    EXPECT_FALSE(store.getDecisionRecommendation({}).has_value());
}

TEST(ProceduralTest, OptimizeRemovesWeakDecaysFailingKeepsStrong) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);

    ProceduralPattern weak = makePattern("weak", "amplify", {{"k", "weak"}});
    weak.failure_count = 1;
    weak.total_executions = 1;
    weak.automation_level = 0.1;
    store.addPattern(weak);

    ProceduralPattern strong = makePattern("strong", "absorb", {{"k", "strong"}});
    strong.success_count = 9;
    strong.failure_count = 1;
    strong.total_executions = 10;
    strong.success_rate = 0.9;
    strong.automation_level = 0.5;
    store.addPattern(strong);

    ProceduralPattern failing = makePattern("failing", "dampen", {{"k", "failing"}});
    failing.success_count = 1;
    failing.failure_count = 4;
    failing.total_executions = 5;
    failing.success_rate = 0.2;
    failing.automation_level = 0.5;
    store.addPattern(failing);

    EXPECT_EQ(store.optimizePatterns(), 2);
    EXPECT_FALSE(store.getPattern("weak").has_value());

    auto kept = store.getPattern("strong");
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept->success_count, 9);
    EXPECT_EQ(kept->total_executions, 10);
    EXPECT_NEAR(kept->automation_level, 0.5, 1e-12);

    EXPECT_NEAR(store.getPattern("failing")->automation_level, 0.4, 1e-12);

    for (const auto& p : store.patterns()) {
        EXPECT_FALSE(p.effectiveness() < 0.2 && p.total_executions < 3);
    }
}

TEST(ProceduralTest, OptimizeMergesDuplicatesIntoOldest) {
    auto clock = std::make_shared<ManualClock>();
    ProceduralStore store({}, clock);
    Attributes ctx = {{"event_type", "recovery"}};

    std::string first = store.learnFromExperience(ctx, {{"absorb", {{"action_id", "x"}}}}, "ok", true);
    clock->advance(1.0);
    std::string second = store.learnFromExperience(ctx, {{"absorb", {{"action_id", "y"}}}}, "ok", true);
    ASSERT_EQ(store.patternCount(), 2u);

    EXPECT_EQ(store.optimizePatterns(), 2);
    ASSERT_EQ(store.patternCount(), 1u);
    auto merged = store.getPattern(first);
    ASSERT_TRUE(merged.has_value());
    EXPECT_FALSE(store.getPattern(second).has_value());
    EXPECT_EQ(merged->success_count, 2);
    EXPECT_EQ(merged->total_executions, 2);
    EXPECT_DOUBLE_EQ(merged->success_rate, 1.0);
}

TEST(ProceduralTest, AddPatternMergesExistingId) {
    ProceduralStore store;
    ProceduralPattern p = makePattern("p", "absorb", {});
    p.success_count = 2;
    p.total_executions = 2;
    store.addPattern(p);

    ProceduralPattern more = makePattern("p", "absorb", {});
    more.failure_count = 2;
    more.total_executions = 2;
    store.addPattern(more);

    auto merged = store.getPattern("p");
    EXPECT_EQ(merged->total_executions, 4);
    EXPECT_DOUBLE_EQ(merged->success_rate, 0.5);
    EXPECT_EQ(store.patternCount(), 1u);
    EXPECT_THROW(store.addPattern(makePattern("", "absorb", {})), InvalidArgumentError);
}
