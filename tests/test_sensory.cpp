#include <gtest/gtest.h>
#include "memory/sensory_buffer.hpp"

using namespace vita;

namespace {

SensoryBuffer makeBuffer(std::shared_ptr<ManualClock> clock, size_t capacity = 256,
                         double ttl = 30.0) {
    SensoryConfig config;
    config.capacity = capacity;
    config.ttl_seconds = ttl;
    return SensoryBuffer(config, clock);
}

} // namespace

TEST(SensoryTest, EvictsOldestWhenFull) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock, 3);
    for (int i = 0; i < 5; i++) buffer.push(Event("e" + std::to_string(i), 0.1, i));

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.totalEvicted(), 2u);
    auto events = buffer.peekEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().type(), "e2");
    EXPECT_EQ(events.back().type(), "e4");
}

TEST(SensoryTest, HighSalienceEventPromotesAlone) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock);
    buffer.push(Event("shock", -0.9, 1.0));
    buffer.push(Event("noise", 0.2, 2.0));

    auto promoted = buffer.drainPromotable(0.8, 5);
    ASSERT_EQ(promoted.size(), 1u);
    EXPECT_EQ(promoted[0].type(), "shock");
    EXPECT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer.totalPromoted(), 1u);
}

TEST(SensoryTest, RepetitionThresholdIsExact) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock);
    for (int i = 0; i < 4; i++) buffer.push(Event("noise", 0.3, i));
    EXPECT_TRUE(buffer.peekPromotable(0.8, 5).empty());

    buffer.push(Event("noise", 0.3, 4.0));
    auto promoted = buffer.drainPromotable(0.8, 5);
    ASSERT_EQ(promoted.size(), 1u);
    EXPECT_EQ(promoted[0].metadata().at("repetitions"), "5");
    EXPECT_DOUBLE_EQ(promoted[0].timestamp(), 4.0);   // most recent occurrence
    EXPECT_TRUE(buffer.empty());
}

TEST(SensoryTest, PeekDoesNotConsumeUntilAcknowledged) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock);
    buffer.push(Event("shock", 0.95, 1.0));

    auto batch = buffer.peekPromotable(0.8, 5);
    ASSERT_EQ(batch.events.size(), 1u);
    EXPECT_EQ(buffer.size(), 1u);

    // A failed hand-off leaves the entry for the next scan
    auto again = buffer.peekPromotable(0.8, 5);
    EXPECT_EQ(again.events.size(), 1u);

    buffer.acknowledge(batch);
    EXPECT_TRUE(buffer.empty());
    buffer.acknowledge(batch);    // already gone: no effect
    EXPECT_TRUE(buffer.empty());
}

TEST(SensoryTest, AcknowledgeSkipsEvictedEntries) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock, 2);
    buffer.push(Event("shock", 0.9, 1.0));
    auto batch = buffer.peekPromotable(0.8, 5);

    buffer.push(Event("idle", 0.0, 2.0));
    buffer.push(Event("idle", 0.0, 3.0));    // evicts the shock
    buffer.acknowledge(batch);
    EXPECT_EQ(buffer.size(), 2u);
}

TEST(SensoryTest, ExpiredEntriesAreIgnoredAndPurged) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock, 256, 30.0);
    buffer.push(Event("shock", 0.9, 1.0));
    clock->advance(31.0);

    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_TRUE(buffer.peekPromotable(0.8, 5).empty());

    buffer.push(Event("noise", 0.1, 2.0));   // purges on write
    EXPECT_EQ(buffer.totalExpired(), 1u);
    EXPECT_EQ(buffer.size(), 1u);
}

TEST(SensoryTest, ZeroTtlNeverExpires) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock, 16, 0.0);
    buffer.push(Event("noise", 0.1, 1.0));
    clock->advance(1e6);
    EXPECT_EQ(buffer.size(), 1u);
}

TEST(SensoryTest, TypeStatsAndStatus) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock, 10);
    buffer.push(Event("noise", 0.2, 1.0));
    buffer.push(Event("noise", -0.4, 2.0));
    buffer.push(Event("decay", -0.1, 3.0));

    auto stats = buffer.typeStats("noise");
    EXPECT_EQ(stats.count, 2u);
    EXPECT_NEAR(stats.mean_intensity, -0.1, 1e-12);
    EXPECT_NEAR(stats.max_abs_intensity, 0.4, 1e-12);
    EXPECT_EQ(buffer.typeStats("shock").count, 0u);

    auto status = buffer.status();
    EXPECT_EQ(status["size"], 3);
    EXPECT_EQ(status["capacity"], 10);
    EXPECT_NEAR(status["utilization"].get<double>(), 0.3, 1e-12);
    EXPECT_EQ(status["total_added"], 3);
}

TEST(SensoryTest, TakeEventsRemovesOldestFirst) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock);
    buffer.push(Event("a", 0.1, 1.0));
    buffer.push(Event("b", 0.1, 2.0));
    buffer.push(Event("c", 0.1, 3.0));

    auto taken = buffer.takeEvents(2);
    ASSERT_EQ(taken.size(), 2u);
    EXPECT_EQ(taken[0].type(), "a");
    EXPECT_EQ(buffer.size(), 1u);
}

TEST(SensoryTest, SalientEntriesDoNotCountTowardRepetition) {
    auto clock = std::make_shared<ManualClock>();
    auto buffer = makeBuffer(clock);
    buffer.push(Event("shock", 0.9, 1.0));
    for (int i = 0; i < 4; i++) buffer.push(Event("shock", 0.2, 2.0 + i));

    auto batch = buffer.peekPromotable(0.8, 5);
    ASSERT_EQ(batch.events.size(), 1u);         // salient one only
    EXPECT_EQ(batch.consumed.size(), 1u);
}
