#include <gtest/gtest.h>

#include <cstdint>
#include <set>

#include "cdp/combat/deterministic_random.hpp"

using cdp::combat::DeterministicRandomSource;
using cdp::foundation::EntityId;

TEST(DeterministicRandomTest, SameKeySameValue) {
    DeterministicRandomSource a(42);
    DeterministicRandomSource b(42);
    for (uint64_t counter = 0; counter < 64; ++counter) {
        EXPECT_EQ(a.NextU32(EntityId(7), 3, counter), b.NextU32(EntityId(7), 3, counter));
    }
}

TEST(DeterministicRandomTest, CallOrderDoesNotMatter) {
    DeterministicRandomSource rng(99);
    auto later = rng.NextU32(EntityId(1), 10, 5);
    (void)rng.NextU32(EntityId(2), 0, 0);
    (void)rng.NextU32(EntityId(3), 1, 1);
    EXPECT_EQ(rng.NextU32(EntityId(1), 10, 5), later);
}

TEST(DeterministicRandomTest, EveryKeyComponentMatters) {
    DeterministicRandomSource rng(1234);
    DeterministicRandomSource otherSeed(1235);
    const auto base = rng.NextU32(EntityId(5), 100, 0);

    EXPECT_NE(otherSeed.NextU32(EntityId(5), 100, 0), base);
    EXPECT_NE(rng.NextU32(EntityId(6), 100, 0), base);
    EXPECT_NE(rng.NextU32(EntityId(5), 101, 0), base);
    EXPECT_NE(rng.NextU32(EntityId(5), 100, 1), base);
}

TEST(DeterministicRandomTest, ConsecutiveCountersDoNotCollide) {
    DeterministicRandomSource rng(0x5EED);
    std::set<uint32_t> seen;
    for (uint64_t counter = 0; counter < 1000; ++counter) {
        seen.insert(rng.NextU32(EntityId(1), 0, counter));
    }
    // 1000 draws from 2^32; a collision is astronomically unlikely.
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(DeterministicRandomTest, RollStaysInUnitInterval) {
    DeterministicRandomSource rng(7);
    for (uint64_t tick = 0; tick < 500; ++tick) {
        float value = rng.Roll(EntityId(3), tick, tick * 3);
        EXPECT_GE(value, 0.0f);
        EXPECT_LT(value, 1.0f);
    }
}

TEST(DeterministicRandomTest, RollChanceEdges) {
    DeterministicRandomSource rng(7);
    for (uint64_t counter = 0; counter < 100; ++counter) {
        EXPECT_FALSE(rng.RollChance(0.0f, EntityId(1), 0, counter));
        EXPECT_FALSE(rng.RollChance(-0.5f, EntityId(1), 0, counter));
        EXPECT_TRUE(rng.RollChance(1.0f, EntityId(1), 0, counter));
        EXPECT_TRUE(rng.RollChance(3.0f, EntityId(1), 0, counter));
    }
}

TEST(DeterministicRandomTest, RollChanceRoughlyMatchesProbability) {
    DeterministicRandomSource rng(2024);
    int hits = 0;
    constexpr int kTrials = 20000;
    for (int i = 0; i < kTrials; ++i) {
        if (rng.RollChance(0.25f, EntityId(9), static_cast<uint64_t>(i / 10),
                           static_cast<uint64_t>(i))) {
            ++hits;
        }
    }
    EXPECT_NEAR(static_cast<double>(hits) / kTrials, 0.25, 0.02);
}

TEST(DeterministicRandomTest, SeedIsReported) {
    DeterministicRandomSource rng(0xABCDEF);
    EXPECT_EQ(rng.Seed(), 0xABCDEFu);
}
