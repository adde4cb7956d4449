#include <gtest/gtest.h>

#include <deque>
#include <initializer_list>
#include <limits>
#include <vector>

#include "cdp/combat/damage_resolver.hpp"
#include "cdp/combat/deterministic_random.hpp"
#include "cdp/combat/entity_registry.hpp"
#include "recording_binding.hpp"

using namespace cdp::combat;
using cdp::test::RecordingBinding;
using cdp::test::registerEntity;

// ---------------------------------------------------------------------------
// Pure damage calculation
// ---------------------------------------------------------------------------

TEST(CalculateDamageTest, BaseAmountPassesThrough) {
    EXPECT_EQ(DamageResolver::CalculateDamage(30, 1.0f, false, 2.0f), 30);
}

TEST(CalculateDamageTest, CriticalAppliesMultiplier) {
    EXPECT_EQ(DamageResolver::CalculateDamage(30, 1.0f, true, 2.0f), 60);
    EXPECT_EQ(DamageResolver::CalculateDamage(30, 1.0f, true, 1.5f), 45);
}

TEST(CalculateDamageTest, TagMultiplierIsRounded) {
    EXPECT_EQ(DamageResolver::CalculateDamage(10, 0.8f, false, 2.0f), 8);
    EXPECT_EQ(DamageResolver::CalculateDamage(3, 0.5f, false, 2.0f), 2);
}

TEST(CalculateDamageTest, NonPositiveBaseYieldsZero) {
    EXPECT_EQ(DamageResolver::CalculateDamage(0, 1.0f, true, 2.0f), 0);
    EXPECT_EQ(DamageResolver::CalculateDamage(-25, 1.0f, false, 2.0f), 0);
}

TEST(CalculateDamageTest, NegativeMultipliersClampToZero) {
    EXPECT_EQ(DamageResolver::CalculateDamage(30, -1.0f, false, 2.0f), 0);
    EXPECT_EQ(DamageResolver::CalculateDamage(30, 1.0f, true, -2.0f), 0);
}

TEST(CalculateDamageTest, HugeResultSaturates) {
    EXPECT_EQ(DamageResolver::CalculateDamage(std::numeric_limits<int32_t>::max(), 4.0f, true, 4.0f),
              std::numeric_limits<int32_t>::max());
}

// ---------------------------------------------------------------------------
// Resolution against the registry
// ---------------------------------------------------------------------------

class DamageResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registerEntity(registry_, kAttacker, 100, binding_).hasValue());
        ASSERT_TRUE(registerEntity(registry_, kBoss, 100, binding_).hasValue());
    }

    DamageRequest makeRequest(EntityId target, int32_t amount,
                              std::initializer_list<DamageTag> tags = {}) {
        tags_.emplace_back();
        for (auto tag : tags) {
            tags_.back().Add(tag);
        }
        DamageRequest request;
        request.sequence = ++sequence_;
        request.source = kAttacker;
        request.target = target;
        request.baseAmount = amount;
        request.tags = &tags_.back();
        return request;
    }

    static constexpr EntityId kAttacker{1};
    static constexpr EntityId kBoss{2};

    EntityRegistry registry_{8};
    RecordingBinding binding_;
    DeterministicRandomSource random_{0x5EED};
    std::deque<DamageTagList> tags_;
    uint64_t sequence_ = 0;
};

TEST_F(DamageResolverTest, HitWithoutCritReducesHealth) {
    ResolverConfig cfg;
    cfg.critChance = 0.0f;
    DamageResolver resolver(registry_, random_, cfg);

    auto result = resolver.Resolve(makeRequest(kBoss, 30, {DamageTag::CritEligible}), 0);

    EXPECT_EQ(result.amount, 30);
    EXPECT_FALSE(result.wasCritical);
    EXPECT_FALSE(result.targetDied);
    EXPECT_EQ(result.remainingHealth, 70);
    EXPECT_EQ(result.target, kBoss);
    EXPECT_EQ(registry_.Get(kBoss)->health, 70);
    EXPECT_TRUE(binding_.deaths.empty());
}

TEST_F(DamageResolverTest, GuaranteedCritDoublesDamage) {
    ResolverConfig cfg;
    cfg.critChance = 1.0f;
    DamageResolver resolver(registry_, random_, cfg);

    auto result = resolver.Resolve(makeRequest(kBoss, 20, {DamageTag::CritEligible}), 0);
    EXPECT_TRUE(result.wasCritical);
    EXPECT_EQ(result.amount, 40);
}

TEST_F(DamageResolverTest, CritRequiresCritEligibleTag) {
    ResolverConfig cfg;
    cfg.critChance = 1.0f;
    DamageResolver resolver(registry_, random_, cfg);

    auto result = resolver.Resolve(makeRequest(kBoss, 20, {DamageTag::Melee}), 0);
    EXPECT_FALSE(result.wasCritical);
    EXPECT_EQ(result.amount, 20);
}

TEST_F(DamageResolverTest, LethalHitClampsAndMarksDeadOnce) {
    registry_.SetHealth(kBoss, 20);
    binding_.deltas.clear();
    ResolverConfig cfg;
    cfg.critChance = 0.0f;
    DamageResolver resolver(registry_, random_, cfg);

    auto result = resolver.Resolve(makeRequest(kBoss, 25), 0);

    EXPECT_EQ(result.amount, 25);
    EXPECT_EQ(result.remainingHealth, 0);
    EXPECT_TRUE(result.targetDied);
    EXPECT_EQ(registry_.Get(kBoss)->health, 0);
    EXPECT_FALSE(registry_.IsAlive(kBoss));
    ASSERT_EQ(binding_.deltas.size(), 1u);
    EXPECT_EQ(binding_.deltas[0].delta, -20);
    EXPECT_EQ(binding_.deaths.size(), 1u);
}

TEST_F(DamageResolverTest, ZeroDamageStillReportsResult) {
    DamageResolver resolver(registry_, random_);
    auto result = resolver.Resolve(makeRequest(kBoss, 0), 3);
    EXPECT_EQ(result.amount, 0);
    EXPECT_EQ(result.tick, 3u);
    EXPECT_EQ(result.remainingHealth, 100);
}

TEST_F(DamageResolverTest, MissingTargetLeavesRegistryUntouched) {
    DamageResolver resolver(registry_, random_);
    auto result = resolver.Resolve(makeRequest(EntityId(77), 10), 0);
    EXPECT_FALSE(result.targetDied);
    EXPECT_EQ(result.remainingHealth, 0);
    EXPECT_TRUE(binding_.deltas.empty());
}

TEST_F(DamageResolverTest, TagMultipliersCombine) {
    ResolverConfig cfg;
    cfg.critChance = 0.0f;
    cfg.tagMultipliers[static_cast<std::size_t>(DamageTag::Area)] = 0.5f;
    cfg.tagMultipliers[static_cast<std::size_t>(DamageTag::Piercing)] = 1.5f;
    DamageResolver resolver(registry_, random_, cfg);

    DamageTagList tags;
    tags.Add(DamageTag::Area);
    tags.Add(DamageTag::Piercing);
    tags.Add(DamageTag::Area);
    EXPECT_FLOAT_EQ(resolver.TagMultiplier(&tags), 0.75f);
    EXPECT_FLOAT_EQ(resolver.TagMultiplier(nullptr), 1.0f);

    auto result = resolver.Resolve(makeRequest(kBoss, 40, {DamageTag::Area, DamageTag::Piercing}), 0);
    EXPECT_EQ(result.amount, 30);
}

TEST_F(DamageResolverTest, PerSourceCounterAdvances) {
    DamageResolver resolver(registry_, random_);
    EXPECT_EQ(resolver.RequestCounter(kAttacker), 0u);

    (void)resolver.Resolve(makeRequest(kBoss, 1), 0);
    (void)resolver.Resolve(makeRequest(kBoss, 1), 0);
    EXPECT_EQ(resolver.RequestCounter(kAttacker), 2u);
    EXPECT_EQ(registry_.Get(kAttacker)->requestCounter, 2u);

    registry_.ResetRequestCounters();
    EXPECT_EQ(resolver.RequestCounter(kAttacker), 0u);
}

TEST_F(DamageResolverTest, CounterLeavesWithUnregisteredSource) {
    DamageResolver resolver(registry_, random_);
    (void)resolver.Resolve(makeRequest(kBoss, 1), 0);
    ASSERT_EQ(resolver.RequestCounter(kAttacker), 1u);

    ASSERT_TRUE(registry_.Unregister(kAttacker));
    EXPECT_EQ(resolver.RequestCounter(kAttacker), 0u);

    // A source resolved after unregistering rolls with counter 0 and
    // leaves nothing behind.
    (void)resolver.Resolve(makeRequest(kBoss, 1), 1);
    EXPECT_EQ(resolver.RequestCounter(kAttacker), 0u);
    EXPECT_EQ(registry_.Count(), 1u);
}

TEST_F(DamageResolverTest, CritSequenceIsReproducible) {
    ResolverConfig cfg;
    cfg.critChance = 0.5f;

    auto run = [&](DeterministicRandomSource& random) {
        EntityRegistry registry(8);
        RecordingBinding binding;
        EXPECT_TRUE(registerEntity(registry, kAttacker, 100, binding).hasValue());
        EXPECT_TRUE(registerEntity(registry, kBoss, 1'000'000, binding).hasValue());
        DamageResolver resolver(registry, random, cfg);

        std::vector<bool> crits;
        for (uint64_t tick = 0; tick < 50; ++tick) {
            for (int i = 0; i < 4; ++i) {
                crits.push_back(
                    resolver.Resolve(makeRequest(kBoss, 10, {DamageTag::CritEligible}), tick)
                        .wasCritical);
            }
        }
        return crits;
    };

    DeterministicRandomSource a(0x5EED);
    DeterministicRandomSource b(0x5EED);
    DeterministicRandomSource other(0xBEEF);
    auto first = run(a);
    EXPECT_EQ(first, run(b));
    EXPECT_NE(first, run(other));
}
