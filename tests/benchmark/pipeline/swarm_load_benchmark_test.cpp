/// @file swarm_load_benchmark_test.cpp
/// @brief Sustained-load benchmark: a 500-member swarm and a boss
///        trading damage through the pipeline for 600 ticks.
///
/// Measures per-tick drain latency and checks that the pools never
/// grow past their configured size.
///
/// Acceptance criterion: median tick (submit + drain + reap) <= 5ms.

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <vector>

#include "cdp/combat/entity_registry.hpp"
#include "cdp/entities/boss_entity.hpp"
#include "cdp/entities/swarm_pool.hpp"
#include "cdp/foundation/game_logger.hpp"
#include "cdp/pipeline/damage_pipeline.hpp"

using namespace cdp::pipeline;
using cdp::combat::DamageTag;
using cdp::combat::EntityRegistry;
using cdp::combat::Vector2;
using cdp::entities::BossEntity;
using cdp::entities::SwarmPool;

namespace {

// Benchmark parameters
constexpr std::size_t kSwarmSize = 500;
constexpr int kTicks = 600;
constexpr std::size_t kQueueCapacity = 1024;
constexpr double kMaxMedianTickMs = 5.0;

} // anonymous namespace

// ===========================================================================
// Benchmark Fixture
// ===========================================================================

class SwarmLoadBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        // Keep per-request warnings out of the timing.
        savedCombatLevel_ = cdp::foundation::GameLogger::instance().getCategoryLevel(
            cdp::foundation::LogCategory::Combat);
        cdp::foundation::GameLogger::instance().setCategoryLevel(
            cdp::foundation::LogCategory::Combat, cdp::foundation::LogLevel::Error);

        config_.seed = 0x5EED;
        config_.intake.ringCapacity = kQueueCapacity;
        config_.intake.requestPoolSize = kQueueCapacity;
        config_.intake.tagPoolSize = kQueueCapacity;
        config_.maxPerTick = kQueueCapacity;
        config_.registryCapacity = kSwarmSize + 1;

        registry_ = std::make_unique<EntityRegistry>(config_.registryCapacity);
        swarm_ = std::make_unique<SwarmPool>(*registry_, kSwarmSize);
        for (std::size_t i = 0; i < kSwarmSize; ++i) {
            auto x = static_cast<float>(i % 25);
            auto y = static_cast<float>(i / 25);
            ASSERT_TRUE(swarm_->Spawn(100, Vector2{x, y}).hasValue());
        }
        // Large enough to survive the whole run.
        boss_ = std::make_unique<BossEntity>("Warden", 10'000'000);
        bossId_ = boss_->Attach(*registry_).value();
        pipeline_ = std::make_unique<DamagePipeline>(config_, *registry_);
    }

    void TearDown() override {
        pipeline_.reset();
        boss_.reset();
        swarm_.reset();
        registry_.reset();
        cdp::foundation::GameLogger::instance().setCategoryLevel(
            cdp::foundation::LogCategory::Combat, savedCombatLevel_);
    }

    PipelineConfig config_;
    std::unique_ptr<EntityRegistry> registry_;
    std::unique_ptr<SwarmPool> swarm_;
    std::unique_ptr<BossEntity> boss_;
    std::unique_ptr<DamagePipeline> pipeline_;
    cdp::foundation::EntityId bossId_;
    cdp::foundation::LogLevel savedCombatLevel_ = cdp::foundation::LogLevel::Info;
};

// ===========================================================================
// Sustained swarm load
// ===========================================================================

TEST_F(SwarmLoadBenchmark, SustainedLoadWithoutPoolGrowth) {
    const auto requestsCreated = pipeline_->Intake().RequestPool().TotalCreated();
    const auto tagsCreated = pipeline_->Intake().TagPool().TotalCreated();

    std::vector<double> latencies;
    latencies.reserve(static_cast<std::size_t>(kTicks));
    std::size_t maxDrained = 0;

    for (int tick = 0; tick < kTicks; ++tick) {
        auto start = std::chrono::high_resolution_clock::now();

        for (auto id : swarm_->Ids()) {
            pipeline_->SubmitDamage(id, bossId_, 3, {DamageTag::Melee, DamageTag::CritEligible});
        }
        auto ids = swarm_->Ids();
        for (std::size_t k = 0; k < 4 && !ids.empty(); ++k) {
            auto victim = ids[(static_cast<std::size_t>(tick) * 7 + k * 97) % ids.size()];
            pipeline_->SubmitDamage(bossId_, victim, 40, {DamageTag::Area, DamageTag::CritEligible},
                                    Vector2{1.0f, 0.0f});
        }
        maxDrained = std::max(maxDrained, pipeline_->Tick());
        swarm_->ReapDead();

        auto end = std::chrono::high_resolution_clock::now();
        latencies.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    std::sort(latencies.begin(), latencies.end());

    double minMs = latencies.front();
    double maxMs = latencies.back();
    double medianMs = latencies[latencies.size() / 2];
    double avgMs = std::accumulate(latencies.begin(), latencies.end(), 0.0) /
                   static_cast<double>(latencies.size());
    double p99Ms = latencies[static_cast<std::size_t>(
        static_cast<double>(latencies.size()) * 0.99)];

    auto stats = pipeline_->Stats();

    std::cout << "\n"
              << "+-------------------------------------------------+\n"
              << "|  Swarm Sustained Load Benchmark                  |\n"
              << "+-------------------------------------------------+\n"
              << "|  Swarm:         " << std::setw(10) << kSwarmSize
              << "                    |\n"
              << "|  Ticks:         " << std::setw(10) << kTicks
              << "                    |\n"
              << "|  Resolved:      " << std::setw(10) << stats.batch.resolved
              << "                    |\n"
              << "|  Survivors:     " << std::setw(10) << swarm_->Size()
              << "                    |\n"
              << "+-------------------------------------------------+\n"
              << "|  Min:           " << std::setw(10) << std::fixed
              << std::setprecision(4) << minMs << " ms               |\n"
              << "|  Avg:           " << std::setw(10) << avgMs
              << " ms               |\n"
              << "|  Median:        " << std::setw(10) << medianMs
              << " ms               |\n"
              << "|  p99:           " << std::setw(10) << p99Ms
              << " ms               |\n"
              << "|  Max:           " << std::setw(10) << maxMs
              << " ms               |\n"
              << "+-------------------------------------------------+\n"
              << std::endl;

    EXPECT_EQ(stats.requestPoolOverflows, 0u);
    EXPECT_EQ(stats.tagPoolOverflows, 0u);
    EXPECT_EQ(stats.intake.droppedOverflow, 0u);
    EXPECT_EQ(stats.requestsInUse, 0u);
    EXPECT_EQ(pipeline_->Intake().RequestPool().TotalCreated(), requestsCreated);
    EXPECT_EQ(pipeline_->Intake().TagPool().TotalCreated(), tagsCreated);
    EXPECT_LE(maxDrained, config_.maxPerTick);
    EXPECT_LE(stats.intake.maxWatermark, kSwarmSize + 4);

    EXPECT_LE(medianMs, kMaxMedianTickMs)
        << "Median tick " << medianMs << " ms exceeds " << kMaxMedianTickMs
        << " ms for " << kSwarmSize << " swarm members";
}

// ===========================================================================
// Overload: drop-oldest keeps memory flat
// ===========================================================================

TEST_F(SwarmLoadBenchmark, OverloadDropsWithoutAllocating) {
    const auto requestsCreated = pipeline_->Intake().RequestPool().TotalCreated();

    // Four volleys per tick against a 1024-slot queue.
    for (int tick = 0; tick < 50; ++tick) {
        for (int volley = 0; volley < 4; ++volley) {
            for (auto id : swarm_->Ids()) {
                pipeline_->SubmitDamage(id, bossId_, 1, {DamageTag::Ranged});
            }
        }
        pipeline_->Tick();
    }

    auto stats = pipeline_->Stats();
    EXPECT_GT(stats.intake.droppedOverflow, 0u);
    EXPECT_EQ(stats.requestPoolOverflows, 0u);
    EXPECT_EQ(stats.tagPoolOverflows, 0u);
    EXPECT_EQ(pipeline_->Intake().RequestPool().TotalCreated(), requestsCreated);
    EXPECT_EQ(stats.intake.enqueued,
              stats.batch.processed + stats.intake.droppedOverflow + stats.queueDepth);
}
