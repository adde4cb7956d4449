/// @file main.cpp
/// @brief combat_sim: headless driver for the damage pipeline.
///
/// Spawns a swarm plus one boss, runs deterministic attack waves through
/// the pipeline for a fixed number of manual steps, then prints a
/// summary and the metrics scrape.

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "cdp/combat/damage_types.hpp"
#include "cdp/combat/entity_registry.hpp"
#include "cdp/entities/boss_entity.hpp"
#include "cdp/entities/swarm_pool.hpp"
#include "cdp/foundation/config_manager.hpp"
#include "cdp/foundation/game_logger.hpp"
#include "cdp/foundation/game_metrics.hpp"
#include "cdp/pipeline/damage_pipeline.hpp"
#include "cdp/pipeline/pipeline_config.hpp"
#include "cdp/service/simulation_loop.hpp"
#include "cdp/version.hpp"

namespace {

using cdp::combat::DamageTag;
using cdp::foundation::EntityId;
using cdp::foundation::LogCategory;

struct ScenarioConfig {
    uint32_t swarmSize = 500;
    int32_t swarmHealth = 100;
    int32_t bossHealth = 20000;
    uint64_t ticks = 600;
};

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

ScenarioConfig buildScenarioConfig(const cdp::foundation::ConfigManager& config) {
    ScenarioConfig cfg;

    auto swarmSize = config.get<uint32_t>("simulation.swarm_size");
    if (swarmSize) {
        cfg.swarmSize = swarmSize.value();
    }

    auto swarmHealth = config.get<int32_t>("simulation.swarm_health");
    if (swarmHealth) {
        cfg.swarmHealth = swarmHealth.value();
    }

    auto bossHealth = config.get<int32_t>("simulation.boss_health");
    if (bossHealth) {
        cfg.bossHealth = bossHealth.value();
    }

    auto ticks = config.get<uint64_t>("simulation.ticks");
    if (ticks) {
        cfg.ticks = ticks.value();
    }

    return cfg;
}

/// One wave: a tenth of the swarm strikes the boss, the boss sweeps a
/// handful of swarm members.  Selection depends only on the step index.
void submitWave(cdp::pipeline::DamagePipeline& pipeline,
                const cdp::entities::SwarmPool& swarm,
                const cdp::entities::BossEntity& boss,
                uint64_t step) {
    const auto ids = swarm.Ids();
    if (ids.empty() || boss.IsDefeated()) {
        return;
    }

    for (std::size_t i = step % 10; i < ids.size(); i += 10) {
        if (swarm.IsPendingDespawn(ids[i])) {
            continue;
        }
        const DamageTag tags[] = {DamageTag::Melee, DamageTag::CritEligible};
        pipeline.SubmitDamage(ids[i], boss.Id(), 3, tags);
    }

    const auto position = cdp::combat::Vector2{0.0f, 0.0f};
    for (std::size_t k = 0; k < 4; ++k) {
        const auto& target = ids[(step * 7 + k * 13) % ids.size()];
        const auto knockback = swarm.Position(target).value_or(position) - position;
        pipeline.SubmitDamage(boss.Id(), target, 40,
                              {DamageTag::Area, DamageTag::CritEligible}, knockback);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    cdp::foundation::ConfigManager config;
    auto configPath = parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        auto loadResult = config.load(configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto pipelineConfig = cdp::pipeline::PipelineConfig::FromConfig(config);
    if (!pipelineConfig) {
        std::cerr << "Invalid pipeline config: " << pipelineConfig.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const auto scenario = buildScenarioConfig(config);
    const auto& pcfg = pipelineConfig.value();

    CDP_LOG_INFO(LogCategory::Core,
                 "combat_sim " + std::string(cdp::Version::string) + " seed=" +
                     std::to_string(pcfg.seed) + " swarm=" +
                     std::to_string(scenario.swarmSize));

    auto& registry = cdp::combat::EntityRegistry::instance();
    registry.Initialize(pcfg.registryCapacity);

    cdp::pipeline::DamagePipeline pipeline(pcfg, registry);

    cdp::entities::SwarmPool swarm(registry, scenario.swarmSize);
    for (uint32_t i = 0; i < scenario.swarmSize; ++i) {
        const auto position = cdp::combat::Vector2{static_cast<float>(i % 25) * 2.0f,
                                                   static_cast<float>(i / 25) * 2.0f};
        auto spawned = swarm.Spawn(scenario.swarmHealth, position);
        if (!spawned) {
            std::cerr << "Failed to spawn swarm member: " << spawned.error().describe() << "\n";
            return EXIT_FAILURE;
        }
    }

    cdp::entities::BossEntity boss("Warden", scenario.bossHealth,
                                   std::vector<float>{0.66f, 0.33f});
    auto attached = boss.Attach(registry);
    if (!attached) {
        std::cerr << "Failed to attach boss: " << attached.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    uint64_t criticalHits = 0;
    uint64_t kills = 0;
    auto conn = pipeline.OnDamageResult().connect(
        [&](const cdp::combat::DamageResult& result) {
            criticalHits += result.wasCritical ? 1 : 0;
            kills += result.targetDied ? 1 : 0;
        });

    cdp::service::SimulationLoop loop(pcfg.tickRate);
    loop.setStepCallback([&](uint64_t step, float /*dt*/) {
        submitWave(pipeline, swarm, boss, step);
        pipeline.Tick();
        swarm.ReapDead();
    });

    auto ran = loop.runSteps(scenario.ticks);
    if (!ran) {
        std::cerr << "Simulation failed: " << ran.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    pipeline.OnDamageResult().disconnect(conn);

    const auto stats = pipeline.Stats();
    std::cout << "steps=" << loop.stepCount() << " overruns=" << loop.overrunCount()
              << " enqueued=" << stats.intake.enqueued
              << " processed=" << stats.batch.processed
              << " resolved=" << stats.batch.resolved
              << " dropped=" << stats.intake.droppedOverflow
              << " crits=" << criticalHits << " kills=" << kills
              << " swarm_remaining=" << swarm.Size()
              << " boss_health=" << boss.Health() << "/" << boss.MaxHealth()
              << " boss_phase=" << boss.Phase()
              << (boss.IsDefeated() ? " boss_defeated" : "") << "\n";

    auto& metrics = cdp::foundation::GameMetrics::instance();
    metrics.incrementCounter("cdp_sim_steps_total", loop.stepCount());
    pipeline.PublishMetrics(metrics);
    std::cout << metrics.scrape();

    cdp::foundation::GameLogger::instance().flush();
    boss.Detach();
    registry.Clear();
    return EXIT_SUCCESS;
}
