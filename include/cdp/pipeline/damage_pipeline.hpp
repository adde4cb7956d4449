#pragma once

/// @file damage_pipeline.hpp
/// @brief DamagePipeline: intake, batch processing and resolution wired
///        together from one PipelineConfig.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>

#include "cdp/combat/damage_resolver.hpp"
#include "cdp/combat/deterministic_random.hpp"
#include "cdp/combat/entity_registry.hpp"
#include "cdp/foundation/game_metrics.hpp"
#include "cdp/pipeline/batch_processor.hpp"
#include "cdp/pipeline/event_intake_adapter.hpp"
#include "cdp/pipeline/pipeline_config.hpp"

namespace cdp::pipeline {

/// Facade over the whole damage path.
///
/// Producers call SubmitDamage() at any point during a tick; the
/// simulation calls Tick() once per fixed step.  The registry is
/// borrowed and must outlive the pipeline.
///
/// Example:
/// @code
///   DamagePipeline pipeline(config, EntityRegistry::instance());
///   pipeline.OnDamageResult().connect([](const DamageResult& r) { ... });
///   pipeline.SubmitDamage(attacker, target, 30, {DamageTag::Melee});
///   pipeline.Tick();
/// @endcode
class DamagePipeline {
public:
    DamagePipeline(const PipelineConfig& config, combat::EntityRegistry& registry,
                   WarningThrottle::Clock clock = nullptr);

    DamagePipeline(const DamagePipeline&) = delete;
    DamagePipeline& operator=(const DamagePipeline&) = delete;

    void SubmitDamage(combat::EntityId source, combat::EntityId target, int32_t baseAmount,
                      std::span<const combat::DamageTag> tags,
                      std::optional<combat::Vector2> knockback = std::nullopt) {
        intake_.SubmitDamage(source, target, baseAmount, tags, knockback);
    }

    void SubmitDamage(combat::EntityId source, combat::EntityId target, int32_t baseAmount,
                      std::initializer_list<combat::DamageTag> tags = {},
                      std::optional<combat::Vector2> knockback = std::nullopt) {
        intake_.SubmitDamage(source, target, baseAmount, tags, knockback);
    }

    /// Run one batch.  @return requests dequeued this tick.
    std::size_t Tick() { return processor_.ProcessTick(); }

    [[nodiscard]] PipelineStats Stats() const { return processor_.Stats(); }

    [[nodiscard]] foundation::Signal<const combat::DamageResult&>& OnDamageResult() noexcept {
        return processor_.OnDamageResult();
    }

    /// Mirror the current counters into @p metrics as cdp_* gauges.
    void PublishMetrics(foundation::GameMetrics& metrics) const;

    [[nodiscard]] const PipelineConfig& Config() const noexcept { return config_; }
    [[nodiscard]] EventIntakeAdapter& Intake() noexcept { return intake_; }
    [[nodiscard]] BatchProcessor& Processor() noexcept { return processor_; }
    [[nodiscard]] combat::DamageResolver& Resolver() noexcept { return resolver_; }
    [[nodiscard]] const combat::DeterministicRandomSource& Random() const noexcept {
        return random_;
    }

private:
    PipelineConfig config_;
    combat::EntityRegistry& registry_;
    combat::DeterministicRandomSource random_;
    combat::DamageResolver resolver_;
    EventIntakeAdapter intake_;
    BatchProcessor processor_;
};

}  // namespace cdp::pipeline
