#pragma once

/// @file pipeline_config.hpp
/// @brief Aggregate configuration for the damage pipeline.

#include <cstddef>
#include <cstdint>

#include "cdp/combat/damage_resolver.hpp"
#include "cdp/foundation/config_manager.hpp"
#include "cdp/foundation/game_result.hpp"
#include "cdp/pipeline/event_intake_adapter.hpp"

namespace cdp::pipeline {

/// Everything needed to assemble a DamagePipeline.
///
/// Defaults match config/combat_pipeline.yaml.
struct PipelineConfig {
    IntakeConfig intake;
    combat::ResolverConfig resolver;

    /// Requests drained per tick at most.
    std::size_t maxPerTick = 256;

    /// Run seed for every combat roll.
    uint64_t seed = 0x5EED;

    /// Expected number of registered entities.
    std::size_t registryCapacity = 1024;

    /// Simulation frequency in Hz.
    uint32_t tickRate = 30;

    /// Build from the "pipeline.*", "combat.*", "registry.*" and
    /// "simulation.*" keys.  Absent keys keep their defaults.
    ///
    /// @return ConfigTypeMismatch for a key of the wrong type, or the
    ///         Validate() error.
    static foundation::GameResult<PipelineConfig> FromConfig(
        const foundation::ConfigManager& config);

    /// Reject configurations the pipeline cannot run with.
    /// @return InvalidArgument naming the offending field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

}  // namespace cdp::pipeline
