/// @file pipeline_config.cpp
/// @brief PipelineConfig loading and validation.

#include "cdp/pipeline/pipeline_config.hpp"

#include <string>
#include <utility>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::pipeline {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kTagMultiplierPrefix = "combat.tag_multipliers.";

/// Read @p key into @p out when present.  A type mismatch is returned.
template <typename T>
GameResult<void> readInto(const foundation::ConfigManager& config,
                          std::string_view key, T& out) {
    auto value = config.getOr<T>(key, out);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = value.value();
    return GameResult<void>::ok();
}

GameResult<void> readSize(const foundation::ConfigManager& config,
                          std::string_view key, std::size_t& out) {
    uint64_t wide = out;
    auto result = readInto<uint64_t>(config, key, wide);
    if (result) {
        out = static_cast<std::size_t>(wide);
    }
    return result;
}

}  // namespace

GameResult<PipelineConfig> PipelineConfig::FromConfig(const foundation::ConfigManager& config) {
    PipelineConfig cfg;

#define CDP_READ_OR_RETURN(expr)                                  \
    do {                                                          \
        auto cdp_read_result_ = (expr);                           \
        if (!cdp_read_result_) {                                  \
            return GameResult<PipelineConfig>::err(              \
                cdp_read_result_.error());                        \
        }                                                         \
    } while (false)

    CDP_READ_OR_RETURN(readSize(config, "pipeline.ring_capacity", cfg.intake.ringCapacity));
    CDP_READ_OR_RETURN(readSize(config, "pipeline.request_pool_size", cfg.intake.requestPoolSize));
    CDP_READ_OR_RETURN(readSize(config, "pipeline.tag_pool_size", cfg.intake.tagPoolSize));
    CDP_READ_OR_RETURN(readSize(config, "pipeline.max_per_tick", cfg.maxPerTick));

    int64_t intervalMs = cfg.intake.overflowWarningInterval.count();
    CDP_READ_OR_RETURN(readInto<int64_t>(config, "pipeline.overflow_warning_interval_ms",
                                         intervalMs));
    cfg.intake.overflowWarningInterval = std::chrono::milliseconds(intervalMs);

    CDP_READ_OR_RETURN(readInto<uint64_t>(config, "combat.seed", cfg.seed));
    CDP_READ_OR_RETURN(readInto<float>(config, "combat.crit_chance", cfg.resolver.critChance));
    CDP_READ_OR_RETURN(readInto<float>(config, "combat.crit_multiplier",
                                       cfg.resolver.critMultiplier));

    for (const auto& key : config.keysWithPrefix("combat.tag_multipliers")) {
        auto tag = combat::damageTagFromName(
            std::string_view(key).substr(kTagMultiplierPrefix.size()));
        if (!tag) {
            CDP_LOG_WARN(LogCategory::Config, "ignoring multiplier for unknown damage tag: " + key);
            continue;
        }
        CDP_READ_OR_RETURN(readInto<float>(
            config, key, cfg.resolver.tagMultipliers[static_cast<std::size_t>(*tag)]));
    }

    CDP_READ_OR_RETURN(readSize(config, "registry.capacity", cfg.registryCapacity));
    CDP_READ_OR_RETURN(readInto<uint32_t>(config, "simulation.tick_rate", cfg.tickRate));

#undef CDP_READ_OR_RETURN

    auto valid = cfg.Validate();
    if (!valid) {
        return GameResult<PipelineConfig>::err(valid.error());
    }
    return GameResult<PipelineConfig>::ok(std::move(cfg));
}

GameResult<void> PipelineConfig::Validate() const {
    auto invalid = [](std::string message) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, std::move(message)));
    };

    if (intake.ringCapacity == 0) {
        return invalid("pipeline.ring_capacity must be positive");
    }
    if (intake.requestPoolSize == 0) {
        return invalid("pipeline.request_pool_size must be positive");
    }
    if (intake.tagPoolSize == 0) {
        return invalid("pipeline.tag_pool_size must be positive");
    }
    if (maxPerTick == 0) {
        return invalid("pipeline.max_per_tick must be positive");
    }
    if (intake.overflowWarningInterval.count() < 0) {
        return invalid("pipeline.overflow_warning_interval_ms must not be negative");
    }
    if (registryCapacity == 0) {
        return invalid("registry.capacity must be positive");
    }
    if (tickRate == 0) {
        return invalid("simulation.tick_rate must be positive");
    }
    if (!(resolver.critChance >= 0.0f && resolver.critChance <= 1.0f)) {
        return invalid("combat.crit_chance must be within [0, 1]");
    }
    if (!(resolver.critMultiplier >= 0.0f)) {
        return invalid("combat.crit_multiplier must not be negative");
    }
    for (std::size_t i = 0; i < combat::kDamageTagCount; ++i) {
        if (!(resolver.tagMultipliers[i] >= 0.0f)) {
            return invalid("combat.tag_multipliers." +
                           std::string(combat::damageTagName(static_cast<combat::DamageTag>(i))) +
                           " must not be negative");
        }
    }
    return GameResult<void>::ok();
}

}  // namespace cdp::pipeline
