#pragma once

/// @file damage_resolver.hpp
/// @brief DamageResolver: turns a queued DamageRequest into a health
///        mutation and a DamageResult.
///
/// Resolution pipeline for one request:
///   1. start from the base amount
///   2. apply tag multipliers; a CritEligible tag rolls against the
///      keyed random source (seed, source, tick, source's request
///      counter held in its registry record)
///   3. clamp to non-negative
///   4. subtract from the target's health through the registry and
///      mark it dead when it reaches zero
///   5. report the outcome

#include <array>
#include <cstddef>
#include <cstdint>

#include "cdp/combat/damage_types.hpp"
#include "cdp/combat/deterministic_random.hpp"
#include "cdp/combat/entity_registry.hpp"

namespace cdp::combat {

/// Tunables for damage calculation.
struct ResolverConfig {
    /// Probability of a critical hit for CritEligible requests.
    float critChance = 0.25f;

    /// Damage multiplier applied on a critical hit.
    float critMultiplier = 2.0f;

    /// Per-tag multipliers, indexed by static_cast<size_t>(DamageTag).
    /// Multipliers of every distinct tag on a request are combined.
    std::array<float, kDamageTagCount> tagMultipliers{1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f};
};

class DamageResolver {
public:
    DamageResolver(EntityRegistry& registry,
                   const DeterministicRandomSource& random,
                   ResolverConfig config = {});

    DamageResolver(const DamageResolver&) = delete;
    DamageResolver& operator=(const DamageResolver&) = delete;

    /// Resolve @p request during simulation tick @p tick.
    ///
    /// The caller has already checked that source and target exist and
    /// the target is alive; if the target is gone anyway, no health is
    /// touched and the result reports zero remaining health.
    [[nodiscard]] DamageResult Resolve(const DamageRequest& request, uint64_t tick);

    /// Final damage for the given inputs.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static int32_t CalculateDamage(int32_t baseAmount,
                                                 float tagMultiplier,
                                                 bool isCritical,
                                                 float critMultiplier);

    /// Combined multiplier for the tags in @p tags (1.0 for none).
    [[nodiscard]] float TagMultiplier(const DamageTagList* tags) const noexcept;

    /// Number of requests from @p source resolved so far (0 when
    /// @p source is not registered).
    [[nodiscard]] uint64_t RequestCounter(EntityId source) const;

    [[nodiscard]] const ResolverConfig& Config() const noexcept { return config_; }

private:
    EntityRegistry& registry_;
    const DeterministicRandomSource& random_;
    ResolverConfig config_;
};

}  // namespace cdp::combat
