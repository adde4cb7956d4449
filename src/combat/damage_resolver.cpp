/// @file damage_resolver.cpp
/// @brief DamageResolver implementation.

#include "cdp/combat/damage_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cdp::combat {

DamageResolver::DamageResolver(EntityRegistry& registry,
                               const DeterministicRandomSource& random,
                               ResolverConfig config)
    : registry_(registry), random_(random), config_(config) {}

// ── Static damage calculation ───────────────────────────────────────────

int32_t DamageResolver::CalculateDamage(int32_t baseAmount,
                                        float tagMultiplier,
                                        bool isCritical,
                                        float critMultiplier) {
    if (baseAmount <= 0) {
        return 0;
    }

    auto damage = static_cast<double>(baseAmount) * std::max(tagMultiplier, 0.0f);
    if (isCritical) {
        damage *= std::max(critMultiplier, 0.0f);
    }

    damage = std::min(damage, static_cast<double>(std::numeric_limits<int32_t>::max()));
    return std::max(static_cast<int32_t>(std::lround(damage)), int32_t{0});
}

float DamageResolver::TagMultiplier(const DamageTagList* tags) const noexcept {
    if (tags == nullptr) {
        return 1.0f;
    }
    float multiplier = 1.0f;
    for (std::size_t i = 0; i < kDamageTagCount; ++i) {
        if (tags->Contains(static_cast<DamageTag>(i))) {
            multiplier *= config_.tagMultipliers[i];
        }
    }
    return multiplier;
}

// ── Resolution ──────────────────────────────────────────────────────────

DamageResult DamageResolver::Resolve(const DamageRequest& request, uint64_t tick) {
    DamageResult result;
    result.sequence = request.sequence;
    result.tick = tick;
    result.source = request.source;
    result.target = request.target;
    result.knockback = request.knockback;

    const uint64_t counter = registry_.NextRequestCounter(request.source);

    if (request.HasTag(DamageTag::CritEligible)) {
        result.wasCritical = random_.RollChance(config_.critChance, request.source,
                                                tick, counter);
    }

    result.amount = CalculateDamage(request.baseAmount, TagMultiplier(request.tags),
                                    result.wasCritical, config_.critMultiplier);

    const auto* target = registry_.Get(request.target);
    if (target == nullptr || !target->alive) {
        return result;
    }

    const int64_t newHealth = static_cast<int64_t>(target->health) - result.amount;
    registry_.SetHealth(request.target, static_cast<int32_t>(std::max<int64_t>(newHealth, 0)));

    // Re-read: health-changed slots may have touched the registry.
    target = registry_.Get(request.target);
    if (target == nullptr) {
        return result;
    }
    result.remainingHealth = target->health;
    if (target->health <= 0 && target->alive) {
        result.targetDied = registry_.MarkDead(request.target);
    }
    return result;
}

uint64_t DamageResolver::RequestCounter(EntityId source) const {
    const auto* record = registry_.Get(source);
    return record == nullptr ? 0 : record->requestCounter;
}

}  // namespace cdp::combat
