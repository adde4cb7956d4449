#pragma once

/// @file damage_types.hpp
/// @brief Damage tags, the pooled DamageRequest payload and the outward
///        DamageResult.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "cdp/combat/math_types.hpp"
#include "cdp/foundation/types.hpp"

namespace cdp::combat {

using foundation::EntityId;

/// Classification flags attached to a damage request.
enum class DamageTag : uint8_t {
    Melee,         ///< Close-range hit.
    Ranged,        ///< Hitscan or thrown attack.
    CritEligible,  ///< May roll for a critical hit.
    Projectile,    ///< Delivered by a projectile.
    Area,          ///< Splash / area-of-effect damage.
    Piercing       ///< Armor-piercing hit.
};

inline constexpr std::size_t kDamageTagCount = 6;

/// Configuration-file name for a tag (e.g. "crit_eligible").
constexpr std::string_view damageTagName(DamageTag tag) {
    constexpr std::array<std::string_view, kDamageTagCount> names = {
        "melee", "ranged", "crit_eligible", "projectile", "area", "piercing"
    };
    auto idx = static_cast<std::size_t>(tag);
    return idx < kDamageTagCount ? names[idx] : "unknown";
}

/// Reverse of damageTagName().
constexpr std::optional<DamageTag> damageTagFromName(std::string_view name) {
    for (std::size_t i = 0; i < kDamageTagCount; ++i) {
        auto tag = static_cast<DamageTag>(i);
        if (damageTagName(tag) == name) {
            return tag;
        }
    }
    return std::nullopt;
}

/// Small pooled tag collection carried by a DamageRequest.
///
/// Fixed capacity; Add() past the capacity is refused.
struct DamageTagList {
    static constexpr std::size_t kMaxTags = 8;

    std::array<DamageTag, kMaxTags> tags{};
    uint8_t count = 0;

    /// Append a tag. @return false when the list is full.
    bool Add(DamageTag tag) noexcept {
        if (count >= kMaxTags) {
            return false;
        }
        tags[count++] = tag;
        return true;
    }

    [[nodiscard]] bool Contains(DamageTag tag) const noexcept {
        for (uint8_t i = 0; i < count; ++i) {
            if (tags[i] == tag) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return count; }
    [[nodiscard]] bool Empty() const noexcept { return count == 0; }

    [[nodiscard]] const DamageTag* begin() const noexcept { return tags.data(); }
    [[nodiscard]] const DamageTag* end() const noexcept { return tags.data() + count; }
};

/// A queued, not yet resolved damage attempt.
///
/// Pooled: acquired on intake, released after resolution or after being
/// evicted by the overflow policy.  `tags` is borrowed from the tag
/// pool for the same lifetime.
struct DamageRequest {
    uint64_t sequence = 0;         ///< Submission order, assigned at intake.
    EntityId source;
    EntityId target;
    int32_t baseAmount = 0;
    DamageTagList* tags = nullptr;
    std::optional<Vector2> knockback;

    [[nodiscard]] bool HasTag(DamageTag tag) const noexcept {
        return tags != nullptr && tags->Contains(tag);
    }
};

/// Outcome of resolving one DamageRequest.
struct DamageResult {
    uint64_t sequence = 0;
    uint64_t tick = 0;
    EntityId source;
    EntityId target;
    int32_t amount = 0;            ///< Damage actually computed (>= 0).
    int32_t remainingHealth = 0;
    bool wasCritical = false;
    bool targetDied = false;
    std::optional<Vector2> knockback;
};

}  // namespace cdp::combat
