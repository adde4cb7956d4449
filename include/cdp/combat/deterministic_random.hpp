#pragma once

/// @file deterministic_random.hpp
/// @brief Seeded, counter-keyed random source for combat rolls.
///
/// Every roll is a pure function of (run seed, context, tick, counter):
/// there is no hidden generator state, so the same logical event
/// produces the same value regardless of call order or wall-clock time.

#include <cstdint>

#include "cdp/foundation/types.hpp"

namespace cdp::combat {

/// Stateless keyed random source.
///
/// The key is folded into a PCG32 state and one output step is taken.
///
/// Example:
/// @code
///   DeterministicRandomSource rng(seed);
///   bool crit = rng.RollChance(0.25, attacker, tick, attackerCounter);
/// @endcode
class DeterministicRandomSource {
public:
    explicit DeterministicRandomSource(uint64_t seed) noexcept : seed_(seed) {}

    [[nodiscard]] uint64_t Seed() const noexcept { return seed_; }

    /// 32 uniformly distributed bits for the given key.
    [[nodiscard]] uint32_t NextU32(foundation::EntityId context, uint64_t tick,
                                   uint64_t counter) const noexcept;

    /// Uniform value in [0, 1) with 24 bits of precision.
    [[nodiscard]] float Roll(foundation::EntityId context, uint64_t tick,
                             uint64_t counter) const noexcept;

    /// True with probability @p chance (values <= 0 never, >= 1 always).
    [[nodiscard]] bool RollChance(float chance, foundation::EntityId context,
                                  uint64_t tick, uint64_t counter) const noexcept;

private:
    uint64_t seed_;
};

}  // namespace cdp::combat
