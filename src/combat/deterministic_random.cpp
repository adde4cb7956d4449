/// @file deterministic_random.cpp
/// @brief Keyed PCG32 roll.

#include "cdp/combat/deterministic_random.hpp"

namespace cdp::combat {

namespace {

constexpr uint64_t kPcgMultiplier = 6364136223846793005ULL;
constexpr uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ULL;

/// SplitMix64 finalizer; spreads each key component over all 64 bits.
constexpr uint64_t mix64(uint64_t z) noexcept {
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

/// PCG32 XSH-RR output for a given state.
constexpr uint32_t pcgOutput(uint64_t state) noexcept {
    auto xorshifted = static_cast<uint32_t>(((state >> 18u) ^ state) >> 27u);
    auto rot = static_cast<uint32_t>(state >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

}  // namespace

uint32_t DeterministicRandomSource::NextU32(foundation::EntityId context,
                                            uint64_t tick,
                                            uint64_t counter) const noexcept {
    uint64_t key = mix64(seed_ + kGoldenGamma);
    key = mix64(key ^ (context.value() + kGoldenGamma));
    key = mix64(key ^ (tick + 2 * kGoldenGamma));
    key = mix64(key ^ (counter + 3 * kGoldenGamma));

    // Stream selector must be odd.
    const uint64_t increment = (mix64(seed_) << 1u) | 1u;
    const uint64_t state = key * kPcgMultiplier + increment;
    return pcgOutput(state);
}

float DeterministicRandomSource::Roll(foundation::EntityId context, uint64_t tick,
                                      uint64_t counter) const noexcept {
    return static_cast<float>(NextU32(context, tick, counter) >> 8) * (1.0f / 16777216.0f);
}

bool DeterministicRandomSource::RollChance(float chance, foundation::EntityId context,
                                           uint64_t tick, uint64_t counter) const noexcept {
    if (chance <= 0.0f) {
        return false;
    }
    if (chance >= 1.0f) {
        return true;
    }
    return Roll(context, tick, counter) < chance;
}

}  // namespace cdp::combat
