#pragma once

/// @file swarm_pool.hpp
/// @brief Dense structure-of-arrays storage for large numbers of
///        lightweight combatants.
///
/// Memory layout:
/// @code
///   slots_    [id]    -> dense index
///   ids_      [index] -> stable EntityId
///   health_   [index] -> mirrored current health
///   maxHealth_[index] -> maximum health
///   positions_[index] -> world position
///   pending_  [index] -> marked dead, waiting for ReapDead()
/// @endcode
///
/// Removal swaps the last member into the freed slot, so dense indices
/// are not stable; EntityIds are.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "cdp/combat/entity_registry.hpp"
#include "cdp/combat/math_types.hpp"
#include "cdp/foundation/game_result.hpp"

namespace cdp::entities {

using foundation::EntityId;

/// Pooled swarm storage.  The pool is the single IHealthBinding for
/// every member it registers.
///
/// The registry must outlive the pool; the destructor unregisters every
/// remaining member.
class SwarmPool final : public combat::IHealthBinding {
public:
    SwarmPool(combat::EntityRegistry& registry, std::size_t capacity);
    ~SwarmPool() override;

    SwarmPool(const SwarmPool&) = delete;
    SwarmPool& operator=(const SwarmPool&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Create a member with full health at @p position and register it.
    /// @return The new identity, PoolExhausted when the pool is full, or
    ///         the registry's refusal.
    foundation::GameResult<EntityId> Spawn(int32_t maxHealth, combat::Vector2 position);

    /// Unregister and remove @p id regardless of its state.
    /// @return false if @p id is not a member.
    bool Despawn(EntityId id);

    /// Unregister and remove every member marked dead.
    /// @return Number of members removed.
    std::size_t ReapDead();

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] bool Has(EntityId id) const { return slots_.contains(id); }
    [[nodiscard]] std::size_t Size() const noexcept { return ids_.size(); }
    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool Empty() const noexcept { return ids_.empty(); }

    /// Members marked dead but not yet reaped.
    [[nodiscard]] std::size_t PendingDespawnCount() const noexcept { return pendingCount_; }

    [[nodiscard]] std::optional<int32_t> Health(EntityId id) const;
    [[nodiscard]] std::optional<int32_t> MaxHealth(EntityId id) const;
    [[nodiscard]] std::optional<combat::Vector2> Position(EntityId id) const;
    [[nodiscard]] bool IsPendingDespawn(EntityId id) const;

    /// Move @p id to @p position.  @return false if not a member.
    bool SetPosition(EntityId id, combat::Vector2 position);

    // ── Dense iteration ─────────────────────────────────────────────────

    [[nodiscard]] std::span<const EntityId> Ids() const noexcept { return ids_; }
    [[nodiscard]] std::span<const int32_t> HealthValues() const noexcept { return health_; }
    [[nodiscard]] std::span<const combat::Vector2> Positions() const noexcept {
        return positions_;
    }

    // ── IHealthBinding ──────────────────────────────────────────────────

    void ApplyHealthDelta(EntityId id, int32_t delta, int32_t newHealth) override;
    void NotifyDeath(EntityId id) override;

private:
    [[nodiscard]] std::optional<uint32_t> slotOf(EntityId id) const;
    void removeAt(uint32_t index);

    combat::EntityRegistry& registry_;
    std::size_t capacity_;

    std::unordered_map<EntityId, uint32_t> slots_;
    std::vector<EntityId> ids_;
    std::vector<int32_t> health_;
    std::vector<int32_t> maxHealth_;
    std::vector<combat::Vector2> positions_;
    std::vector<uint8_t> pending_;
    std::size_t pendingCount_ = 0;
};

}  // namespace cdp::entities
