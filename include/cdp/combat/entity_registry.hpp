#pragma once

/// @file entity_registry.hpp
/// @brief Stable-identity registry of damageable entities.
///
/// The registry is the one table of combat health state.  It maps a
/// stable EntityId to an EntityRecord held in a dense arena, and routes
/// every health mutation through the record's capability binding so the
/// concrete storage (a dense swarm pool, an individually-owned boss)
/// stays in sync without the resolver knowing which one backs an id.

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "cdp/foundation/game_result.hpp"
#include "cdp/foundation/signal.hpp"
#include "cdp/foundation/types.hpp"

namespace cdp::combat {

using foundation::EntityId;

/// Capability binding implemented once per storage strategy.
///
/// The registry owns the authoritative health value; implementations
/// mirror it into their own representation.  Both calls happen on the
/// simulation thread, inside the registry mutation that caused them.
class IHealthBinding {
public:
    virtual ~IHealthBinding() = default;

    /// Health of @p id changed by @p delta and is now @p newHealth.
    virtual void ApplyHealthDelta(EntityId id, int32_t delta, int32_t newHealth) = 0;

    /// @p id was marked dead.  Called exactly once per registration.
    virtual void NotifyDeath(EntityId id) = 0;
};

/// Registry entry for one damageable entity.
///
/// The binding is non-owning: the owner must Unregister() before the
/// object behind it is destroyed.
struct EntityRecord {
    EntityId id;
    int32_t health = 0;
    int32_t maxHealth = 0;
    bool alive = true;
    IHealthBinding* binding = nullptr;

    /// Requests from this entity resolved so far; keys its crit rolls.
    /// Starts at 0 on every registration.
    uint64_t requestCounter = 0;
};

/// Identity → EntityRecord map with notification signals.
///
/// Lookups for unknown or already-unregistered identities return
/// nullptr / false rather than failing: a request may legitimately
/// target an entity removed earlier in the same batch.
///
/// Not thread-safe; all calls belong to the simulation thread.
class EntityRegistry {
public:
    EntityRegistry() = default;
    explicit EntityRegistry(std::size_t capacity);

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;
    EntityRegistry(EntityRegistry&&) noexcept = default;
    EntityRegistry& operator=(EntityRegistry&&) noexcept = default;

    /// Process-wide registry for the running simulation.
    static EntityRegistry& instance();

    // ── Lifecycle ──────────────────────────────────────────────────────

    /// Drop every record and pre-size the arena for @p capacity entities.
    /// Called once at simulation start.  Identity issuance continues
    /// from where it was, so ids are never handed out twice.
    void Initialize(std::size_t capacity);

    /// Drop every record (simulation teardown).  Connected slots stay.
    void Clear();

    /// Issue a fresh stable identity.  Monotonic, never 0.
    [[nodiscard]] EntityId AllocateId() noexcept;

    // ── Membership ─────────────────────────────────────────────────────

    /// Add @p record under @p id.
    ///
    /// @return InvalidEntityId for the null id, MissingBinding when the
    ///         record has no binding, InvalidArgument for a non-positive
    ///         maxHealth, DuplicateEntity when @p id is already present.
    ///         A refused registration leaves the registry untouched.
    foundation::GameResult<void> Register(EntityId id, EntityRecord record);

    /// Remove @p id.  @return false if it was not registered.
    bool Unregister(EntityId id);

    // ── Queries ────────────────────────────────────────────────────────

    /// Record for @p id, or nullptr.  The pointer is invalidated by the
    /// next Register / Unregister.
    [[nodiscard]] const EntityRecord* Get(EntityId id) const;

    [[nodiscard]] bool Contains(EntityId id) const;

    /// True when @p id is registered and not marked dead.
    [[nodiscard]] bool IsAlive(EntityId id) const;

    [[nodiscard]] std::size_t Count() const noexcept { return records_.size(); }

    // ── Mutation ───────────────────────────────────────────────────────

    /// Set health to @p value clamped to [0, maxHealth], mirror the
    /// delta through the binding and emit OnHealthChanged.
    /// Does not change the alive flag.
    /// @return false if @p id is not registered.
    bool SetHealth(EntityId id, int32_t value);

    /// Flip the alive flag, notify the binding and emit OnDeath.
    /// The record stays registered; removal is the owner's job.
    /// @return true only for the call that actually killed the entity.
    bool MarkDead(EntityId id);

    /// Return the request counter of @p id and advance it by one.
    /// @return 0 (and changes nothing) if @p id is not registered.
    uint64_t NextRequestCounter(EntityId id);

    /// Zero every registered record's request counter (new run).
    void ResetRequestCounters() noexcept;

    // ── Notifications ──────────────────────────────────────────────────

    /// (id, currentHealth, maxHealth)
    [[nodiscard]] foundation::Signal<EntityId, int32_t, int32_t>& OnHealthChanged() noexcept {
        return onHealthChanged_;
    }

    /// (id)
    [[nodiscard]] foundation::Signal<EntityId>& OnDeath() noexcept { return onDeath_; }

private:
    EntityRecord* find(EntityId id);

    /// Dense arena of records; order is not meaningful.
    std::vector<EntityRecord> records_;

    /// id → index into records_.
    std::unordered_map<EntityId, uint32_t> index_;

    uint64_t nextId_ = 1;

    foundation::Signal<EntityId, int32_t, int32_t> onHealthChanged_;
    foundation::Signal<EntityId> onDeath_;
};

}  // namespace cdp::combat
