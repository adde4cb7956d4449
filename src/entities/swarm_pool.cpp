/// @file swarm_pool.cpp
/// @brief SwarmPool implementation.

#include "cdp/entities/swarm_pool.hpp"

#include <string>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::entities {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

SwarmPool::SwarmPool(combat::EntityRegistry& registry, std::size_t capacity)
    : registry_(registry), capacity_(capacity) {
    slots_.reserve(capacity_);
    ids_.reserve(capacity_);
    health_.reserve(capacity_);
    maxHealth_.reserve(capacity_);
    positions_.reserve(capacity_);
    pending_.reserve(capacity_);
}

SwarmPool::~SwarmPool() {
    for (auto id : ids_) {
        registry_.Unregister(id);
    }
}

// ── Lifecycle ───────────────────────────────────────────────────────────

GameResult<EntityId> SwarmPool::Spawn(int32_t maxHealth, combat::Vector2 position) {
    if (ids_.size() >= capacity_) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::PoolExhausted,
                      "swarm pool full (capacity " + std::to_string(capacity_) + ")"));
    }

    const auto id = registry_.AllocateId();
    combat::EntityRecord record;
    record.id = id;
    record.health = maxHealth;
    record.maxHealth = maxHealth;
    record.binding = this;

    auto registered = registry_.Register(id, record);
    if (!registered) {
        return GameResult<EntityId>::err(registered.error());
    }

    slots_.emplace(id, static_cast<uint32_t>(ids_.size()));
    ids_.push_back(id);
    health_.push_back(maxHealth);
    maxHealth_.push_back(maxHealth);
    positions_.push_back(position);
    pending_.push_back(0);
    return GameResult<EntityId>::ok(id);
}

bool SwarmPool::Despawn(EntityId id) {
    auto slot = slotOf(id);
    if (!slot) {
        return false;
    }
    registry_.Unregister(id);
    removeAt(*slot);
    return true;
}

std::size_t SwarmPool::ReapDead() {
    if (pendingCount_ == 0) {
        return 0;
    }

    std::size_t reaped = 0;
    // Walk backwards so the member swapped into a freed slot has already
    // been examined.
    for (auto i = ids_.size(); i-- > 0;) {
        if (pending_[i] != 0) {
            registry_.Unregister(ids_[i]);
            removeAt(static_cast<uint32_t>(i));
            ++reaped;
        }
    }

    CDP_LOG_DEBUG(LogCategory::Registry,
                  "swarm reaped " + std::to_string(reaped) + " dead member(s), " +
                      std::to_string(ids_.size()) + " remain");
    return reaped;
}

void SwarmPool::removeAt(uint32_t index) {
    const auto last = static_cast<uint32_t>(ids_.size() - 1);
    const auto removedId = ids_[index];
    if (pending_[index] != 0) {
        --pendingCount_;
    }

    if (index != last) {
        ids_[index] = ids_[last];
        health_[index] = health_[last];
        maxHealth_[index] = maxHealth_[last];
        positions_[index] = positions_[last];
        pending_[index] = pending_[last];
        slots_[ids_[index]] = index;
    }

    ids_.pop_back();
    health_.pop_back();
    maxHealth_.pop_back();
    positions_.pop_back();
    pending_.pop_back();
    slots_.erase(removedId);
}

// ── Queries ─────────────────────────────────────────────────────────────

std::optional<uint32_t> SwarmPool::slotOf(EntityId id) const {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int32_t> SwarmPool::Health(EntityId id) const {
    auto slot = slotOf(id);
    return slot ? std::optional<int32_t>(health_[*slot]) : std::nullopt;
}

std::optional<int32_t> SwarmPool::MaxHealth(EntityId id) const {
    auto slot = slotOf(id);
    return slot ? std::optional<int32_t>(maxHealth_[*slot]) : std::nullopt;
}

std::optional<combat::Vector2> SwarmPool::Position(EntityId id) const {
    auto slot = slotOf(id);
    return slot ? std::optional<combat::Vector2>(positions_[*slot]) : std::nullopt;
}

bool SwarmPool::IsPendingDespawn(EntityId id) const {
    auto slot = slotOf(id);
    return slot && pending_[*slot] != 0;
}

bool SwarmPool::SetPosition(EntityId id, combat::Vector2 position) {
    auto slot = slotOf(id);
    if (!slot) {
        return false;
    }
    positions_[*slot] = position;
    return true;
}

// ── IHealthBinding ──────────────────────────────────────────────────────

void SwarmPool::ApplyHealthDelta(EntityId id, int32_t /*delta*/, int32_t newHealth) {
    auto slot = slotOf(id);
    if (!slot) {
        return;
    }
    health_[*slot] = newHealth;
}

void SwarmPool::NotifyDeath(EntityId id) {
    auto slot = slotOf(id);
    if (!slot || pending_[*slot] != 0) {
        return;
    }
    pending_[*slot] = 1;
    ++pendingCount_;
}

}  // namespace cdp::entities
