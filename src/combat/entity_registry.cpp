/// @file entity_registry.cpp
/// @brief EntityRegistry implementation.

#include "cdp/combat/entity_registry.hpp"

#include <algorithm>
#include <string>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

EntityRegistry::EntityRegistry(std::size_t capacity) {
    Initialize(capacity);
}

EntityRegistry& EntityRegistry::instance() {
    static EntityRegistry inst;
    return inst;
}

// ── Lifecycle ───────────────────────────────────────────────────────────

void EntityRegistry::Initialize(std::size_t capacity) {
    Clear();
    records_.reserve(capacity);
    index_.reserve(capacity);
}

void EntityRegistry::Clear() {
    records_.clear();
    index_.clear();
}

EntityId EntityRegistry::AllocateId() noexcept {
    return EntityId(nextId_++);
}

// ── Membership ──────────────────────────────────────────────────────────

GameResult<void> EntityRegistry::Register(EntityId id, EntityRecord record) {
    if (!id.isValid()) {
        CDP_LOG_ERROR(LogCategory::Registry, "refused registration of the null entity id");
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidEntityId, "cannot register the null entity id"));
    }
    if (record.binding == nullptr) {
        CDP_LOG_ERROR(LogCategory::Registry,
                      "refused registration of entity " + std::to_string(id.value()) +
                          " without a health binding");
        return GameResult<void>::err(
            GameError(ErrorCode::MissingBinding,
                      "entity " + std::to_string(id.value()) + " has no health binding")
                .withEntity(id));
    }
    if (record.maxHealth <= 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument,
                      "entity " + std::to_string(id.value()) + " has non-positive max health")
                .withEntity(id));
    }
    if (index_.contains(id)) {
        // Two live owners claiming one identity is an upstream bug.
        CDP_LOG_ERROR(LogCategory::Registry,
                      "duplicate registration of entity " + std::to_string(id.value()) +
                          " refused");
        return GameResult<void>::err(
            GameError(ErrorCode::DuplicateEntity,
                      "entity " + std::to_string(id.value()) + " is already registered")
                .withEntity(id));
    }

    record.id = id;
    record.health = std::clamp(record.health, int32_t{0}, record.maxHealth);
    record.requestCounter = 0;

    index_.emplace(id, static_cast<uint32_t>(records_.size()));
    records_.push_back(record);

    // Explicit ids must not collide with ids issued later.
    nextId_ = std::max(nextId_, id.value() + 1);
    return GameResult<void>::ok();
}

bool EntityRegistry::Unregister(EntityId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }

    auto idx = it->second;
    auto lastIdx = static_cast<uint32_t>(records_.size() - 1);
    if (idx != lastIdx) {
        // Swap-and-pop; fix the moved record's index entry.
        records_[idx] = records_[lastIdx];
        index_[records_[idx].id] = idx;
    }
    records_.pop_back();
    index_.erase(it);
    return true;
}

// ── Queries ─────────────────────────────────────────────────────────────

const EntityRecord* EntityRegistry::Get(EntityId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
}

bool EntityRegistry::Contains(EntityId id) const {
    return index_.contains(id);
}

bool EntityRegistry::IsAlive(EntityId id) const {
    const auto* record = Get(id);
    return record != nullptr && record->alive;
}

// ── Mutation ────────────────────────────────────────────────────────────

EntityRecord* EntityRegistry::find(EntityId id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
}

bool EntityRegistry::SetHealth(EntityId id, int32_t value) {
    auto* record = find(id);
    if (record == nullptr) {
        return false;
    }

    const int32_t previous = record->health;
    record->health = std::clamp(value, int32_t{0}, record->maxHealth);
    const int32_t current = record->health;
    const int32_t maxHealth = record->maxHealth;

    // Copy out before calling out: a slot may register or unregister
    // and move the arena.
    IHealthBinding* binding = record->binding;
    binding->ApplyHealthDelta(id, current - previous, current);
    onHealthChanged_.emit(id, current, maxHealth);
    return true;
}

uint64_t EntityRegistry::NextRequestCounter(EntityId id) {
    auto* record = find(id);
    return record == nullptr ? 0 : record->requestCounter++;
}

void EntityRegistry::ResetRequestCounters() noexcept {
    for (auto& record : records_) {
        record.requestCounter = 0;
    }
}

bool EntityRegistry::MarkDead(EntityId id) {
    auto* record = find(id);
    if (record == nullptr || !record->alive) {
        return false;
    }

    record->alive = false;
    IHealthBinding* binding = record->binding;
    binding->NotifyDeath(id);
    onDeath_.emit(id);
    return true;
}

}  // namespace cdp::combat
