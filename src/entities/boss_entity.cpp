/// @file boss_entity.cpp
/// @brief BossEntity implementation.

#include "cdp/entities/boss_entity.hpp"

#include <algorithm>
#include <functional>
#include <utility>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::entities {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

BossEntity::BossEntity(std::string name, int32_t maxHealth, std::vector<float> phaseThresholds)
    : name_(std::move(name)),
      maxHealth_(maxHealth),
      health_(maxHealth),
      phaseThresholds_(std::move(phaseThresholds)) {
    std::sort(phaseThresholds_.begin(), phaseThresholds_.end(), std::greater<>());
}

BossEntity::~BossEntity() {
    Detach();
}

GameResult<EntityId> BossEntity::Attach(combat::EntityRegistry& registry) {
    if (registry_ != nullptr) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::AlreadyExists, "boss '" + name_ + "' is already attached")
                .withEntity(id_));
    }

    const auto id = registry.AllocateId();
    combat::EntityRecord record;
    record.id = id;
    record.health = health_;
    record.maxHealth = maxHealth_;
    record.alive = !defeated_;
    record.binding = this;

    auto registered = registry.Register(id, record);
    if (!registered) {
        return GameResult<EntityId>::err(registered.error());
    }

    registry_ = &registry;
    id_ = id;

    foundation::LogContext ctx;
    ctx.entityId = id_;
    foundation::GameLogger::instance().logWithContext(
        foundation::LogLevel::Info, LogCategory::Combat,
        "boss '" + name_ + "' entered combat with " + std::to_string(health_) + " health", ctx);
    return GameResult<EntityId>::ok(id);
}

bool BossEntity::Detach() {
    if (registry_ == nullptr) {
        return false;
    }
    registry_->Unregister(id_);
    registry_ = nullptr;
    return true;
}

void BossEntity::ApplyHealthDelta(EntityId id, int32_t delta, int32_t newHealth) {
    if (id != id_) {
        return;
    }
    health_ = newHealth;
    if (delta < 0) {
        ++hitsTaken_;
    }
    advancePhases();
}

void BossEntity::advancePhases() {
    while (phase_ < phaseThresholds_.size() &&
           static_cast<float>(health_) <=
               phaseThresholds_[phase_] * static_cast<float>(maxHealth_)) {
        ++phase_;
        CDP_LOG_INFO(LogCategory::Combat,
                     "boss '" + name_ + "' entered phase " + std::to_string(phase_));
        onPhaseChanged_.emit(id_, phase_);
    }
}

void BossEntity::NotifyDeath(EntityId id) {
    if (id != id_ || defeated_) {
        return;
    }
    defeated_ = true;
    CDP_LOG_INFO(LogCategory::Combat,
                 "boss '" + name_ + "' defeated after " + std::to_string(hitsTaken_) + " hits");
}

}  // namespace cdp::entities
