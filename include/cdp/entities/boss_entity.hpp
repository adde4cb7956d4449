#pragma once

/// @file boss_entity.hpp
/// @brief Individually-owned combatant with health-driven phases.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cdp/combat/entity_registry.hpp"
#include "cdp/foundation/game_result.hpp"
#include "cdp/foundation/signal.hpp"

namespace cdp::entities {

using foundation::EntityId;

/// A boss: one heap object per instance, acting as its own health binding.
///
/// Phase thresholds are fractions of max health in descending order;
/// phase N begins once health drops to or below threshold N-1.
///
/// Example:
/// @code
///   auto boss = std::make_unique<BossEntity>("Warden", 5000, std::vector<float>{0.66f, 0.33f});
///   auto id = boss->Attach(registry);
///   boss->OnPhaseChanged().connect([](EntityId, uint32_t phase) { ... });
/// @endcode
class BossEntity final : public combat::IHealthBinding {
public:
    BossEntity(std::string name, int32_t maxHealth, std::vector<float> phaseThresholds = {0.5f});
    ~BossEntity() override;

    BossEntity(const BossEntity&) = delete;
    BossEntity& operator=(const BossEntity&) = delete;
    BossEntity(BossEntity&&) = delete;
    BossEntity& operator=(BossEntity&&) = delete;

    /// Register with @p registry under a freshly allocated identity.
    /// @return The identity, AlreadyExists when already attached, or the
    ///         registry's refusal.
    foundation::GameResult<EntityId> Attach(combat::EntityRegistry& registry);

    /// Unregister.  @return false when not attached.
    bool Detach();

    [[nodiscard]] bool IsAttached() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] EntityId Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    [[nodiscard]] int32_t Health() const noexcept { return health_; }
    [[nodiscard]] int32_t MaxHealth() const noexcept { return maxHealth_; }
    [[nodiscard]] uint32_t HitsTaken() const noexcept { return hitsTaken_; }

    /// Current phase, starting at 0.
    [[nodiscard]] uint32_t Phase() const noexcept { return phase_; }
    [[nodiscard]] bool IsDefeated() const noexcept { return defeated_; }

    /// (id, new phase)
    [[nodiscard]] foundation::Signal<EntityId, uint32_t>& OnPhaseChanged() noexcept {
        return onPhaseChanged_;
    }

    void ApplyHealthDelta(EntityId id, int32_t delta, int32_t newHealth) override;
    void NotifyDeath(EntityId id) override;

private:
    void advancePhases();

    std::string name_;
    int32_t maxHealth_;
    int32_t health_;
    std::vector<float> phaseThresholds_;

    combat::EntityRegistry* registry_ = nullptr;
    EntityId id_;

    uint32_t hitsTaken_ = 0;
    uint32_t phase_ = 0;
    bool defeated_ = false;

    foundation::Signal<EntityId, uint32_t> onPhaseChanged_;
};

}  // namespace cdp::entities
