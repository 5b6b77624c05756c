#pragma once

/// @file weapon_controller.hpp
/// @brief Drives the equipped weapon's cycle and runs its fire logic.

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "arc/event/event_bus.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/damage_resolver.hpp"
#include "arc/game/physics_query.hpp"
#include "arc/game/weapon_inventory.hpp"
#include "arc/game/weapon_state_machine.hpp"

namespace arc::game {

/// Owns the WeaponStateMachine of the equipped weapon.
///
/// On every transition into Discharging the controller samples the aim
/// and runs the weapon's fire logic:
///   - projectile: publish WEAPON_FIRED from the staff tip along the
///     camera direction at projectileSpeed;
///   - hitscan chain: cast the aim ray and resolve the chain from the hit.
/// Both also publish a discharge effect at the staff tip.
class WeaponController {
public:
    WeaponController(arc::event::EventBus& bus, TimerQueue& timers, WeaponInventory& inventory,
                     DamageResolver& resolver, const IPhysicsQuery& physics,
                     const IAimSource& aim, arc::foundation::IdGenerator<EffectId>& effectIds,
                     float aimRayDistance);

    WeaponController(const WeaponController&) = delete;
    WeaponController& operator=(const WeaponController&) = delete;

    /// Trigger pressed.
    bool BeginCharge();

    /// Trigger released.
    bool ReleaseTrigger();

    /// Abort the current cycle (death, focus loss).
    void ResetCycle();

    /// Equip another weapon. Resets the current cycle and rebuilds the
    /// state machine from the new weapon's stats; publishes
    /// WEAPON_SWITCHED when the weapon actually changes.
    arc::foundation::GameResult<const WeaponSchema*> Equip(std::string_view id);

    [[nodiscard]] const WeaponSchema* Equipped() const noexcept { return inventory_.Equipped(); }

    /// Idle when nothing is equipped.
    [[nodiscard]] AnimationState State() const noexcept;

    /// Number of discharges since construction.
    [[nodiscard]] uint64_t ShotsFired() const noexcept { return shotsFired_; }

    /// Additional observer of state changes (HUD, animation).
    void SetStateListener(StateListener listener) { observer_ = std::move(listener); }

private:
    void rebuildMachine();
    void onTransition(AnimationState from, AnimationState to);
    void fireProjectile(const WeaponSchema& weapon, const ProjectileStats& stats,
                        const AimFrame& aim);
    void fireChain(const WeaponSchema& weapon, const ChainStats& stats, const AimFrame& aim);

    arc::event::EventBus& bus_;
    TimerQueue& timers_;
    WeaponInventory& inventory_;
    DamageResolver& resolver_;
    const IPhysicsQuery& physics_;
    const IAimSource& aim_;
    arc::foundation::IdGenerator<EffectId>& effectIds_;
    float aimRayDistance_;

    arc::foundation::IdGenerator<arc::foundation::ProjectileId> projectileIds_;
    std::unique_ptr<WeaponStateMachine> machine_;
    StateListener observer_;
    uint64_t shotsFired_ = 0;
};

} // namespace arc::game
