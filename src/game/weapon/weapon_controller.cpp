/// @file weapon_controller.cpp
/// @brief Turns weapon cycle transitions into shots.

#include "arc/game/weapon_controller.hpp"

#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::DischargeEffect;
using arc::event::EffectTriggered;
using arc::event::WeaponFired;
using arc::event::WeaponSwitched;
using arc::foundation::GameResult;
using arc::foundation::LogCategory;

WeaponController::WeaponController(arc::event::EventBus& bus, TimerQueue& timers,
                                   WeaponInventory& inventory, DamageResolver& resolver,
                                   const IPhysicsQuery& physics, const IAimSource& aim,
                                   arc::foundation::IdGenerator<EffectId>& effectIds,
                                   float aimRayDistance)
    : bus_(bus),
      timers_(timers),
      inventory_(inventory),
      resolver_(resolver),
      physics_(physics),
      aim_(aim),
      effectIds_(effectIds),
      aimRayDistance_(aimRayDistance) {
    rebuildMachine();
}

bool WeaponController::BeginCharge() {
    return machine_ && machine_->StartCharging();
}

bool WeaponController::ReleaseTrigger() {
    return machine_ && machine_->Fire();
}

void WeaponController::ResetCycle() {
    if (machine_) {
        machine_->ResetState();
    }
}

GameResult<const WeaponSchema*> WeaponController::Equip(std::string_view id) {
    const WeaponSchema* previous = inventory_.Equipped();
    auto equipped = inventory_.Equip(id);
    if (!equipped) {
        ARC_LOG_WARN(LogCategory::Weapon, std::string(equipped.error().message()));
        return equipped;
    }

    ResetCycle();
    rebuildMachine();

    if (previous != equipped.value()) {
        ARC_LOG_INFO(LogCategory::Weapon, "equipped " + equipped.value()->name);
        bus_.Publish(WeaponSwitched{previous ? previous->id : std::string(),
                                    equipped.value()->id});
    }
    return equipped;
}

AnimationState WeaponController::State() const noexcept {
    return machine_ ? machine_->State() : AnimationState::Idle;
}

void WeaponController::rebuildMachine() {
    const WeaponSchema* weapon = inventory_.Equipped();
    if (weapon == nullptr) {
        machine_.reset();
        return;
    }
    machine_ = std::make_unique<WeaponStateMachine>(timers_, weapon->stats);
    machine_->SetListener(
        [this](AnimationState from, AnimationState to) { onTransition(from, to); });
}

void WeaponController::onTransition(AnimationState from, AnimationState to) {
    ARC_LOG_DEBUG(LogCategory::Weapon, std::string(animationStateName(from)) + " -> " +
                                           std::string(animationStateName(to)));

    if (to == AnimationState::Discharging) {
        const WeaponSchema* weapon = inventory_.Equipped();
        if (weapon != nullptr) {
            const AimFrame aim = aim_.CurrentAim();
            ++shotsFired_;
            bus_.Publish(EffectTriggered{effectIds_.next(),
                                         DischargeEffect{aim.staffTip, weapon->effectColor}});

            if (const auto* projectile = weapon->stats.Projectile()) {
                fireProjectile(*weapon, *projectile, aim);
            } else if (const auto* chain = weapon->stats.Chain()) {
                fireChain(*weapon, *chain, aim);
            }
        }
    }

    if (observer_) {
        observer_(from, to);
    }
}

void WeaponController::fireProjectile(const WeaponSchema& weapon, const ProjectileStats& stats,
                                      const AimFrame& aim) {
    WeaponFired fired;
    fired.id = projectileIds_.next();
    fired.weaponId = weapon.id;
    fired.start = aim.staffTip;
    fired.velocity = aim.direction.Normalized() * stats.projectileSpeed;
    fired.visualType = weapon.projectileVisual;
    bus_.Publish(fired);
}

void WeaponController::fireChain(const WeaponSchema& weapon, const ChainStats& stats,
                                 const AimFrame& aim) {
    ChainRequest request;
    request.origin = aim.staffTip;
    request.initialTarget = physics_.CastRay(aim.cameraOrigin, aim.direction, aimRayDistance_);
    request.damage = weapon.stats.damage;
    request.maxChainTargets = stats.maxChainTargets;
    request.chainRadius = stats.chainRadius;
    request.damageFalloff = stats.damageFalloff;

    auto result = resolver_.ResolveChain(request);
    ARC_LOG_DEBUG(LogCategory::Weapon,
                  weapon.id + " chained through " + std::to_string(result.hits.size()) +
                      " enemies");
}

} // namespace arc::game
