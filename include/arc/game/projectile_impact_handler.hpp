#pragma once

/// @file projectile_impact_handler.hpp
/// @brief Turns projectile collisions into explosions, splash and hits.

#include <string>

#include "arc/event/event_bus.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/damage_resolver.hpp"
#include "arc/game/weapon_catalog.hpp"

namespace arc::game {

using arc::foundation::ProjectileId;

/// Collision reported by the physics collaborator for a live projectile.
struct ProjectileImpact {
    ProjectileId projectileId;
    std::string weaponId;
    Vector3 position;
    BodyHit other;
};

/// Host of splash resolution.
///
/// OnImpact() publishes an explosion effect, then a splash_damage effect
/// when the weapon has a splash radius, then a direct ENEMY_HIT when the
/// struck body is an enemy. Every splash_damage effect seen on the bus,
/// whoever published it, is resolved through DamageResolver::ResolveSplash.
class ProjectileImpactHandler {
public:
    ProjectileImpactHandler(arc::event::EventBus& bus, DamageResolver& resolver,
                            const WeaponCatalog& catalog,
                            arc::foundation::IdGenerator<EffectId>& effectIds);
    ~ProjectileImpactHandler();

    ProjectileImpactHandler(const ProjectileImpactHandler&) = delete;
    ProjectileImpactHandler& operator=(const ProjectileImpactHandler&) = delete;

    /// Handle one collision.
    /// @return false when the impact was ignored (the shooter, another
    ///         projectile, or a weapon that fires no projectiles).
    bool OnImpact(const ProjectileImpact& impact);

private:
    void onEffect(const arc::event::EffectTriggered& event);

    arc::event::EventBus& bus_;
    DamageResolver& resolver_;
    const WeaponCatalog& catalog_;
    arc::foundation::IdGenerator<EffectId>& effectIds_;
    arc::event::SubscriptionId effectSubscription_ = 0;
};

} // namespace arc::game
