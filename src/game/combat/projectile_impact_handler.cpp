/// @file projectile_impact_handler.cpp
/// @brief Fireball impact handling: explosion, splash and direct hit.

#include "arc/game/projectile_impact_handler.hpp"

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::EffectTriggered;
using arc::event::EnemyHit;
using arc::event::ExplosionEffect;
using arc::event::SplashDamageEffect;
using arc::foundation::LogCategory;

ProjectileImpactHandler::ProjectileImpactHandler(arc::event::EventBus& bus,
                                                 DamageResolver& resolver,
                                                 const WeaponCatalog& catalog,
                                                 arc::foundation::IdGenerator<EffectId>& effectIds)
    : bus_(bus), resolver_(resolver), catalog_(catalog), effectIds_(effectIds) {
    effectSubscription_ = bus_.Subscribe<EffectTriggered>(
        [this](const EffectTriggered& e) { onEffect(e); });
}

ProjectileImpactHandler::~ProjectileImpactHandler() {
    bus_.Unsubscribe(effectSubscription_);
}

bool ProjectileImpactHandler::OnImpact(const ProjectileImpact& impact) {
    if (impact.other.type == BodyType::Player || impact.other.type == BodyType::Fireball) {
        return false;
    }

    const WeaponSchema* weapon = catalog_.Find(impact.weaponId);
    const ProjectileStats* projectile = weapon ? weapon->stats.Projectile() : nullptr;
    if (projectile == nullptr) {
        ARC_LOG_WARN(LogCategory::Combat,
                     "impact from non-projectile weapon '" + impact.weaponId + "' ignored");
        return false;
    }

    const bool struckEnemy =
        impact.other.type == BodyType::Enemy && impact.other.enemyId.isValid();

    bus_.Publish(EffectTriggered{effectIds_.next(), ExplosionEffect{impact.position}});

    if (projectile->splashRadius > 0.0f) {
        SplashDamageEffect splash;
        splash.position = impact.position;
        splash.radius = projectile->splashRadius;
        splash.damage = projectile->splashDamage;
        if (struckEnemy) {
            splash.sourceEnemyId = impact.other.enemyId;
        }
        bus_.Publish(EffectTriggered{effectIds_.next(), splash});
    }

    if (struckEnemy) {
        bus_.Publish(EnemyHit{impact.other.enemyId, weapon->stats.damage, impact.position});
    }
    return true;
}

void ProjectileImpactHandler::onEffect(const EffectTriggered& event) {
    if (const auto* splash = std::get_if<SplashDamageEffect>(&event.effect)) {
        resolver_.ResolveSplash(
            SplashRequest{splash->position, splash->radius, splash->damage, splash->sourceEnemyId});
    }
}

} // namespace arc::game
