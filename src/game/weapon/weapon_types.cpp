/// @file weapon_types.cpp
/// @brief Weapon stat validation.

#include "arc/game/weapon_types.hpp"

#include <string>

namespace arc::game {

using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;

namespace {

GameResult<void> invalid(std::string_view weaponId, std::string_view field,
                         std::string_view requirement) {
    return GameResult<void>::err(
        GameError(ErrorCode::InvalidWeaponStats,
                  std::string(weaponId) + ": " + std::string(field) + " " +
                      std::string(requirement),
                  std::string(weaponId)));
}

} // namespace

GameResult<void> ValidateWeaponStats(std::string_view weaponId, const WeaponStats& stats) {
    if (stats.damage < 0) {
        return invalid(weaponId, "damage", "must not be negative");
    }
    if (stats.chargeDuration.count() <= 0) {
        return invalid(weaponId, "chargeDuration", "must be positive");
    }
    if (stats.dischargePeakDuration.count() <= 0) {
        return invalid(weaponId, "dischargePeakDuration", "must be positive");
    }
    if (stats.decayDuration.count() <= 0) {
        return invalid(weaponId, "decayDuration", "must be positive");
    }

    if (const auto* projectile = stats.Projectile()) {
        if (projectile->splashDamage < 0) {
            return invalid(weaponId, "splashDamage", "must not be negative");
        }
        if (!(projectile->splashRadius >= 0.0f)) {
            return invalid(weaponId, "splashRadius", "must not be negative");
        }
        if (!(projectile->projectileSpeed > 0.0f)) {
            return invalid(weaponId, "projectileSpeed", "must be positive");
        }
    } else if (const auto* chain = stats.Chain()) {
        if (chain->maxChainTargets < 1) {
            return invalid(weaponId, "maxChainTargets", "must be at least 1");
        }
        if (!(chain->chainRadius > 0.0f)) {
            return invalid(weaponId, "chainRadius", "must be positive");
        }
        if (!(chain->damageFalloff > 0.0f && chain->damageFalloff <= 1.0f)) {
            return invalid(weaponId, "damageFalloff", "must be in (0, 1]");
        }
    }

    return GameResult<void>::ok();
}

} // namespace arc::game
