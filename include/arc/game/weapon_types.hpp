#pragma once

/// @file weapon_types.hpp
/// @brief Weapon data model: stats, schemas and the charge-cycle states.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "arc/foundation/game_result.hpp"
#include "arc/game/timer_queue.hpp"

namespace arc::game {

/// Charge-cycle state of one weapon instance.
enum class AnimationState : uint8_t {
    Idle,        ///< Ready to charge.
    Charging,    ///< Trigger held, charge timer running.
    Charged,     ///< Fully charged; waits for release indefinitely.
    Discharging, ///< Fired; peak of the discharge animation.
    Decay        ///< Cooling down back to Idle.
};

constexpr std::string_view animationStateName(AnimationState state) {
    switch (state) {
        case AnimationState::Idle:        return "Idle";
        case AnimationState::Charging:    return "Charging";
        case AnimationState::Charged:     return "Charged";
        case AnimationState::Discharging: return "Discharging";
        case AnimationState::Decay:       return "Decay";
    }
    return "Unknown";
}

/// Fire logic variant of a weapon.
enum class WeaponType : uint8_t {
    Projectile,   ///< Spawns a projectile with splash on impact.
    HitscanChain  ///< Instant ray hit that chains between enemies.
};

constexpr std::string_view weaponTypeName(WeaponType type) {
    switch (type) {
        case WeaponType::Projectile:   return "projectile";
        case WeaponType::HitscanChain: return "hitscan_chain";
    }
    return "unknown";
}

/// Splash projectile payload.
struct ProjectileStats {
    int32_t splashDamage = 0;
    float splashRadius = 0.0f;
    float projectileSpeed = 0.0f;
};

/// Chain-lightning payload.
struct ChainStats {
    int32_t maxChainTargets = 1;
    float chainRadius = 0.0f;
    /// Multiplier applied per hop, in (0, 1].
    float damageFalloff = 1.0f;
};

using WeaponPayload = std::variant<ProjectileStats, ChainStats>;

/// Immutable per-weapon tuning values.
struct WeaponStats {
    int32_t damage = 0;
    Milliseconds chargeDuration{0};
    Milliseconds dischargePeakDuration{0};
    Milliseconds decayDuration{0};
    WeaponPayload payload;

    [[nodiscard]] WeaponType Type() const noexcept {
        return std::holds_alternative<ChainStats>(payload) ? WeaponType::HitscanChain
                                                           : WeaponType::Projectile;
    }

    [[nodiscard]] const ProjectileStats* Projectile() const noexcept {
        return std::get_if<ProjectileStats>(&payload);
    }

    [[nodiscard]] const ChainStats* Chain() const noexcept {
        return std::get_if<ChainStats>(&payload);
    }
};

/// Identity plus stats of one weapon. Never mutated after loading.
struct WeaponSchema {
    std::string id;
    std::string name;
    std::string description;
    std::string modelId;
    /// Visual type carried by WeaponFired (projectile weapons only).
    std::string projectileVisual;
    /// 0xRRGGBB tint of the discharge effect.
    uint32_t effectColor = 0xff8c00;
    WeaponStats stats;

    [[nodiscard]] WeaponType Type() const noexcept { return stats.Type(); }
};

/// Check the startup invariants of a weapon's stats.
///
/// Durations must be positive, damage values non-negative; projectile
/// weapons need a positive speed and a non-negative splash radius; chain
/// weapons need at least one target, a positive radius and a falloff in
/// (0, 1].
///
/// @return Success or InvalidWeaponStats naming the offending field.
[[nodiscard]] arc::foundation::GameResult<void>
ValidateWeaponStats(std::string_view weaponId, const WeaponStats& stats);

} // namespace arc::game
