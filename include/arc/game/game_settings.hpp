#pragma once

/// @file game_settings.hpp
/// @brief Tunable gameplay constants, loaded from configuration.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "arc/foundation/game_result.hpp"
#include "arc/game/timer_queue.hpp"

namespace arc::foundation {
class ConfigManager;
} // namespace arc::foundation

namespace arc::game {

/// How PlayerAddShield combines with the current shield.
enum class ShieldPolicy : uint8_t {
    Replace, ///< shield = amount
    Refresh, ///< shield = max(shield, amount)
    Stack    ///< shield = shield + amount, clamped to maxShield
};

constexpr std::string_view shieldPolicyName(ShieldPolicy policy) {
    switch (policy) {
        case ShieldPolicy::Replace: return "replace";
        case ShieldPolicy::Refresh: return "refresh";
        case ShieldPolicy::Stack:   return "stack";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ShieldPolicy> parseShieldPolicy(std::string_view name);

struct PlayerSettings {
    int32_t maxHealth = 100;
    int32_t maxShield = 100;
    ShieldPolicy shieldPolicy = ShieldPolicy::Refresh;
};

struct EnemySettings {
    int32_t maxHealth = 100;
    /// Score awarded per kill.
    int32_t killReward = 100;
    std::size_t maxCount = 15;
    Milliseconds spawnInterval{4000};
    /// Spawn ring around the player, on the ground plane.
    float spawnRadiusMin = 25.0f;
    float spawnRadiusMax = 45.0f;
    float spawnHeight = 35.0f;
    float bodyRadius = 1.0f;
    /// Melee attack.
    int32_t damage = 10;
    Milliseconds attackCooldown{1000};
    float attackRange = 1.8f;
};

struct SpellSettings {
    /// Shield granted by the protective ward gesture.
    int32_t wardShield = 75;
    /// Fire nova cast around the player.
    float novaRadius = 15.0f;
    int32_t novaDamage = 50;
    /// Fraction of novaDamage lost at the rim.
    float novaFalloff = 0.85f;
};

struct SessionSettings {
    /// Game loop rate in Hz.
    uint32_t tickRate = 60;
    /// Reach of the aim ray used by hitscan weapons.
    float aimRayDistance = 100.0f;
    /// Seed of the spawner's random engine.
    uint32_t spawnSeed = 5489u;
    /// Weapon equipped at start; empty means the first inventory entry.
    std::string startingWeapon;
};

/// Every tunable of a combat session.
struct GameSettings {
    PlayerSettings player;
    EnemySettings enemy;
    SpellSettings spells;
    SessionSettings game;

    /// Read "player.*", "enemy.*", "spells.*" and "game.*" keys. Missing
    /// keys keep their defaults.
    /// @return The settings, or a config / InvalidArgument error.
    [[nodiscard]] static arc::foundation::GameResult<GameSettings>
    FromConfig(const arc::foundation::ConfigManager& config);
};

} // namespace arc::game
