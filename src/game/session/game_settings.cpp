/// @file game_settings.cpp
/// @brief GameSettings loading and validation.

#include "arc/game/game_settings.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "arc/foundation/config_manager.hpp"

namespace arc::game {

using arc::foundation::ConfigManager;
using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;

std::optional<ShieldPolicy> parseShieldPolicy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto policy : {ShieldPolicy::Replace, ShieldPolicy::Refresh, ShieldPolicy::Stack}) {
        if (lower == shieldPolicyName(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

namespace {

/// Overwrites targets from present keys; stops at the first error.
class SettingsReader {
public:
    explicit SettingsReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    void Read(std::string_view key, T& target) {
        if (error_) {
            return;
        }
        auto result = config_.getOr<T>(key, target);
        if (!result) {
            error_ = result.error();
            return;
        }
        target = result.value();
    }

    void ReadMs(std::string_view key, Milliseconds& target) {
        int64_t count = target.count();
        Read(key, count);
        target = Milliseconds(count);
    }

    void Require(bool condition, std::string_view key, std::string_view requirement) {
        if (error_ || condition) {
            return;
        }
        error_ = GameError(ErrorCode::InvalidArgument,
                           std::string(key) + " " + std::string(requirement),
                           std::string(key));
    }

    void Fail(GameError error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    [[nodiscard]] const std::optional<GameError>& Error() const noexcept { return error_; }

private:
    const ConfigManager& config_;
    std::optional<GameError> error_;
};

} // namespace

GameResult<GameSettings> GameSettings::FromConfig(const ConfigManager& config) {
    GameSettings settings;
    SettingsReader reader(config);

    // player.*
    reader.Read("player.max_health", settings.player.maxHealth);
    reader.Read("player.max_shield", settings.player.maxShield);
    std::string policy(shieldPolicyName(settings.player.shieldPolicy));
    reader.Read("player.shield_policy", policy);
    if (auto parsed = parseShieldPolicy(policy)) {
        settings.player.shieldPolicy = *parsed;
    } else {
        reader.Fail(GameError(ErrorCode::ConfigTypeMismatch,
                              "unknown shield policy '" + policy + "'",
                              "player.shield_policy"));
    }

    // enemy.*
    reader.Read("enemy.max_health", settings.enemy.maxHealth);
    reader.Read("enemy.kill_reward", settings.enemy.killReward);
    reader.Read("enemy.max_count", settings.enemy.maxCount);
    reader.ReadMs("enemy.spawn_interval_ms", settings.enemy.spawnInterval);
    reader.Read("enemy.spawn_radius_min", settings.enemy.spawnRadiusMin);
    reader.Read("enemy.spawn_radius_max", settings.enemy.spawnRadiusMax);
    reader.Read("enemy.spawn_height", settings.enemy.spawnHeight);
    reader.Read("enemy.body_radius", settings.enemy.bodyRadius);
    reader.Read("enemy.damage", settings.enemy.damage);
    reader.ReadMs("enemy.attack_cooldown_ms", settings.enemy.attackCooldown);
    reader.Read("enemy.attack_range", settings.enemy.attackRange);

    // spells.*
    reader.Read("spells.ward_shield", settings.spells.wardShield);
    reader.Read("spells.nova_radius", settings.spells.novaRadius);
    reader.Read("spells.nova_damage", settings.spells.novaDamage);
    reader.Read("spells.nova_falloff", settings.spells.novaFalloff);

    // game.*
    reader.Read("game.tick_rate", settings.game.tickRate);
    reader.Read("game.aim_ray_distance", settings.game.aimRayDistance);
    reader.Read("game.spawn_seed", settings.game.spawnSeed);
    reader.Read("game.starting_weapon", settings.game.startingWeapon);

    reader.Require(settings.player.maxHealth > 0, "player.max_health", "must be positive");
    reader.Require(settings.player.maxShield >= 0, "player.max_shield", "must not be negative");
    reader.Require(settings.enemy.maxHealth > 0, "enemy.max_health", "must be positive");
    reader.Require(settings.enemy.killReward >= 0, "enemy.kill_reward", "must not be negative");
    reader.Require(settings.enemy.spawnInterval.count() > 0,
                   "enemy.spawn_interval_ms", "must be positive");
    reader.Require(settings.enemy.spawnRadiusMin >= 0.0f &&
                       settings.enemy.spawnRadiusMin <= settings.enemy.spawnRadiusMax,
                   "enemy.spawn_radius_min", "must be within [0, spawn_radius_max]");
    reader.Require(settings.enemy.damage >= 0, "enemy.damage", "must not be negative");
    reader.Require(settings.enemy.attackCooldown.count() >= 0,
                   "enemy.attack_cooldown_ms", "must not be negative");
    reader.Require(settings.spells.wardShield >= 0, "spells.ward_shield", "must not be negative");
    reader.Require(settings.spells.novaRadius > 0.0f, "spells.nova_radius", "must be positive");
    reader.Require(settings.spells.novaDamage >= 0, "spells.nova_damage", "must not be negative");
    reader.Require(settings.spells.novaFalloff >= 0.0f && settings.spells.novaFalloff <= 1.0f,
                   "spells.nova_falloff", "must be within [0, 1]");
    reader.Require(settings.game.aimRayDistance > 0.0f,
                   "game.aim_ray_distance", "must be positive");

    if (reader.Error()) {
        return GameResult<GameSettings>::err(*reader.Error());
    }
    return GameResult<GameSettings>::ok(std::move(settings));
}

} // namespace arc::game
