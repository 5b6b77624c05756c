#pragma once

/// @file game_events.hpp
/// @brief Closed set of combat events carried by the EventBus.
///
/// Every channel is a plain value struct with a static channel name.
/// GameEvent is the closed sum of all channels; adding a new channel means
/// adding it to GameEvent, after which every exhaustive visitor over
/// GameEvent (and EffectPayload) fails to compile until it handles the
/// new alternative.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "arc/foundation/types.hpp"
#include "arc/game/math_types.hpp"

namespace arc::event {

using arc::foundation::EffectId;
using arc::foundation::EnemyId;
using arc::foundation::ProjectileId;
using arc::game::Vector3;

/// Helper for building exhaustive visitors from lambdas.
template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

// ── Weapon ──────────────────────────────────────────────────────────────

/// A projectile left the staff tip.
struct WeaponFired {
    static constexpr std::string_view kChannel = "WEAPON_FIRED";

    ProjectileId id;
    std::string weaponId;
    Vector3 start;
    Vector3 velocity;
    std::string visualType;
};

/// The equipped weapon changed.
struct WeaponSwitched {
    static constexpr std::string_view kChannel = "WEAPON_SWITCHED";

    std::string previousId;
    std::string newId;
};

// ── Player ──────────────────────────────────────────────────────────────

struct PlayerTookDamage {
    static constexpr std::string_view kChannel = "PLAYER_TOOK_DAMAGE";

    int32_t amount = 0;
};

struct PlayerAddShield {
    static constexpr std::string_view kChannel = "PLAYER_ADD_SHIELD";

    int32_t amount = 0;
};

struct IncreaseScore {
    static constexpr std::string_view kChannel = "INCREASE_SCORE";

    int32_t amount = 0;
};

/// Published once when the player's death latch trips.
struct PlayerDied {
    static constexpr std::string_view kChannel = "PLAYER_DIED";

    int64_t score = 0;
};

// ── Enemies ─────────────────────────────────────────────────────────────

struct EnemyHit {
    static constexpr std::string_view kChannel = "ENEMY_HIT";

    EnemyId id;
    int32_t damage = 0;
    Vector3 position;
};

struct EnemyDied {
    static constexpr std::string_view kChannel = "ENEMY_DIED";

    EnemyId id;
    Vector3 position;
};

// ── Effects ─────────────────────────────────────────────────────────────

struct ExplosionEffect {
    Vector3 position;
};

struct RockMonsterDeathEffect {
    Vector3 position;
};

struct NovaEffect {
    Vector3 position;
};

/// Polyline from the staff tip through every chain hop, in hit order.
struct ArcLightningEffect {
    std::vector<Vector3> points;
};

/// Area damage request; also consumed by the splash resolver host.
struct SplashDamageEffect {
    Vector3 position;
    float radius = 0.0f;
    int32_t damage = 0;
    /// Enemy struck directly by the projectile; excluded from the splash.
    std::optional<EnemyId> sourceEnemyId;
};

struct DischargeEffect {
    Vector3 position;
    uint32_t colorRgb = 0xff8c00;
};

using EffectPayload = std::variant<SplashDamageEffect,
                                   ArcLightningEffect,
                                   ExplosionEffect,
                                   NovaEffect,
                                   DischargeEffect,
                                   RockMonsterDeathEffect>;

struct EffectTriggered {
    static constexpr std::string_view kChannel = "EFFECT_TRIGGERED";

    EffectId id;
    EffectPayload effect;
};

/// Wire-style effect type name ("splash_damage", "arc_lightning", ...).
std::string_view effectTypeName(const EffectPayload& effect);

// ── Closed event set ────────────────────────────────────────────────────

using GameEvent = std::variant<WeaponFired,
                               WeaponSwitched,
                               PlayerTookDamage,
                               PlayerAddShield,
                               IncreaseScore,
                               PlayerDied,
                               EnemyHit,
                               EnemyDied,
                               EffectTriggered>;

inline constexpr std::size_t kEventChannelCount = std::variant_size_v<GameEvent>;

namespace detail {

template <typename E, typename Variant>
struct AlternativeIndex;

template <typename E, typename... Ts>
struct AlternativeIndex<E, std::variant<Ts...>> {
    static constexpr std::size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<E, Ts>...};
        for (std::size_t i = 0; i < sizeof...(Ts); ++i) {
            if (matches[i]) {
                return i;
            }
        }
        return sizeof...(Ts);
    }();
};

}  // namespace detail

/// True when E is one of the GameEvent alternatives.
template <typename E>
inline constexpr bool kIsGameEvent =
    detail::AlternativeIndex<E, GameEvent>::value < kEventChannelCount;

/// Position of E inside GameEvent.
template <typename E>
inline constexpr std::size_t kEventIndex = detail::AlternativeIndex<E, GameEvent>::value;

/// Channel name of the event held by @p event.
inline std::string_view channelName(const GameEvent& event) {
    return std::visit([](const auto& e) {
        return std::decay_t<decltype(e)>::kChannel;
    }, event);
}

}  // namespace arc::event
