#pragma once

/// @file combat_session.hpp
/// @brief Composition root of the combat core.
///
/// A CombatSession owns one EventBus, one TimerQueue and every combat
/// component, wired together in dependency order. Input, physics and
/// camera layers talk to the session; components talk to each other only
/// through the bus.

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "arc/event/event_bus.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/damage_resolver.hpp"
#include "arc/game/enemy_manager.hpp"
#include "arc/game/enemy_spawner.hpp"
#include "arc/game/game_settings.hpp"
#include "arc/game/physics_query.hpp"
#include "arc/game/player_status.hpp"
#include "arc/game/projectile_impact_handler.hpp"
#include "arc/game/timer_queue.hpp"
#include "arc/game/weapon_catalog.hpp"
#include "arc/game/weapon_controller.hpp"
#include "arc/game/weapon_inventory.hpp"

namespace arc::game {

/// Gesture-drawn spells.
enum class GestureSpell : uint8_t {
    ProtectiveWard, ///< Grants a shield.
    FireNova        ///< Ring of fire around the player.
};

/// External services the session depends on. Not owned.
struct CombatCollaborators {
    /// Required.
    const IPhysicsQuery* physics = nullptr;
    /// Required.
    const IAimSource* aim = nullptr;
    /// Optional; receives enemy spawns and deaths.
    IEnemyBodyRegistry* bodies = nullptr;
};

class CombatSession {
    /// Restricts construction to Create().
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Build and wire a session.
    ///
    /// @return MissingCollaborator when physics or aim is absent,
    ///         EmptyInventory for an empty catalog, WeaponNotFound for an
    ///         unknown starting weapon.
    [[nodiscard]] static arc::foundation::GameResult<std::unique_ptr<CombatSession>>
    Create(GameSettings settings, WeaponCatalog catalog, CombatCollaborators collaborators);

    CombatSession(Passkey, GameSettings settings, WeaponCatalog catalog,
                  const CombatCollaborators& collaborators);
    ~CombatSession();

    CombatSession(const CombatSession&) = delete;
    CombatSession& operator=(const CombatSession&) = delete;

    // -- Frame ----------------------------------------------------------

    /// Advance timers by @p delta, then flush deferred events.
    void Tick(Milliseconds delta);

    /// Start periodic enemy spawning.
    void Start();

    /// Reset the player, clear enemies, reset the weapon and start again.
    void Restart();

    // -- Input ----------------------------------------------------------
    // All input is ignored while the player is dead.

    bool BeginCharge();
    bool ReleaseTrigger();

    /// Input focus lost: abort the current weapon cycle.
    void CancelInput();

    arc::foundation::GameResult<const WeaponSchema*> Equip(std::string_view weaponId);

    bool CastSpell(GestureSpell spell);

    // -- World feedback -------------------------------------------------

    /// Player moved; recentres the spawn ring.
    void SetPlayerPosition(const Vector3& position);

    [[nodiscard]] const Vector3& PlayerPosition() const noexcept { return playerPosition_; }

    /// A projectile collided with something.
    bool OnProjectileImpact(const ProjectileImpact& impact);

    /// Enemy @p id is @p distance from the player; it attacks if it can.
    bool OnEnemyContact(EnemyId id, float distance);

    // -- Components -----------------------------------------------------

    [[nodiscard]] arc::event::EventBus& Bus() noexcept { return bus_; }
    [[nodiscard]] TimerQueue& Timers() noexcept { return timers_; }
    [[nodiscard]] const GameSettings& Settings() const noexcept { return settings_; }
    [[nodiscard]] const WeaponCatalog& Catalog() const noexcept { return catalog_; }
    [[nodiscard]] const PlayerStatus& Player() const noexcept { return player_; }
    [[nodiscard]] EnemyManager& Enemies() noexcept { return enemies_; }
    [[nodiscard]] const EnemyManager& Enemies() const noexcept { return enemies_; }
    [[nodiscard]] EnemySpawner& Spawner() noexcept { return spawner_; }
    [[nodiscard]] const WeaponController& Weapons() const noexcept { return weapons_; }
    [[nodiscard]] DamageResolver& Resolver() noexcept { return resolver_; }

private:
    void onPlayerDied(const arc::event::PlayerDied& event);
    void onEnemyDied(const arc::event::EnemyDied& event);

    // Declaration order is construction order: the bus and the timer
    // queue outlive every component that subscribes or arms timers.
    arc::event::EventBus bus_;
    TimerQueue timers_;
    arc::foundation::IdGenerator<EffectId> effectIds_;
    GameSettings settings_;
    WeaponCatalog catalog_;
    CombatCollaborators collaborators_;

    WeaponInventory inventory_;
    DamageResolver resolver_;
    EnemyManager enemies_;
    PlayerStatus player_;
    ProjectileImpactHandler impacts_;
    WeaponController weapons_;
    EnemySpawner spawner_;

    Vector3 playerPosition_;
    std::vector<arc::event::SubscriptionId> subscriptions_;
};

} // namespace arc::game
