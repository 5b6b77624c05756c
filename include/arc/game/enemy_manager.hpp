#pragma once

/// @file enemy_manager.hpp
/// @brief Owner of the live enemy collection.

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "arc/event/event_bus.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/game_settings.hpp"
#include "arc/game/math_types.hpp"
#include "arc/game/timer_queue.hpp"

namespace arc::game {

using arc::foundation::EnemyId;

/// A live enemy. Removed from the collection the moment it dies.
struct Enemy {
    EnemyId id;
    Vector3 initialPosition;
    int32_t health = 0;
    int32_t maxHealth = 0;
    /// Timer-clock time of the last melee attack, if any.
    std::optional<Milliseconds> lastAttack;
};

/// Combat coordinator for enemies.
///
/// The only component that mutates enemy health. It consumes ENEMY_HIT
/// and, for each kill, publishes ENEMY_DIED followed by INCREASE_SCORE.
/// Hits for unknown or already removed ids are ignored, which makes a
/// second hit on an enemy that died earlier in the same fan-out harmless.
class EnemyManager {
public:
    EnemyManager(arc::event::EventBus& bus, const TimerQueue& clock, EnemySettings settings);
    ~EnemyManager();

    EnemyManager(const EnemyManager&) = delete;
    EnemyManager& operator=(const EnemyManager&) = delete;

    /// Spawn an enemy at full health.
    /// @return Its id, or EnemyLimitReached when maxCount enemies are alive.
    arc::foundation::GameResult<EnemyId> AddEnemy(const Vector3& position);

    /// Apply one hit. Public for direct use; also the ENEMY_HIT handler.
    void OnEnemyHit(const arc::event::EnemyHit& hit);

    /// Melee attack by @p id on the player at @p distanceToPlayer.
    ///
    /// Publishes PLAYER_TOOK_DAMAGE when the enemy is alive, within
    /// attackRange and off cooldown.
    /// @return true if the attack landed.
    bool TryAttack(EnemyId id, float distanceToPlayer);

    [[nodiscard]] const Enemy* Find(EnemyId id) const;

    [[nodiscard]] std::size_t Size() const noexcept { return enemies_.size(); }

    /// Live enemies ordered by id.
    [[nodiscard]] std::vector<Enemy> Enemies() const;

    /// Remove every enemy without publishing anything (game restart).
    void Clear();

    [[nodiscard]] const EnemySettings& Settings() const noexcept { return settings_; }

private:
    arc::event::EventBus& bus_;
    const TimerQueue& clock_;
    EnemySettings settings_;
    arc::foundation::IdGenerator<EnemyId> ids_;
    std::map<EnemyId, Enemy> enemies_;
    arc::event::SubscriptionId hitSubscription_ = 0;
};

} // namespace arc::game
