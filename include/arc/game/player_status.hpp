#pragma once

/// @file player_status.hpp
/// @brief Player health, shield, score and the death latch.

#include <array>
#include <cstdint>

#include "arc/event/event_bus.hpp"
#include "arc/game/game_settings.hpp"

namespace arc::game {

/// Snapshot of the player's vitals.
struct PlayerState {
    int32_t health = 0;
    int32_t maxHealth = 0;
    int32_t shield = 0;
    int32_t maxShield = 0;
    int64_t score = 0;
    bool isDead = false;

    // Statistics
    int64_t damageTaken = 0;
    int64_t enemiesKilled = 0;
    /// Best score seen by this component; survives Reset().
    int64_t highestScore = 0;
};

/// Sole owner of PlayerState.
///
/// Consumes PLAYER_TOOK_DAMAGE, PLAYER_ADD_SHIELD, INCREASE_SCORE and
/// ENEMY_DIED. Once health reaches zero the player is dead until Reset():
/// damage, shield and heal requests are ignored, score still accrues, and
/// PLAYER_DIED is published exactly once.
class PlayerStatus {
public:
    PlayerStatus(arc::event::EventBus& bus, PlayerSettings settings);
    ~PlayerStatus();

    PlayerStatus(const PlayerStatus&) = delete;
    PlayerStatus& operator=(const PlayerStatus&) = delete;

    /// Shield absorbs first, the remainder spills over to health.
    void TakeDamage(int32_t amount);

    /// Combine @p amount with the current shield per the shield policy.
    void AddShield(int32_t amount);

    /// Additive; applied even while dead.
    void IncreaseScore(int32_t amount);

    /// Restore health up to maxHealth.
    void Heal(int32_t amount);

    /// Back to full health, no shield, zero score, alive.
    void Reset();

    [[nodiscard]] const PlayerState& State() const noexcept { return state_; }

    [[nodiscard]] bool IsDead() const noexcept { return state_.isDead; }

    [[nodiscard]] ShieldPolicy Policy() const noexcept { return settings_.shieldPolicy; }

private:
    arc::event::EventBus& bus_;
    PlayerSettings settings_;
    PlayerState state_;
    std::array<arc::event::SubscriptionId, 4> subscriptions_{};
};

} // namespace arc::game
