/// @file player_status.cpp
/// @brief PlayerStatus implementation.

#include "arc/game/player_status.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::EnemyDied;
using arc::event::PlayerAddShield;
using arc::event::PlayerDied;
using arc::event::PlayerTookDamage;
using arc::foundation::LogCategory;

PlayerStatus::PlayerStatus(arc::event::EventBus& bus, PlayerSettings settings)
    : bus_(bus), settings_(settings) {
    Reset();

    subscriptions_ = {
        bus_.Subscribe<PlayerTookDamage>(
            [this](const PlayerTookDamage& e) { TakeDamage(e.amount); }),
        bus_.Subscribe<PlayerAddShield>(
            [this](const PlayerAddShield& e) { AddShield(e.amount); }),
        // Qualified: the member function of the same name hides the type.
        bus_.Subscribe<arc::event::IncreaseScore>(
            [this](const arc::event::IncreaseScore& e) { IncreaseScore(e.amount); }),
        bus_.Subscribe<EnemyDied>(
            [this](const EnemyDied&) { ++state_.enemiesKilled; }),
    };
}

PlayerStatus::~PlayerStatus() {
    for (auto id : subscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void PlayerStatus::TakeDamage(int32_t amount) {
    if (state_.isDead || amount <= 0) {
        return;
    }

    const int32_t absorbed = std::min(amount, state_.shield);
    state_.shield -= absorbed;
    state_.health = std::max(0, state_.health - (amount - absorbed));
    state_.damageTaken += amount;

    if (state_.health > 0) {
        return;
    }

    state_.isDead = true;
    ARC_LOG_INFO(LogCategory::Player,
                 "player died with score " + std::to_string(state_.score));
    bus_.Publish(PlayerDied{state_.score});
}

void PlayerStatus::AddShield(int32_t amount) {
    if (state_.isDead || amount < 0) {
        return;
    }

    state_.maxShield = std::max(state_.maxShield, amount);
    switch (settings_.shieldPolicy) {
        case ShieldPolicy::Replace:
            state_.shield = amount;
            break;
        case ShieldPolicy::Refresh:
            state_.shield = std::max(state_.shield, amount);
            break;
        case ShieldPolicy::Stack:
            state_.shield = std::min(state_.shield + amount, state_.maxShield);
            break;
    }
}

void PlayerStatus::IncreaseScore(int32_t amount) {
    state_.score += amount;
    state_.highestScore = std::max(state_.highestScore, state_.score);
}

void PlayerStatus::Heal(int32_t amount) {
    if (state_.isDead || amount <= 0) {
        return;
    }
    state_.health = std::min(state_.maxHealth, state_.health + amount);
}

void PlayerStatus::Reset() {
    const int64_t best = state_.highestScore;
    state_ = PlayerState{};
    state_.health = settings_.maxHealth;
    state_.maxHealth = settings_.maxHealth;
    state_.maxShield = settings_.maxShield;
    state_.highestScore = best;
}

} // namespace arc::game
