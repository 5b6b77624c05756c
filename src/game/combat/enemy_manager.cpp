/// @file enemy_manager.cpp
/// @brief EnemyManager implementation.

#include "arc/game/enemy_manager.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::EnemyDied;
using arc::event::EnemyHit;
using arc::event::IncreaseScore;
using arc::event::PlayerTookDamage;
using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;
using arc::foundation::LogCategory;

EnemyManager::EnemyManager(arc::event::EventBus& bus, const TimerQueue& clock,
                           EnemySettings settings)
    : bus_(bus), clock_(clock), settings_(settings) {
    hitSubscription_ = bus_.Subscribe<EnemyHit>(
        [this](const EnemyHit& hit) { OnEnemyHit(hit); });
}

EnemyManager::~EnemyManager() {
    bus_.Unsubscribe(hitSubscription_);
}

GameResult<EnemyId> EnemyManager::AddEnemy(const Vector3& position) {
    if (enemies_.size() >= settings_.maxCount) {
        return GameResult<EnemyId>::err(
            GameError(ErrorCode::EnemyLimitReached,
                      "enemy limit of " + std::to_string(settings_.maxCount) + " reached"));
    }

    Enemy enemy;
    enemy.id = ids_.next();
    enemy.initialPosition = position;
    enemy.health = settings_.maxHealth;
    enemy.maxHealth = settings_.maxHealth;
    enemies_.emplace(enemy.id, enemy);

    ARC_LOG_DEBUG(LogCategory::Combat,
                  "enemy " + std::to_string(enemy.id.value()) + " spawned");
    return GameResult<EnemyId>::ok(enemy.id);
}

void EnemyManager::OnEnemyHit(const EnemyHit& hit) {
    auto it = enemies_.find(hit.id);
    if (it == enemies_.end()) {
        ARC_LOG_DEBUG(LogCategory::Combat,
                      "hit on absent enemy " + std::to_string(hit.id.value()) + " ignored");
        return;
    }

    const int32_t remaining = it->second.health - hit.damage;
    if (remaining > 0) {
        it->second.health = std::min(remaining, it->second.maxHealth);
        return;
    }

    // Remove before publishing so that re-entrant hits see the enemy gone.
    const EnemyId id = it->first;
    enemies_.erase(it);

    ARC_LOG_DEBUG(LogCategory::Combat, "enemy " + std::to_string(id.value()) + " died");
    bus_.Publish(EnemyDied{id, hit.position});
    bus_.Publish(IncreaseScore{settings_.killReward});
}

bool EnemyManager::TryAttack(EnemyId id, float distanceToPlayer) {
    auto it = enemies_.find(id);
    if (it == enemies_.end() || distanceToPlayer > settings_.attackRange) {
        return false;
    }

    auto& enemy = it->second;
    const Milliseconds now = clock_.Now();
    if (enemy.lastAttack && now - *enemy.lastAttack < settings_.attackCooldown) {
        return false;
    }

    enemy.lastAttack = now;
    bus_.Publish(PlayerTookDamage{settings_.damage});
    return true;
}

const Enemy* EnemyManager::Find(EnemyId id) const {
    auto it = enemies_.find(id);
    return it == enemies_.end() ? nullptr : &it->second;
}

std::vector<Enemy> EnemyManager::Enemies() const {
    std::vector<Enemy> result;
    result.reserve(enemies_.size());
    for (const auto& [id, enemy] : enemies_) {
        result.push_back(enemy);
    }
    return result;
}

void EnemyManager::Clear() {
    enemies_.clear();
}

} // namespace arc::game
