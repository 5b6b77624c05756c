/// @file enemy_spawner.cpp
/// @brief Timed enemy spawning on a ring around the player.

#include "arc/game/enemy_spawner.hpp"

#include <cmath>
#include <numbers>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::foundation::LogCategory;

EnemySpawner::EnemySpawner(EnemyManager& enemies, TimerQueue& timers, uint32_t seed)
    : enemies_(enemies), next_(timers), rng_(seed) {}

void EnemySpawner::Start() {
    if (active_) {
        return;
    }
    active_ = true;
    scheduleNext();
}

void EnemySpawner::Stop() {
    active_ = false;
    next_.Cancel();
}

std::optional<EnemyId> EnemySpawner::SpawnOnce() {
    const Vector3 position = randomPosition();
    auto added = enemies_.AddEnemy(position);
    if (!added) {
        ARC_LOG_DEBUG(LogCategory::World, std::string(added.error().message()));
        return std::nullopt;
    }

    if (listener_) {
        listener_(added.value(), position);
    }
    return added.value();
}

void EnemySpawner::scheduleNext() {
    next_.Arm(enemies_.Settings().spawnInterval, [this] {
        if (!active_) {
            return;
        }
        (void)SpawnOnce();  // a full arena just skips this wave
        scheduleNext();
    });
}

Vector3 EnemySpawner::randomPosition() {
    const auto& settings = enemies_.Settings();
    std::uniform_real_distribution<float> angleDist(0.0f, 2.0f * std::numbers::pi_v<float>);
    std::uniform_real_distribution<float> radiusDist(settings.spawnRadiusMin,
                                                     settings.spawnRadiusMax);
    const float angle = angleDist(rng_);
    const float radius = radiusDist(rng_);
    return {center_.x + std::cos(angle) * radius,
            settings.spawnHeight,
            center_.z + std::sin(angle) * radius};
}

} // namespace arc::game
