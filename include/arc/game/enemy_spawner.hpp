#pragma once

/// @file enemy_spawner.hpp
/// @brief Periodic enemy spawning on a ring around the player.

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <utility>

#include "arc/game/enemy_manager.hpp"
#include "arc/game/timer_queue.hpp"

namespace arc::game {

/// Called after an enemy was added, e.g. to create its physics body.
using SpawnListener = std::function<void(EnemyId id, const Vector3& position)>;

/// Spawns one enemy every spawnInterval while active, unless maxCount
/// enemies are alive. Positions are drawn uniformly on a ring of
/// [spawnRadiusMin, spawnRadiusMax] around the centre, at spawnHeight.
class EnemySpawner {
public:
    EnemySpawner(EnemyManager& enemies, TimerQueue& timers, uint32_t seed);

    EnemySpawner(const EnemySpawner&) = delete;
    EnemySpawner& operator=(const EnemySpawner&) = delete;

    /// Begin periodic spawning. No-op when already active.
    void Start();

    /// Stop spawning; the pending spawn is cancelled.
    void Stop();

    [[nodiscard]] bool IsActive() const noexcept { return active_; }

    /// Spawn one enemy now.
    /// @return Its id, or nullopt when the enemy limit is reached.
    std::optional<EnemyId> SpawnOnce();

    /// Centre of the spawn ring (the player's position).
    void SetCenter(const Vector3& center) noexcept { center_ = center; }

    void SetListener(SpawnListener listener) { listener_ = std::move(listener); }

    /// Reseed the random engine (restart reproducibility).
    void Reseed(uint32_t seed) { rng_.seed(seed); }

private:
    void scheduleNext();

    [[nodiscard]] Vector3 randomPosition();

    EnemyManager& enemies_;
    DeferredAction next_;
    std::mt19937 rng_;
    Vector3 center_;
    SpawnListener listener_;
    bool active_ = false;
};

} // namespace arc::game
