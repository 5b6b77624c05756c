#pragma once

/// @file physics_query.hpp
/// @brief Collaborator interfaces the combat core consumes from the
///        physics and camera layers.

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "arc/foundation/types.hpp"
#include "arc/game/math_types.hpp"

namespace arc::game {

using arc::foundation::EnemyId;

/// Kind of physics body reported by a query.
enum class BodyType : uint8_t {
    Player,
    Enemy,
    Ground,
    Fireball,
    Scenery,
    Spark
};

constexpr std::string_view bodyTypeName(BodyType type) {
    switch (type) {
        case BodyType::Player:   return "player";
        case BodyType::Enemy:    return "enemy";
        case BodyType::Ground:   return "ground";
        case BodyType::Fireball: return "fireball";
        case BodyType::Scenery:  return "scenery";
        case BodyType::Spark:    return "spark";
    }
    return "unknown";
}

/// One body returned by a sphere or ray query.
///
/// @c enemyId is only meaningful when @c type is BodyType::Enemy.
struct BodyHit {
    BodyType type = BodyType::Scenery;
    EnemyId enemyId;
    Vector3 position;
};

/// Read-only spatial queries answered by the physics collaborator.
class IPhysicsQuery {
public:
    virtual ~IPhysicsQuery() = default;

    /// All bodies whose volume intersects the sphere.
    [[nodiscard]] virtual std::vector<BodyHit>
    IntersectSphere(const Vector3& center, float radius) const = 0;

    /// First body hit by the ray within @p maxDistance, if any.
    [[nodiscard]] virtual std::optional<BodyHit>
    CastRay(const Vector3& origin, const Vector3& direction, float maxDistance) const = 0;
};

/// Mirrors the enemy roster into the physics layer.
class IEnemyBodyRegistry {
public:
    virtual ~IEnemyBodyRegistry() = default;

    virtual void RegisterEnemy(EnemyId id, const Vector3& position, float radius) = 0;

    /// No-op for ids without a body.
    virtual void UnregisterEnemy(EnemyId id) = 0;
};

/// Camera and staff placement sampled at fire time.
struct AimFrame {
    Vector3 staffTip;
    Vector3 cameraOrigin;
    Vector3 direction{0.0f, 0.0f, -1.0f};
};

/// Supplies the current aim; implemented by the camera/input layer.
class IAimSource {
public:
    virtual ~IAimSource() = default;

    [[nodiscard]] virtual AimFrame CurrentAim() const = 0;
};

} // namespace arc::game
