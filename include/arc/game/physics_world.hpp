#pragma once

/// @file physics_world.hpp
/// @brief Sphere-body physics world answering IPhysicsQuery.
///
/// Stands in for the physics engine in the headless demo and in tests:
/// every body is a sphere, there is no dynamics, and queries are answered
/// from a SpatialIndex.

#include <optional>
#include <unordered_map>
#include <vector>

#include "arc/game/physics_query.hpp"
#include "arc/game/spatial_index.hpp"

namespace arc::game {

/// Default collision radius of an enemy body.
inline constexpr float kDefaultEnemyBodyRadius = 1.0f;

class PhysicsWorld final : public IPhysicsQuery, public IEnemyBodyRegistry {
public:
    explicit PhysicsWorld(float cellSize = kDefaultCellSize);

    // -- Bodies ---------------------------------------------------------

    /// Register a sphere body.
    BodyHandle AddBody(BodyType type, const Vector3& position, float radius,
                       EnemyId enemyId = EnemyId{});

    /// Register the body of an enemy; replaces any body it already has.
    BodyHandle AddEnemyBody(EnemyId id, const Vector3& position,
                            float radius = kDefaultEnemyBodyRadius);

    /// Move a body. No-op for unknown handles.
    void MoveBody(BodyHandle body, const Vector3& position);

    void RemoveBody(BodyHandle body);

    /// Remove the body registered for @p id, if any.
    void RemoveEnemyBody(EnemyId id);

    void Clear();

    [[nodiscard]] std::size_t BodyCount() const noexcept { return bodies_.size(); }

    [[nodiscard]] std::optional<BodyHandle> FindEnemyBody(EnemyId id) const;

    // -- IPhysicsQuery --------------------------------------------------

    [[nodiscard]] std::vector<BodyHit>
    IntersectSphere(const Vector3& center, float radius) const override;

    [[nodiscard]] std::optional<BodyHit>
    CastRay(const Vector3& origin, const Vector3& direction, float maxDistance) const override;

    // -- IEnemyBodyRegistry ---------------------------------------------

    void RegisterEnemy(EnemyId id, const Vector3& position, float radius) override {
        AddEnemyBody(id, position, radius);
    }

    void UnregisterEnemy(EnemyId id) override { RemoveEnemyBody(id); }

private:
    struct Body {
        BodyType type = BodyType::Scenery;
        EnemyId enemyId;
        Vector3 position;
        float radius = 0.0f;
    };

    [[nodiscard]] static BodyHit toHit(const Body& body);

    SpatialIndex index_;
    arc::foundation::IdGenerator<BodyHandle> handles_;
    std::unordered_map<BodyHandle, Body> bodies_;
    std::unordered_map<EnemyId, BodyHandle> enemyBodies_;

    /// Largest registered radius; widens grid queries so that bodies whose
    /// centre is outside the query sphere but whose surface is inside are
    /// still found.
    float maxBodyRadius_ = 0.0f;
};

} // namespace arc::game
