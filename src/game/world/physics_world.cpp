/// @file physics_world.cpp
/// @brief Sphere-body physics world with ray and overlap queries.

#include "arc/game/physics_world.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace arc::game {

PhysicsWorld::PhysicsWorld(float cellSize) : index_(cellSize) {}

BodyHandle PhysicsWorld::AddBody(BodyType type, const Vector3& position, float radius,
                                 EnemyId enemyId) {
    auto handle = handles_.next();
    Body body;
    body.type = type;
    body.enemyId = enemyId;
    body.position = position;
    body.radius = std::max(radius, 0.0f);

    maxBodyRadius_ = std::max(maxBodyRadius_, body.radius);
    bodies_.emplace(handle, body);
    index_.Insert(handle, position);
    return handle;
}

BodyHandle PhysicsWorld::AddEnemyBody(EnemyId id, const Vector3& position, float radius) {
    RemoveEnemyBody(id);
    auto handle = AddBody(BodyType::Enemy, position, radius, id);
    enemyBodies_[id] = handle;
    return handle;
}

void PhysicsWorld::MoveBody(BodyHandle body, const Vector3& position) {
    auto it = bodies_.find(body);
    if (it == bodies_.end()) {
        return;
    }
    it->second.position = position;
    index_.Update(body, position);
}

void PhysicsWorld::RemoveBody(BodyHandle body) {
    auto it = bodies_.find(body);
    if (it == bodies_.end()) {
        return;
    }
    if (it->second.type == BodyType::Enemy) {
        enemyBodies_.erase(it->second.enemyId);
    }
    index_.Remove(body);
    bodies_.erase(it);
}

void PhysicsWorld::RemoveEnemyBody(EnemyId id) {
    auto it = enemyBodies_.find(id);
    if (it == enemyBodies_.end()) {
        return;
    }
    RemoveBody(it->second);
}

void PhysicsWorld::Clear() {
    index_.Clear();
    bodies_.clear();
    enemyBodies_.clear();
    maxBodyRadius_ = 0.0f;
}

std::optional<BodyHandle> PhysicsWorld::FindEnemyBody(EnemyId id) const {
    auto it = enemyBodies_.find(id);
    if (it == enemyBodies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BodyHit> PhysicsWorld::IntersectSphere(const Vector3& center, float radius) const {
    std::vector<BodyHit> hits;
    if (radius <= 0.0f) {
        return hits;
    }

    for (auto handle : index_.QueryRadius(center, radius + maxBodyRadius_)) {
        const auto& body = bodies_.at(handle);
        const float reach = radius + body.radius;
        if (body.position.DistanceSquared(center) <= reach * reach) {
            hits.push_back(toHit(body));
        }
    }
    return hits;
}

std::optional<BodyHit> PhysicsWorld::CastRay(const Vector3& origin, const Vector3& direction,
                                             float maxDistance) const {
    const Vector3 dir = direction.Normalized();
    if (dir == Vector3::Zero() || maxDistance <= 0.0f) {
        return std::nullopt;
    }

    const Body* nearest = nullptr;
    BodyHandle nearestHandle;
    float nearestT = std::numeric_limits<float>::max();

    // Ray/sphere: |origin + t*dir - c|^2 = r^2 with |dir| = 1.
    for (const auto& [handle, body] : bodies_) {
        const Vector3 oc = origin - body.position;
        const float b = oc.Dot(dir);
        const float c = oc.LengthSquared() - body.radius * body.radius;
        const float disc = b * b - c;
        if (disc < 0.0f) {
            continue;
        }
        const float sq = std::sqrt(disc);
        float t = -b - sq;
        if (t < 0.0f) {
            t = -b + sq;  // origin inside the sphere
        }
        if (t < 0.0f || t > maxDistance) {
            continue;
        }
        // Equal distances resolve to the lower handle for reproducibility.
        if (t < nearestT || (t == nearestT && handle < nearestHandle)) {
            nearestT = t;
            nearestHandle = handle;
            nearest = &body;
        }
    }

    if (nearest == nullptr) {
        return std::nullopt;
    }
    return toHit(*nearest);
}

BodyHit PhysicsWorld::toHit(const Body& body) {
    BodyHit hit;
    hit.type = body.type;
    hit.enemyId = body.enemyId;
    hit.position = body.position;
    return hit;
}

} // namespace arc::game
