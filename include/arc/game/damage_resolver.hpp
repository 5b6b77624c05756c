#pragma once

/// @file damage_resolver.hpp
/// @brief Area (splash), chain-lightning and nova damage resolution.

#include <cstdint>
#include <optional>
#include <vector>

#include "arc/event/event_bus.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/physics_query.hpp"

namespace arc::game {

using arc::foundation::EffectId;

/// Input of one splash resolution.
struct SplashRequest {
    Vector3 position;
    float radius = 0.0f;
    int32_t damage = 0;
    /// Enemy excluded from the splash (the one struck directly).
    std::optional<EnemyId> sourceEnemyId;
};

/// Input of one chain resolution.
struct ChainRequest {
    /// Start of the arc polyline (the staff tip).
    Vector3 origin;
    /// First body hit by the aim ray, if any.
    std::optional<BodyHit> initialTarget;
    int32_t damage = 0;
    int32_t maxChainTargets = 1;
    float chainRadius = 0.0f;
    float damageFalloff = 1.0f;
};

/// One damaged enemy of a chain.
struct ChainHit {
    EnemyId id;
    int32_t damage = 0;
    Vector3 position;
};

struct ChainResult {
    std::vector<ChainHit> hits;
    /// Origin followed by every hit position, in hit order.
    std::vector<Vector3> points;
};

/// Input of one nova resolution.
struct NovaRequest {
    Vector3 center;
    float radius = 0.0f;
    /// Damage at the center, before falloff.
    int32_t damage = 0;
    /// Fraction of the damage lost at the rim, in [0, 1].
    float falloff = 0.85f;
};

/// One enemy caught by a nova.
struct NovaHit {
    EnemyId id;
    int32_t damage = 0;
    float distance = 0.0f;
    Vector3 position;
};

/// Stateless damage algorithms over the physics collaborator.
///
/// Every resolution publishes one EnemyHit per damaged enemy and hit each
/// enemy at most once per call. The physics query is only read.
class DamageResolver {
public:
    DamageResolver(arc::event::EventBus& bus, const IPhysicsQuery& physics,
                   arc::foundation::IdGenerator<EffectId>& effectIds);

    /// Flat area damage: every enemy body intersecting the sphere, except
    /// the source enemy, takes the full damage.
    /// @return Ids of the enemies hit, in query order.
    std::vector<EnemyId> ResolveSplash(const SplashRequest& request);

    /// Chain lightning with multiplicative falloff.
    ///
    /// The initial target takes the full damage; each further hop jumps to
    /// the nearest unvisited enemy within chainRadius of the previous hit
    /// and deals the previous hop's damage times damageFalloff, rounded to
    /// the nearest integer. Equidistant candidates resolve to the smallest
    /// EnemyId. An arc_lightning effect is published when at least one
    /// enemy was hit.
    ChainResult ResolveChain(const ChainRequest& request);

    /// Expanding fire ring. Each enemy body intersecting the sphere is hit
    /// once, nearest first (ties on the smallest EnemyId), for
    /// max(1, round(damage * (1 - falloff * smoothstep(0, radius, dist)))).
    /// @return The hits in the order they were published.
    std::vector<NovaHit> ResolveNova(const NovaRequest& request);

private:
    arc::event::EventBus& bus_;
    const IPhysicsQuery& physics_;
    arc::foundation::IdGenerator<EffectId>& effectIds_;
};

} // namespace arc::game
