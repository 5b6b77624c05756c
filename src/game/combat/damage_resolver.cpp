/// @file damage_resolver.cpp
/// @brief Splash, chain and nova damage resolution.

#include "arc/game/damage_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::ArcLightningEffect;
using arc::event::EffectTriggered;
using arc::event::EnemyHit;
using arc::foundation::GameLogger;
using arc::foundation::LogCategory;
using arc::foundation::LogContext;
using arc::foundation::LogLevel;

namespace {

void logHit(std::string_view what, EnemyId id, int32_t damage) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        return;
    }
    LogContext ctx;
    ctx.enemyId = id;
    ctx.extra["damage"] = std::to_string(damage);
    logger.logWithContext(LogLevel::Debug, LogCategory::Combat, what, ctx);
}

/// Hermite step of @p x across [edge0, edge1], clamped to [0, 1].
float smoothstep(float edge0, float edge1, float x) {
    if (x <= edge0) {
        return 0.0f;
    }
    if (x >= edge1) {
        return 1.0f;
    }
    const float t = (x - edge0) / (edge1 - edge0);
    return t * t * (3.0f - 2.0f * t);
}

} // namespace

DamageResolver::DamageResolver(arc::event::EventBus& bus, const IPhysicsQuery& physics,
                               arc::foundation::IdGenerator<EffectId>& effectIds)
    : bus_(bus), physics_(physics), effectIds_(effectIds) {}

std::vector<EnemyId> DamageResolver::ResolveSplash(const SplashRequest& request) {
    std::vector<EnemyId> hitIds;
    if (request.radius <= 0.0f) {
        return hitIds;
    }

    std::unordered_set<EnemyId> visited;
    for (const auto& body : physics_.IntersectSphere(request.position, request.radius)) {
        if (body.type != BodyType::Enemy || !body.enemyId.isValid()) {
            continue;
        }
        if (request.sourceEnemyId && body.enemyId == *request.sourceEnemyId) {
            continue;
        }
        if (!visited.insert(body.enemyId).second) {
            continue;
        }

        hitIds.push_back(body.enemyId);
        logHit("Splash hit", body.enemyId, request.damage);
        bus_.Publish(EnemyHit{body.enemyId, request.damage, body.position});
    }
    return hitIds;
}

ChainResult DamageResolver::ResolveChain(const ChainRequest& request) {
    ChainResult result;
    result.points.push_back(request.origin);

    const auto& first = request.initialTarget;
    if (!first || first->type != BodyType::Enemy || !first->enemyId.isValid()) {
        return result;
    }

    std::unordered_set<EnemyId> visited;
    double currentDamage = static_cast<double>(request.damage);

    auto hit = [&](const BodyHit& target) {
        const auto damage = static_cast<int32_t>(std::lround(currentDamage));
        visited.insert(target.enemyId);
        result.hits.push_back(ChainHit{target.enemyId, damage, target.position});
        result.points.push_back(target.position);
        logHit("Chain hop", target.enemyId, damage);
        bus_.Publish(EnemyHit{target.enemyId, damage, target.position});
    };

    hit(*first);
    Vector3 head = first->position;

    for (int32_t hop = 1; hop < request.maxChainTargets; ++hop) {
        std::optional<BodyHit> next;
        float bestDistSq = 0.0f;

        for (const auto& body : physics_.IntersectSphere(head, request.chainRadius)) {
            if (body.type != BodyType::Enemy || !body.enemyId.isValid() ||
                visited.contains(body.enemyId)) {
                continue;
            }
            const float distSq = body.position.DistanceSquared(head);
            if (!next || distSq < bestDistSq ||
                (distSq == bestDistSq && body.enemyId < next->enemyId)) {
                next = body;
                bestDistSq = distSq;
            }
        }

        if (!next) {
            break;
        }

        currentDamage *= request.damageFalloff;
        hit(*next);
        head = next->position;
    }

    bus_.Publish(EffectTriggered{effectIds_.next(), ArcLightningEffect{result.points}});
    return result;
}

std::vector<NovaHit> DamageResolver::ResolveNova(const NovaRequest& request) {
    std::vector<NovaHit> hits;
    if (!(request.radius > 0.0f)) {
        return hits;
    }

    std::unordered_set<EnemyId> visited;
    for (const auto& body : physics_.IntersectSphere(request.center, request.radius)) {
        if (body.type != BodyType::Enemy || !body.enemyId.isValid() ||
            !visited.insert(body.enemyId).second) {
            continue;
        }
        hits.push_back(NovaHit{body.enemyId, 0, body.position.Distance(request.center),
                               body.position});
    }

    // The ring reaches nearer enemies first.
    std::sort(hits.begin(), hits.end(), [](const NovaHit& a, const NovaHit& b) {
        return a.distance != b.distance ? a.distance < b.distance : a.id < b.id;
    });

    const double falloff = std::clamp(static_cast<double>(request.falloff), 0.0, 1.0);
    for (auto& hit : hits) {
        const double scale = 1.0 - falloff * smoothstep(0.0f, request.radius, hit.distance);
        hit.damage = std::max<int32_t>(
            1, static_cast<int32_t>(std::lround(request.damage * scale)));
        logHit("Nova hit", hit.id, hit.damage);
        bus_.Publish(EnemyHit{hit.id, hit.damage, hit.position});
    }
    return hits;
}

} // namespace arc::game
