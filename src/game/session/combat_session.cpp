/// @file combat_session.cpp
/// @brief CombatSession wiring and input handling.

#include "arc/game/combat_session.hpp"

#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::event::EffectTriggered;
using arc::event::EnemyDied;
using arc::event::NovaEffect;
using arc::event::PlayerAddShield;
using arc::event::PlayerDied;
using arc::event::RockMonsterDeathEffect;
using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;
using arc::foundation::LogCategory;

using SessionResult = GameResult<std::unique_ptr<CombatSession>>;

SessionResult CombatSession::Create(GameSettings settings, WeaponCatalog catalog,
                                    CombatCollaborators collaborators) {
    if (collaborators.physics == nullptr) {
        return SessionResult::err(
            GameError(ErrorCode::MissingCollaborator, "no physics query provided", "physics"));
    }
    if (collaborators.aim == nullptr) {
        return SessionResult::err(
            GameError(ErrorCode::MissingCollaborator, "no aim source provided", "aim"));
    }
    if (catalog.Empty()) {
        return SessionResult::err(
            GameError(ErrorCode::EmptyInventory, "weapon catalog is empty"));
    }

    const std::string startingWeapon = settings.game.startingWeapon;
    auto session = std::make_unique<CombatSession>(Passkey{}, std::move(settings),
                                                   std::move(catalog), collaborators);

    if (!startingWeapon.empty()) {
        auto equipped = session->weapons_.Equip(startingWeapon);
        if (!equipped) {
            return SessionResult::err(equipped.error());
        }
    }

    ARC_LOG_INFO(LogCategory::Core,
                 "combat session ready with " + std::to_string(session->catalog_.Size()) +
                     " weapons");
    return SessionResult::ok(std::move(session));
}

CombatSession::CombatSession(Passkey, GameSettings settings, WeaponCatalog catalog,
                             const CombatCollaborators& collaborators)
    : settings_(std::move(settings)),
      catalog_(std::move(catalog)),
      collaborators_(collaborators),
      inventory_(catalog_),
      resolver_(bus_, *collaborators_.physics, effectIds_),
      enemies_(bus_, timers_, settings_.enemy),
      player_(bus_, settings_.player),
      impacts_(bus_, resolver_, catalog_, effectIds_),
      weapons_(bus_, timers_, inventory_, resolver_, *collaborators_.physics,
               *collaborators_.aim, effectIds_, settings_.game.aimRayDistance),
      spawner_(enemies_, timers_, settings_.game.spawnSeed) {
    subscriptions_.push_back(bus_.Subscribe<PlayerDied>(
        [this](const PlayerDied& e) { onPlayerDied(e); }));
    subscriptions_.push_back(bus_.Subscribe<EnemyDied>(
        [this](const EnemyDied& e) { onEnemyDied(e); }));

    spawner_.SetListener([this](EnemyId id, const Vector3& position) {
        if (collaborators_.bodies != nullptr) {
            collaborators_.bodies->RegisterEnemy(id, position, settings_.enemy.bodyRadius);
        }
    });
}

CombatSession::~CombatSession() {
    spawner_.Stop();
    for (auto id : subscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void CombatSession::Tick(Milliseconds delta) {
    timers_.Advance(delta);
    bus_.ProcessDeferred();
}

void CombatSession::Start() {
    if (player_.IsDead()) {
        return;
    }
    spawner_.Start();
}

void CombatSession::Restart() {
    spawner_.Stop();
    weapons_.ResetCycle();

    if (collaborators_.bodies != nullptr) {
        for (const auto& enemy : enemies_.Enemies()) {
            collaborators_.bodies->UnregisterEnemy(enemy.id);
        }
    }
    enemies_.Clear();
    player_.Reset();
    spawner_.Reseed(settings_.game.spawnSeed);

    ARC_LOG_INFO(LogCategory::Core, "session restarted");
    Start();
}

bool CombatSession::BeginCharge() {
    return !player_.IsDead() && weapons_.BeginCharge();
}

bool CombatSession::ReleaseTrigger() {
    return !player_.IsDead() && weapons_.ReleaseTrigger();
}

void CombatSession::CancelInput() {
    weapons_.ResetCycle();
}

GameResult<const WeaponSchema*> CombatSession::Equip(std::string_view weaponId) {
    if (player_.IsDead()) {
        return GameResult<const WeaponSchema*>::err(
            GameError(ErrorCode::PlayerDead, "cannot switch weapons while dead",
                      std::string(weaponId)));
    }
    return weapons_.Equip(weaponId);
}

bool CombatSession::CastSpell(GestureSpell spell) {
    if (player_.IsDead()) {
        return false;
    }

    switch (spell) {
        case GestureSpell::ProtectiveWard:
            bus_.Publish(PlayerAddShield{settings_.spells.wardShield});
            return true;
        case GestureSpell::FireNova: {
            bus_.Publish(EffectTriggered{effectIds_.next(), NovaEffect{playerPosition_}});
            const auto& spells = settings_.spells;
            const auto hits = resolver_.ResolveNova(
                NovaRequest{playerPosition_, spells.novaRadius, spells.novaDamage,
                            spells.novaFalloff});
            ARC_LOG_DEBUG(LogCategory::Combat,
                          "fire nova hit " + std::to_string(hits.size()) + " enemies");
            return true;
        }
    }
    return false;
}

void CombatSession::SetPlayerPosition(const Vector3& position) {
    playerPosition_ = position;
    spawner_.SetCenter(position);
}

bool CombatSession::OnProjectileImpact(const ProjectileImpact& impact) {
    return impacts_.OnImpact(impact);
}

bool CombatSession::OnEnemyContact(EnemyId id, float distance) {
    if (player_.IsDead()) {
        return false;
    }
    return enemies_.TryAttack(id, distance);
}

void CombatSession::onPlayerDied(const PlayerDied& event) {
    ARC_LOG_INFO(LogCategory::Core,
                 "game over, final score " + std::to_string(event.score));
    weapons_.ResetCycle();
    spawner_.Stop();
}

void CombatSession::onEnemyDied(const EnemyDied& event) {
    if (collaborators_.bodies != nullptr) {
        collaborators_.bodies->UnregisterEnemy(event.id);
    }
    bus_.Publish(EffectTriggered{effectIds_.next(), RockMonsterDeathEffect{event.position}});
}

} // namespace arc::game
