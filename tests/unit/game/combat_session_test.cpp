/// @file combat_session_test.cpp
/// @brief End-to-end wiring of a combat session: creation errors, kills,
///        player death, restart and spells.

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "arc/game/combat_session.hpp"
#include "arc/game/physics_world.hpp"

using namespace arc::game;
using namespace arc::event;
using namespace std::chrono_literals;
using arc::foundation::EnemyId;
using arc::foundation::ErrorCode;

namespace {

class FixedAim : public IAimSource {
public:
    AimFrame CurrentAim() const override { return frame; }

    AimFrame frame;
};

} // namespace

class CombatSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        aim_.frame.staffTip = Vector3{0.3f, 1.4f, -0.5f};
        aim_.frame.cameraOrigin = Vector3{0.0f, 1.6f, 0.0f};
        aim_.frame.direction = Vector3{0.0f, 0.0f, -1.0f};
    }

    CombatCollaborators collaborators() {
        return CombatCollaborators{&world_, &aim_, &world_};
    }

    void create(GameSettings settings = GameSettings{}) {
        auto result = CombatSession::Create(settings, WeaponCatalog::BuiltIn(), collaborators());
        ASSERT_TRUE(result.hasValue());
        session_ = std::move(result).value();

        auto& bus = session_->Bus();
        bus.Subscribe<WeaponFired>([this](const WeaponFired& e) { fired_.push_back(e); });
        bus.Subscribe<EffectTriggered>([this](const EffectTriggered& e) {
            effectTypes_.emplace_back(effectTypeName(e.effect));
        });
        bus.Subscribe<PlayerDied>([this](const PlayerDied&) { ++deaths_; });
    }

    void killPlayer() {
        auto id = session_->Spawner().SpawnOnce();
        ASSERT_TRUE(id.has_value());
        while (!session_->Player().IsDead()) {
            ASSERT_TRUE(session_->OnEnemyContact(*id, 1.0f));
            session_->Tick(session_->Settings().enemy.attackCooldown);
        }
    }

    PhysicsWorld world_;
    FixedAim aim_;
    std::unique_ptr<CombatSession> session_;
    std::vector<WeaponFired> fired_;
    std::vector<std::string> effectTypes_;
    int deaths_ = 0;
};

// ===========================================================================
// Creation
// ===========================================================================

TEST_F(CombatSessionTest, SessionsAreOnlyBuiltThroughCreate) {
    EXPECT_FALSE((std::is_constructible_v<CombatSession, GameSettings, WeaponCatalog,
                                          const CombatCollaborators&>));
    EXPECT_FALSE(std::is_default_constructible_v<CombatSession>);
    EXPECT_FALSE(std::is_copy_constructible_v<CombatSession>);

    create();
    EXPECT_NE(session_, nullptr);
}

TEST_F(CombatSessionTest, CreateRequiresPhysicsAndAim) {
    auto noPhysics = CombatSession::Create(GameSettings{}, WeaponCatalog::BuiltIn(),
                                           CombatCollaborators{nullptr, &aim_, nullptr});
    ASSERT_TRUE(noPhysics.hasError());
    EXPECT_EQ(noPhysics.error().code(), ErrorCode::MissingCollaborator);

    auto noAim = CombatSession::Create(GameSettings{}, WeaponCatalog::BuiltIn(),
                                       CombatCollaborators{&world_, nullptr, nullptr});
    ASSERT_TRUE(noAim.hasError());
    EXPECT_EQ(noAim.error().code(), ErrorCode::MissingCollaborator);
}

TEST_F(CombatSessionTest, CreateRejectsEmptyCatalog) {
    auto result = CombatSession::Create(GameSettings{}, WeaponCatalog{}, collaborators());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyInventory);
}

TEST_F(CombatSessionTest, CreateRejectsUnknownStartingWeapon) {
    GameSettings settings;
    settings.game.startingWeapon = "broom";

    auto result = CombatSession::Create(settings, WeaponCatalog::BuiltIn(), collaborators());

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::WeaponNotFound);
}

TEST_F(CombatSessionTest, StartingWeaponIsEquipped) {
    GameSettings settings;
    settings.game.startingWeapon = "staff_of_storms";
    create(settings);

    ASSERT_NE(session_->Weapons().Equipped(), nullptr);
    EXPECT_EQ(session_->Weapons().Equipped()->id, "staff_of_storms");
}

TEST_F(CombatSessionTest, ComponentsAreBuiltFromSettings) {
    GameSettings settings;
    settings.player.maxHealth = 250;
    settings.enemy.maxHealth = 40;
    create(settings);

    EXPECT_EQ(session_->Player().State().health, 250);
    EXPECT_EQ(session_->Enemies().Settings().maxHealth, 40);
}

// ===========================================================================
// Frame and input
// ===========================================================================

TEST_F(CombatSessionTest, ChargedReleaseFiresThroughSession) {
    create();

    ASSERT_TRUE(session_->BeginCharge());
    session_->Tick(250ms);
    ASSERT_TRUE(session_->ReleaseTrigger());

    ASSERT_EQ(fired_.size(), 1u);
    EXPECT_EQ(fired_[0].weaponId, "firagle_staff");
}

TEST_F(CombatSessionTest, TickFlushesDeferredEvents) {
    create();

    session_->Bus().PublishDeferred(PlayerTookDamage{15});
    EXPECT_EQ(session_->Player().State().health, 100);

    session_->Tick(0ms);
    EXPECT_EQ(session_->Player().State().health, 85);
}

TEST_F(CombatSessionTest, SpawnerRegistersBodiesOnInterval) {
    create();
    session_->SetPlayerPosition(Vector3{5.0f, 0.0f, 5.0f});
    session_->Start();

    session_->Tick(3999ms);
    EXPECT_EQ(session_->Enemies().Size(), 0u);
    session_->Tick(1ms);

    ASSERT_EQ(session_->Enemies().Size(), 1u);
    const auto enemy = session_->Enemies().Enemies().front();
    EXPECT_TRUE(world_.FindEnemyBody(enemy.id).has_value());
    EXPECT_FLOAT_EQ(enemy.initialPosition.y, session_->Settings().enemy.spawnHeight);
}

// ===========================================================================
// Kills
// ===========================================================================

TEST_F(CombatSessionTest, KillRemovesBodyAndAwardsScore) {
    create();
    auto id = session_->Spawner().SpawnOnce();
    ASSERT_TRUE(id.has_value());

    session_->Bus().Publish(EnemyHit{*id, 100, Vector3{}});

    EXPECT_EQ(session_->Enemies().Size(), 0u);
    EXPECT_FALSE(world_.FindEnemyBody(*id).has_value());
    EXPECT_EQ(session_->Player().State().score, 100);
    EXPECT_EQ(session_->Player().State().enemiesKilled, 1);
    EXPECT_EQ(effectTypes_, (std::vector<std::string>{"rock_monster_death"}));
}

// ===========================================================================
// Player death and restart
// ===========================================================================

TEST_F(CombatSessionTest, DeadPlayerInputIsIgnored) {
    GameSettings settings;
    settings.enemy.damage = 50;
    create(settings);
    session_->Start();

    killPlayer();

    EXPECT_EQ(deaths_, 1);
    EXPECT_FALSE(session_->Spawner().IsActive());
    EXPECT_FALSE(session_->BeginCharge());
    EXPECT_FALSE(session_->ReleaseTrigger());
    EXPECT_FALSE(session_->CastSpell(GestureSpell::ProtectiveWard));
    EXPECT_FALSE(session_->OnEnemyContact(session_->Enemies().Enemies().front().id, 0.5f));

    auto equipped = session_->Equip("staff_of_storms");
    ASSERT_TRUE(equipped.hasError());
    EXPECT_EQ(equipped.error().code(), ErrorCode::PlayerDead);
}

TEST_F(CombatSessionTest, DeathAbortsWeaponCycle) {
    GameSettings settings;
    settings.enemy.damage = 100;
    create(settings);

    ASSERT_TRUE(session_->BeginCharge());
    killPlayer();

    EXPECT_EQ(session_->Weapons().State(), AnimationState::Idle);
    session_->Tick(1000ms);
    EXPECT_TRUE(fired_.empty());
}

TEST_F(CombatSessionTest, RestartRevivesPlayerAndClearsArena) {
    GameSettings settings;
    settings.enemy.damage = 100;
    create(settings);
    session_->Bus().Publish(IncreaseScore{300});
    killPlayer();
    ASSERT_EQ(session_->Enemies().Size(), 1u);

    session_->Restart();

    EXPECT_FALSE(session_->Player().IsDead());
    EXPECT_EQ(session_->Player().State().health, 100);
    EXPECT_EQ(session_->Player().State().score, 0);
    EXPECT_EQ(session_->Player().State().highestScore, 300);
    EXPECT_EQ(session_->Enemies().Size(), 0u);
    EXPECT_EQ(world_.BodyCount(), 0u);
    EXPECT_TRUE(session_->Spawner().IsActive());
    EXPECT_TRUE(session_->BeginCharge());
}

// ===========================================================================
// Spells
// ===========================================================================

TEST_F(CombatSessionTest, ProtectiveWardGrantsShield) {
    create();

    EXPECT_TRUE(session_->CastSpell(GestureSpell::ProtectiveWard));

    EXPECT_EQ(session_->Player().State().shield, 75);
}

TEST_F(CombatSessionTest, FireNovaPublishesNovaAtPlayer) {
    create();
    Vector3 novaAt;
    session_->Bus().Subscribe<EffectTriggered>([&](const EffectTriggered& e) {
        if (const auto* nova = std::get_if<NovaEffect>(&e.effect)) {
            novaAt = nova->position;
        }
    });
    session_->SetPlayerPosition(Vector3{2.0f, 0.0f, -3.0f});

    EXPECT_TRUE(session_->CastSpell(GestureSpell::FireNova));

    EXPECT_EQ(effectTypes_, (std::vector<std::string>{"nova"}));
    EXPECT_EQ(novaAt, (Vector3{2.0f, 0.0f, -3.0f}));
}

TEST_F(CombatSessionTest, FireNovaDamagesNearbyEnemies) {
    create();
    session_->SetPlayerPosition(Vector3{2.0f, 0.0f, -3.0f});
    auto nearId = session_->Spawner().SpawnOnce();
    auto farId = session_->Spawner().SpawnOnce();
    ASSERT_TRUE(nearId.has_value());
    ASSERT_TRUE(farId.has_value());
    world_.AddEnemyBody(*nearId, Vector3{2.0f, 0.0f, -3.0f});
    world_.AddEnemyBody(*farId, Vector3{2.0f, 0.0f, -40.0f});

    EXPECT_TRUE(session_->CastSpell(GestureSpell::FireNova));

    ASSERT_NE(session_->Enemies().Find(*nearId), nullptr);
    EXPECT_EQ(session_->Enemies().Find(*nearId)->health, 50);
    ASSERT_NE(session_->Enemies().Find(*farId), nullptr);
    EXPECT_EQ(session_->Enemies().Find(*farId)->health, 100);
}

TEST_F(CombatSessionTest, FireNovaCanKill) {
    GameSettings settings;
    settings.spells.novaDamage = 150;
    create(settings);
    auto id = session_->Spawner().SpawnOnce();
    ASSERT_TRUE(id.has_value());
    world_.AddEnemyBody(*id, Vector3{1.0f, 0.0f, 0.0f});

    EXPECT_TRUE(session_->CastSpell(GestureSpell::FireNova));

    EXPECT_EQ(session_->Enemies().Size(), 0u);
    EXPECT_EQ(session_->Player().State().score, 100);
    EXPECT_EQ(effectTypes_, (std::vector<std::string>{"nova", "rock_monster_death"}));
}
