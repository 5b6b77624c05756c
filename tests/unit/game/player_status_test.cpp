/// @file player_status_test.cpp
/// @brief Shield absorption, the death latch, shield policies and scoring.

#include <gtest/gtest.h>

#include <vector>

#include "arc/event/event_bus.hpp"
#include "arc/game/player_status.hpp"

using namespace arc::game;
using namespace arc::event;
using arc::foundation::EnemyId;

class PlayerStatusTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.Subscribe<PlayerDied>([this](const PlayerDied& e) { deaths_.push_back(e); });
    }

    static PlayerSettings settings(ShieldPolicy policy = ShieldPolicy::Refresh) {
        PlayerSettings s;
        s.maxHealth = 100;
        s.maxShield = 100;
        s.shieldPolicy = policy;
        return s;
    }

    EventBus bus_;
    std::vector<PlayerDied> deaths_;
};

// ===========================================================================
// Damage
// ===========================================================================

TEST_F(PlayerStatusTest, StartsAtFullHealthWithNoShield) {
    PlayerStatus player(bus_, settings());
    EXPECT_EQ(player.State().health, 100);
    EXPECT_EQ(player.State().maxHealth, 100);
    EXPECT_EQ(player.State().shield, 0);
    EXPECT_EQ(player.State().score, 0);
    EXPECT_FALSE(player.IsDead());
}

TEST_F(PlayerStatusTest, ShieldAbsorbsBeforeHealth) {
    PlayerStatus player(bus_, settings());
    player.AddShield(20);

    player.TakeDamage(30);

    EXPECT_EQ(player.State().shield, 0);
    EXPECT_EQ(player.State().health, 90);
    EXPECT_EQ(player.State().damageTaken, 30);
}

TEST_F(PlayerStatusTest, PartialShieldAbsorptionLeavesHealthUntouched) {
    PlayerStatus player(bus_, settings());
    player.AddShield(50);

    player.TakeDamage(30);

    EXPECT_EQ(player.State().shield, 20);
    EXPECT_EQ(player.State().health, 100);
}

TEST_F(PlayerStatusTest, DamageEventIsConsumedFromBus) {
    PlayerStatus player(bus_, settings());
    bus_.Publish(PlayerTookDamage{25});
    EXPECT_EQ(player.State().health, 75);
}

TEST_F(PlayerStatusTest, NonPositiveDamageIsIgnored) {
    PlayerStatus player(bus_, settings());
    player.TakeDamage(0);
    player.TakeDamage(-5);
    EXPECT_EQ(player.State().health, 100);
    EXPECT_EQ(player.State().damageTaken, 0);
}

// ===========================================================================
// Death latch
// ===========================================================================

TEST_F(PlayerStatusTest, LethalDamagePublishesPlayerDiedOnce) {
    PlayerStatus player(bus_, settings());
    player.IncreaseScore(300);

    player.TakeDamage(150);
    player.TakeDamage(10);
    bus_.Publish(PlayerTookDamage{10});

    EXPECT_TRUE(player.IsDead());
    EXPECT_EQ(player.State().health, 0);
    ASSERT_EQ(deaths_.size(), 1u);
    EXPECT_EQ(deaths_.front().score, 300);
}

TEST_F(PlayerStatusTest, DeadPlayerIgnoresShieldAndHeal) {
    PlayerStatus player(bus_, settings());
    player.TakeDamage(100);

    player.AddShield(50);
    player.Heal(50);

    EXPECT_EQ(player.State().shield, 0);
    EXPECT_EQ(player.State().health, 0);
}

TEST_F(PlayerStatusTest, ScoreStillAccruesWhileDead) {
    PlayerStatus player(bus_, settings());
    player.TakeDamage(100);

    bus_.Publish(IncreaseScore{100});

    EXPECT_EQ(player.State().score, 100);
}

// ===========================================================================
// Shield policies
// ===========================================================================

TEST_F(PlayerStatusTest, ReplacePolicyOverwritesShield) {
    PlayerStatus player(bus_, settings(ShieldPolicy::Replace));
    player.AddShield(75);
    player.AddShield(30);
    EXPECT_EQ(player.State().shield, 30);
}

TEST_F(PlayerStatusTest, RefreshPolicyKeepsLargerShield) {
    PlayerStatus player(bus_, settings(ShieldPolicy::Refresh));
    player.AddShield(75);
    player.AddShield(30);
    EXPECT_EQ(player.State().shield, 75);
    player.AddShield(90);
    EXPECT_EQ(player.State().shield, 90);
}

TEST_F(PlayerStatusTest, StackPolicyAddsUpToMaxShield) {
    PlayerStatus player(bus_, settings(ShieldPolicy::Stack));
    player.AddShield(60);
    player.AddShield(30);
    EXPECT_EQ(player.State().shield, 90);
    player.AddShield(30);
    EXPECT_EQ(player.State().shield, 100);
}

TEST_F(PlayerStatusTest, LargerGrantRaisesMaxShield) {
    PlayerStatus player(bus_, settings(ShieldPolicy::Replace));
    player.AddShield(150);
    EXPECT_EQ(player.State().maxShield, 150);
    EXPECT_EQ(player.State().shield, 150);
}

TEST_F(PlayerStatusTest, ShieldEventIsConsumedFromBus) {
    PlayerStatus player(bus_, settings());
    bus_.Publish(PlayerAddShield{40});
    EXPECT_EQ(player.State().shield, 40);
}

// ===========================================================================
// Heal, score, reset
// ===========================================================================

TEST_F(PlayerStatusTest, HealClampsToMaxHealth) {
    PlayerStatus player(bus_, settings());
    player.TakeDamage(30);
    player.Heal(10);
    EXPECT_EQ(player.State().health, 80);
    player.Heal(500);
    EXPECT_EQ(player.State().health, 100);
}

TEST_F(PlayerStatusTest, EnemyDiedCountsKill) {
    PlayerStatus player(bus_, settings());
    bus_.Publish(EnemyDied{EnemyId(1), Vector3{}});
    bus_.Publish(EnemyDied{EnemyId(2), Vector3{}});
    EXPECT_EQ(player.State().enemiesKilled, 2);
}

TEST_F(PlayerStatusTest, ResetRestoresVitalsAndKeepsHighestScore) {
    PlayerStatus player(bus_, settings());
    player.IncreaseScore(500);
    player.AddShield(40);
    player.TakeDamage(200);
    ASSERT_TRUE(player.IsDead());

    player.Reset();

    EXPECT_FALSE(player.IsDead());
    EXPECT_EQ(player.State().health, 100);
    EXPECT_EQ(player.State().shield, 0);
    EXPECT_EQ(player.State().score, 0);
    EXPECT_EQ(player.State().damageTaken, 0);
    EXPECT_EQ(player.State().highestScore, 500);
}

TEST_F(PlayerStatusTest, DeathLatchRearmsAfterReset) {
    PlayerStatus player(bus_, settings());
    player.TakeDamage(100);
    player.Reset();
    player.TakeDamage(100);
    EXPECT_EQ(deaths_.size(), 2u);
}

TEST_F(PlayerStatusTest, DestructorUnsubscribes) {
    const auto before = bus_.HandlerCount();
    {
        PlayerStatus player(bus_, settings());
        EXPECT_EQ(bus_.HandlerCount(), before + 4);
    }
    EXPECT_EQ(bus_.HandlerCount(), before);
}
