#include <gtest/gtest.h>

#include <set>
#include <string_view>

#include "arc/event/game_events.hpp"

using namespace arc::event;

TEST(GameEventsTest, ChannelNames) {
    EXPECT_EQ(channelName(GameEvent{WeaponFired{}}), "WEAPON_FIRED");
    EXPECT_EQ(channelName(GameEvent{WeaponSwitched{}}), "WEAPON_SWITCHED");
    EXPECT_EQ(channelName(GameEvent{PlayerTookDamage{}}), "PLAYER_TOOK_DAMAGE");
    EXPECT_EQ(channelName(GameEvent{PlayerAddShield{}}), "PLAYER_ADD_SHIELD");
    EXPECT_EQ(channelName(GameEvent{IncreaseScore{}}), "INCREASE_SCORE");
    EXPECT_EQ(channelName(GameEvent{PlayerDied{}}), "PLAYER_DIED");
    EXPECT_EQ(channelName(GameEvent{EnemyHit{}}), "ENEMY_HIT");
    EXPECT_EQ(channelName(GameEvent{EnemyDied{}}), "ENEMY_DIED");
    EXPECT_EQ(channelName(GameEvent{EffectTriggered{}}), "EFFECT_TRIGGERED");
}

TEST(GameEventsTest, ChannelNamesAreUnique) {
    std::set<std::string_view> names;
    names.insert(WeaponFired::kChannel);
    names.insert(WeaponSwitched::kChannel);
    names.insert(PlayerTookDamage::kChannel);
    names.insert(PlayerAddShield::kChannel);
    names.insert(IncreaseScore::kChannel);
    names.insert(PlayerDied::kChannel);
    names.insert(EnemyHit::kChannel);
    names.insert(EnemyDied::kChannel);
    names.insert(EffectTriggered::kChannel);
    EXPECT_EQ(names.size(), kEventChannelCount);
}

TEST(GameEventsTest, EventMembershipIsCompileTime) {
    static_assert(kIsGameEvent<EnemyHit>);
    static_assert(!kIsGameEvent<SplashDamageEffect>);
    static_assert(!kIsGameEvent<int>);
    static_assert(kEventIndex<WeaponFired> == 0);
    SUCCEED();
}

TEST(GameEventsTest, EffectTypeNames) {
    EXPECT_EQ(effectTypeName(SplashDamageEffect{}), "splash_damage");
    EXPECT_EQ(effectTypeName(ArcLightningEffect{}), "arc_lightning");
    EXPECT_EQ(effectTypeName(ExplosionEffect{}), "explosion");
    EXPECT_EQ(effectTypeName(NovaEffect{}), "nova");
    EXPECT_EQ(effectTypeName(DischargeEffect{}), "discharge");
    EXPECT_EQ(effectTypeName(RockMonsterDeathEffect{}), "rock_monster_death");
}

TEST(GameEventsTest, DischargeDefaultsToFiragleColour) {
    DischargeEffect effect;
    EXPECT_EQ(effect.colorRgb, 0xff8c00u);
}
