#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "arc/foundation/config_manager.hpp"
#include "arc/game/weapon_catalog.hpp"
#include "arc/game/weapon_inventory.hpp"

using namespace arc::game;
using arc::foundation::ConfigManager;
using arc::foundation::ErrorCode;
using namespace std::chrono_literals;

// ===========================================================================
// Built-in schemas
// ===========================================================================

TEST(WeaponSchemaTest, FiragleDefaults) {
    auto schema = FiragleSchema();
    EXPECT_EQ(schema.id, "firagle_staff");
    EXPECT_EQ(schema.Type(), WeaponType::Projectile);
    EXPECT_EQ(schema.stats.damage, 40);
    EXPECT_EQ(schema.stats.chargeDuration, 250ms);
    EXPECT_EQ(schema.stats.dischargePeakDuration, 150ms);
    EXPECT_EQ(schema.stats.decayDuration, 800ms);
    EXPECT_EQ(schema.effectColor, 0xff8c00u);
    ASSERT_NE(schema.stats.Projectile(), nullptr);
    EXPECT_EQ(schema.stats.Projectile()->splashDamage, 25);
    EXPECT_FLOAT_EQ(schema.stats.Projectile()->splashRadius, 3.0f);
    EXPECT_FLOAT_EQ(schema.stats.Projectile()->projectileSpeed, 15.0f);
}

TEST(WeaponSchemaTest, StaffOfStormsDefaults) {
    auto schema = StaffOfStormsSchema();
    EXPECT_EQ(schema.id, "staff_of_storms");
    EXPECT_EQ(schema.Type(), WeaponType::HitscanChain);
    EXPECT_EQ(schema.stats.damage, 35);
    EXPECT_EQ(schema.effectColor, 0x9bbff2u);
    ASSERT_NE(schema.stats.Chain(), nullptr);
    EXPECT_EQ(schema.stats.Chain()->maxChainTargets, 3);
    EXPECT_FLOAT_EQ(schema.stats.Chain()->chainRadius, 10.0f);
    EXPECT_FLOAT_EQ(schema.stats.Chain()->damageFalloff, 0.65f);
}

// ===========================================================================
// Validation
// ===========================================================================

TEST(ValidateWeaponStatsTest, BuiltInsAreValid) {
    EXPECT_TRUE(ValidateWeaponStats("firagle_staff", FiragleSchema().stats).hasValue());
    EXPECT_TRUE(ValidateWeaponStats("staff_of_storms", StaffOfStormsSchema().stats).hasValue());
}

TEST(ValidateWeaponStatsTest, RejectsNonPositiveDurations) {
    auto stats = FiragleSchema().stats;
    stats.chargeDuration = 0ms;
    auto result = ValidateWeaponStats("broken", stats);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidWeaponStats);
    EXPECT_EQ(result.error().subject(), "broken");
}

TEST(ValidateWeaponStatsTest, RejectsChainOutOfRange) {
    auto stats = StaffOfStormsSchema().stats;
    std::get<ChainStats>(stats.payload).damageFalloff = 1.5f;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());

    stats = StaffOfStormsSchema().stats;
    std::get<ChainStats>(stats.payload).maxChainTargets = 0;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());
}

TEST(ValidateWeaponStatsTest, RejectsNegativeSplash) {
    auto stats = FiragleSchema().stats;
    std::get<ProjectileStats>(stats.payload).splashRadius = -1.0f;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());
}

TEST(ValidateWeaponStatsTest, RejectsNaNRadiiAndSpeed) {
    constexpr float nan = std::numeric_limits<float>::quiet_NaN();

    auto stats = FiragleSchema().stats;
    std::get<ProjectileStats>(stats.payload).splashRadius = nan;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());

    stats = FiragleSchema().stats;
    std::get<ProjectileStats>(stats.payload).projectileSpeed = nan;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());

    stats = StaffOfStormsSchema().stats;
    std::get<ChainStats>(stats.payload).chainRadius = nan;
    EXPECT_TRUE(ValidateWeaponStats("x", stats).hasError());
}

// ===========================================================================
// WeaponCatalog
// ===========================================================================

TEST(WeaponCatalogTest, BuiltInHoldsBothStaves) {
    auto catalog = WeaponCatalog::BuiltIn();
    ASSERT_EQ(catalog.Size(), 2u);
    EXPECT_EQ(catalog.All()[0]->id, "firagle_staff");
    EXPECT_EQ(catalog.All()[1]->id, "staff_of_storms");
    EXPECT_NE(catalog.Find("staff_of_storms"), nullptr);
    EXPECT_EQ(catalog.Find("frost_staff"), nullptr);
}

TEST(WeaponCatalogTest, AddRejectsDuplicatesAndInvalidStats) {
    WeaponCatalog catalog;
    ASSERT_TRUE(catalog.Add(FiragleSchema()).hasValue());

    auto duplicate = catalog.Add(FiragleSchema());
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::AlreadyExists);

    auto bad = StaffOfStormsSchema();
    bad.stats.decayDuration = -1ms;
    auto invalid = catalog.Add(bad);
    ASSERT_TRUE(invalid.hasError());
    EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidWeaponStats);
    EXPECT_EQ(catalog.Size(), 1u);
}

TEST(WeaponCatalogTest, PointersSurviveMove) {
    auto catalog = WeaponCatalog::BuiltIn();
    const WeaponSchema* firagle = catalog.Find("firagle_staff");

    WeaponCatalog moved = std::move(catalog);
    EXPECT_EQ(moved.Find("firagle_staff"), firagle);
}

TEST(WeaponCatalogTest, FromConfigWithoutInventoryUsesBuiltIns) {
    ConfigManager config;
    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasValue());
    EXPECT_EQ(catalog.value().Size(), 2u);
}

TEST(WeaponCatalogTest, FromConfigOverridesBuiltInFields) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
inventory:
  weapons: [staff_of_storms]
weapons:
  staff_of_storms:
    damage: 50
    max_chain_targets: 5
    color: "#112233"
)").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasValue());
    ASSERT_EQ(catalog.value().Size(), 1u);

    const auto* storms = catalog.value().Find("staff_of_storms");
    ASSERT_NE(storms, nullptr);
    EXPECT_EQ(storms->stats.damage, 50);
    EXPECT_EQ(storms->stats.Chain()->maxChainTargets, 5);
    EXPECT_FLOAT_EQ(storms->stats.Chain()->damageFalloff, 0.65f);
    EXPECT_EQ(storms->effectColor, 0x112233u);
}

TEST(WeaponCatalogTest, FromConfigDefinesNewWeapon) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
inventory:
  weapons: [ember_rod]
weapons:
  ember_rod:
    type: projectile
    name: Ember Rod
    damage: 20
    charge_ms: 100
    discharge_peak_ms: 50
    decay_ms: 300
    splash_damage: 5
    splash_radius: 1.5
    projectile_speed: 30.0
    projectile_visual: ember
)").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasValue());
    const auto* rod = catalog.value().Find("ember_rod");
    ASSERT_NE(rod, nullptr);
    EXPECT_EQ(rod->name, "Ember Rod");
    EXPECT_EQ(rod->Type(), WeaponType::Projectile);
    EXPECT_EQ(rod->projectileVisual, "ember");
    EXPECT_EQ(rod->stats.chargeDuration, 100ms);
}

TEST(WeaponCatalogTest, FromConfigRejectsUnknownIdWithoutType) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("inventory:\n  weapons: [mystery]\n").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasError());
    EXPECT_EQ(catalog.error().code(), ErrorCode::InvalidWeaponType);
}

TEST(WeaponCatalogTest, FromConfigRejectsUnknownType) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "inventory:\n  weapons: [wand]\nweapons:\n  wand:\n    type: melee\n").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasError());
    EXPECT_EQ(catalog.error().code(), ErrorCode::InvalidWeaponType);
}

TEST(WeaponCatalogTest, FromConfigRejectsEmptyInventory) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("inventory:\n  weapons: []\n").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasError());
    EXPECT_EQ(catalog.error().code(), ErrorCode::EmptyInventory);
}

TEST(WeaponCatalogTest, FromConfigRejectsInvalidStats) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "inventory:\n  weapons: [firagle_staff]\n"
        "weapons:\n  firagle_staff:\n    projectile_speed: 0\n").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasError());
    EXPECT_EQ(catalog.error().code(), ErrorCode::InvalidWeaponStats);
}

TEST(WeaponCatalogTest, FromConfigRejectsBadColour) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "inventory:\n  weapons: [firagle_staff]\n"
        "weapons:\n  firagle_staff:\n    color: \"#zzzzzz\"\n").hasValue());

    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasError());
    EXPECT_EQ(catalog.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(WeaponCatalogTest, ShippedConfigMatchesBuiltIns) {
    ConfigManager config;
    ASSERT_TRUE(config.load(ARC_TEST_CONFIG_PATH).hasValue());
    auto catalog = WeaponCatalog::FromConfig(config);
    ASSERT_TRUE(catalog.hasValue());

    const auto* firagle = catalog.value().Find("firagle_staff");
    ASSERT_NE(firagle, nullptr);
    EXPECT_EQ(firagle->stats.damage, FiragleSchema().stats.damage);
    EXPECT_EQ(firagle->effectColor, FiragleSchema().effectColor);
}

// ===========================================================================
// WeaponInventory
// ===========================================================================

TEST(WeaponInventoryTest, EquipsFirstWeapon) {
    auto catalog = WeaponCatalog::BuiltIn();
    WeaponInventory inventory(catalog);

    ASSERT_NE(inventory.Equipped(), nullptr);
    EXPECT_EQ(inventory.Equipped()->id, "firagle_staff");
    EXPECT_EQ(inventory.Owned().size(), 2u);
    EXPECT_TRUE(inventory.Owns("staff_of_storms"));
}

TEST(WeaponInventoryTest, EquipSwitchesAndReportsUnknown) {
    auto catalog = WeaponCatalog::BuiltIn();
    WeaponInventory inventory(catalog);

    auto equipped = inventory.Equip("staff_of_storms");
    ASSERT_TRUE(equipped.hasValue());
    EXPECT_EQ(equipped.value()->id, "staff_of_storms");
    EXPECT_EQ(inventory.Equipped(), catalog.Find("staff_of_storms"));

    auto missing = inventory.Equip("frost_staff");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::WeaponNotFound);
    EXPECT_EQ(inventory.Equipped()->id, "staff_of_storms");
}

TEST(WeaponInventoryTest, EmptyCatalogHasNothingEquipped) {
    WeaponCatalog catalog;
    WeaponInventory inventory(catalog);
    EXPECT_EQ(inventory.Equipped(), nullptr);
    EXPECT_FALSE(inventory.Owns("firagle_staff"));
}
