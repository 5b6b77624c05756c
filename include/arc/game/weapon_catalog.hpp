#pragma once

/// @file weapon_catalog.hpp
/// @brief Immutable set of weapon schemas loaded at startup.

#include <memory>
#include <string_view>
#include <vector>

#include "arc/foundation/game_result.hpp"
#include "arc/game/weapon_types.hpp"

namespace arc::foundation {
class ConfigManager;
} // namespace arc::foundation

namespace arc::game {

/// Schema of "The Firagle": splash fireball projectile.
[[nodiscard]] WeaponSchema FiragleSchema();

/// Schema of "Staff of Storms": chain lightning.
[[nodiscard]] WeaponSchema StaffOfStormsSchema();

/// Owns every weapon schema of a session.
///
/// Schemas are heap-allocated once and never mutated, so the pointers
/// handed out by Find() and All() stay valid for the catalog's lifetime
/// (including across moves of the catalog).
class WeaponCatalog {
public:
    WeaponCatalog() = default;

    WeaponCatalog(WeaponCatalog&&) noexcept = default;
    WeaponCatalog& operator=(WeaponCatalog&&) noexcept = default;
    WeaponCatalog(const WeaponCatalog&) = delete;
    WeaponCatalog& operator=(const WeaponCatalog&) = delete;

    /// Catalog holding the built-in weapons.
    [[nodiscard]] static WeaponCatalog BuiltIn();

    /// Build a catalog from the ids listed under "inventory.weapons" and
    /// the matching "weapons.<id>.*" sections.
    ///
    /// Fields missing from a section fall back to the built-in schema of
    /// the same id. Unknown ids must name their "type". Without an
    /// "inventory.weapons" key the built-in catalog is returned.
    [[nodiscard]] static arc::foundation::GameResult<WeaponCatalog>
    FromConfig(const arc::foundation::ConfigManager& config);

    /// Validate and add a schema.
    /// @return InvalidWeaponStats, AlreadyExists, or success.
    arc::foundation::GameResult<void> Add(WeaponSchema schema);

    /// Schema with the given id, or nullptr.
    [[nodiscard]] const WeaponSchema* Find(std::string_view id) const;

    /// Schemas in insertion order.
    [[nodiscard]] std::vector<const WeaponSchema*> All() const;

    [[nodiscard]] std::size_t Size() const noexcept { return schemas_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return schemas_.empty(); }

private:
    std::vector<std::unique_ptr<const WeaponSchema>> schemas_;
};

} // namespace arc::game
