#pragma once

/// @file weapon_inventory.hpp
/// @brief Weapons the player owns and the one currently equipped.

#include <string_view>
#include <vector>

#include "arc/foundation/game_result.hpp"
#include "arc/game/weapon_catalog.hpp"

namespace arc::game {

/// Non-owning view over catalog schemas plus the equipped pointer.
///
/// The catalog must outlive the inventory. Equipping never copies or
/// mutates a schema; it only swaps which schema is current.
class WeaponInventory {
public:
    /// Own every weapon in @p catalog and equip the first one.
    explicit WeaponInventory(const WeaponCatalog& catalog);

    /// Equip the weapon with the given id.
    /// @return The newly equipped schema, or WeaponNotFound.
    arc::foundation::GameResult<const WeaponSchema*> Equip(std::string_view id);

    /// Currently equipped weapon, or nullptr when the inventory is empty.
    [[nodiscard]] const WeaponSchema* Equipped() const noexcept { return equipped_; }

    [[nodiscard]] const std::vector<const WeaponSchema*>& Owned() const noexcept {
        return owned_;
    }

    [[nodiscard]] bool Owns(std::string_view id) const;

private:
    std::vector<const WeaponSchema*> owned_;
    const WeaponSchema* equipped_ = nullptr;
};

} // namespace arc::game
