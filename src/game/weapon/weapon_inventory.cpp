/// @file weapon_inventory.cpp
/// @brief WeaponInventory implementation.

#include "arc/game/weapon_inventory.hpp"

#include <string>

namespace arc::game {

using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;

WeaponInventory::WeaponInventory(const WeaponCatalog& catalog)
    : owned_(catalog.All()) {
    if (!owned_.empty()) {
        equipped_ = owned_.front();
    }
}

GameResult<const WeaponSchema*> WeaponInventory::Equip(std::string_view id) {
    for (const auto* schema : owned_) {
        if (schema->id == id) {
            equipped_ = schema;
            return GameResult<const WeaponSchema*>::ok(schema);
        }
    }
    return GameResult<const WeaponSchema*>::err(
        GameError(ErrorCode::WeaponNotFound, "weapon not in inventory: " + std::string(id),
                  std::string(id)));
}

bool WeaponInventory::Owns(std::string_view id) const {
    for (const auto* schema : owned_) {
        if (schema->id == id) {
            return true;
        }
    }
    return false;
}

} // namespace arc::game
