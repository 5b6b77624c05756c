#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for combat-core error handling.

#include "arc/core/result.hpp"
#include "arc/foundation/game_error.hpp"

namespace arc::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int> parseCharge(int ms) {
///       if (ms <= 0) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidWeaponStats, "charge must be positive"));
///       }
///       return GameResult<int>::ok(ms);
///   }
/// @endcode
template <typename T>
using GameResult = arc::Result<T, GameError>;

}  // namespace arc::foundation
