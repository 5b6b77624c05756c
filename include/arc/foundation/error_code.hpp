#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat core.

#include <cstdint>
#include <string_view>

namespace arc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    AlreadyExists = 0x0004,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Logger (0x0200 - 0x02FF)
    LoggerFlushFailed = 0x0201,

    // Weapon (0x0300 - 0x03FF)
    WeaponNotFound = 0x0300,
    InvalidWeaponStats = 0x0301,
    InvalidWeaponType = 0x0302,
    EmptyInventory = 0x0303,

    // Combat (0x0400 - 0x04FF)
    EnemyLimitReached = 0x0401,
    MissingCollaborator = 0x0402,
    PlayerDead = 0x0403,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Logger";
        case 0x0300: return "Weapon";
        case 0x0400: return "Combat";
        default: return "Unknown";
    }
}

} // namespace arc::foundation
