#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ARC_VERSION_MAJOR 0
#define ARC_VERSION_MINOR 3
#define ARC_VERSION_PATCH 0
#define ARC_VERSION_STRING "0.3.0"

namespace arc {

/// Project version information at compile time.
struct Version {
    static constexpr int major = ARC_VERSION_MAJOR;
    static constexpr int minor = ARC_VERSION_MINOR;
    static constexpr int patch = ARC_VERSION_PATCH;
    static constexpr const char* string = ARC_VERSION_STRING;
};

} // namespace arc
