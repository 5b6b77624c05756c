#pragma once

/// @file math_types.hpp
/// @brief Lightweight 3D vector type for the combat layer.
///
/// The physics and rendering collaborators own their own math; this type
/// only carries positions, directions and velocities across the core's
/// boundaries.

#include <cmath>

namespace arc::game {

/// Three-component floating-point vector (Y is up).
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Squared distance to @p other; used for nearest-target selection.
    [[nodiscard]] constexpr float DistanceSquared(const Vector3& other) const noexcept {
        return (*this - other).LengthSquared();
    }

    [[nodiscard]] float Distance(const Vector3& other) const noexcept {
        return std::sqrt(DistanceSquared(other));
    }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr bool operator==(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

}  // namespace arc::game
