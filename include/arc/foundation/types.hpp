#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the combat core.

#include <cstdint>
#include <functional>

namespace arc::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., EnemyId and
/// ProjectileId) at compile time while keeping the same representation.
/// Zero is reserved as the invalid value.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EnemyIdTag {};
struct ProjectileIdTag {};
struct EffectIdTag {};

/// Identifier of a live enemy; never reused within a session.
using EnemyId = StrongId<EnemyIdTag>;

/// Identifier of a fired projectile.
using ProjectileId = StrongId<ProjectileIdTag>;

/// Identifier of a triggered visual effect.
using EffectId = StrongId<EffectIdTag>;

/// Monotonic generator for a StrongId type. Never hands out zero.
template <typename Id>
class IdGenerator {
public:
    [[nodiscard]] Id next() noexcept { return Id(++last_); }

private:
    uint64_t last_ = 0;
};

} // namespace arc::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<arc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const arc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
