#pragma once

/// @file spatial_index.hpp
/// @brief Grid-based spatial partitioning index.
///
/// SpatialIndex divides the ground plane into uniform cells and provides
/// O(1) insert/update/remove and radius queries over physics bodies.
/// Cells are keyed by the X and Z coordinates (Y is "up"); radius queries
/// filter by full 3D distance.

#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "arc/foundation/types.hpp"
#include "arc/game/math_types.hpp"

namespace arc::game {

struct BodyHandleTag {};

/// Handle of a body registered with the physics world.
using BodyHandle = arc::foundation::StrongId<BodyHandleTag>;

/// Default cell edge in world units; about twice the enemy radius.
inline constexpr float kDefaultCellSize = 4.0f;

/// Grid cell coordinate.
struct CellCoord {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const CellCoord&) const = default;
};

} // namespace arc::game

/// Hash support for CellCoord.
template <>
struct std::hash<arc::game::CellCoord> {
    std::size_t operator()(const arc::game::CellCoord& c) const noexcept {
        auto h1 = std::hash<int32_t>{}(c.x);
        auto h2 = std::hash<int32_t>{}(c.y);
        return h1 ^ (h2 * 2654435761u);
    }
};

namespace arc::game {

/// Sparse uniform grid over body positions.
///
/// Only occupied cells are stored. Positions are kept alongside the cell
/// assignment so that QueryRadius can do exact filtering itself.
///
/// Thread safety: None.  External synchronization is required if
/// accessed from multiple threads.
class SpatialIndex {
public:
    /// Construct with a given cell size (world units per cell edge).
    explicit SpatialIndex(float cellSize = kDefaultCellSize);

    // -- Mutation -------------------------------------------------------

    /// Insert a body at the given world position.
    ///
    /// If the body is already tracked, this is equivalent to Update().
    void Insert(BodyHandle body, const Vector3& position);

    /// Update a body's position, moving it to a new cell if needed.
    /// If the body is not tracked, this is equivalent to Insert().
    void Update(BodyHandle body, const Vector3& newPosition);

    /// Remove a body. No-op if it is not tracked.
    void Remove(BodyHandle body);

    void Clear();

    // -- Queries --------------------------------------------------------

    /// Bodies whose stored position lies within @p radius of @p center.
    [[nodiscard]] std::vector<BodyHandle>
    QueryRadius(const Vector3& center, float radius) const;

    /// Bodies in the cell containing @p pos.
    [[nodiscard]] std::vector<BodyHandle> QueryPosition(const Vector3& pos) const;

    // -- Accessors ------------------------------------------------------

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    [[nodiscard]] float CellSize() const noexcept { return cellSize_; }

    [[nodiscard]] bool Contains(BodyHandle body) const;

    /// Get the cell coordinate for a world position.
    [[nodiscard]] CellCoord WorldToCell(const Vector3& pos) const noexcept {
        return {
            static_cast<int32_t>(std::floor(pos.x / cellSize_)),
            static_cast<int32_t>(std::floor(pos.z / cellSize_))
        };
    }

private:
    struct Entry {
        CellCoord cell;
        Vector3 position;
    };

    void removeFromCell(BodyHandle body, CellCoord cell);
    void addToCell(BodyHandle body, CellCoord cell);

    float cellSize_;

    /// cell coord -> bodies in that cell.
    std::unordered_map<CellCoord, std::vector<BodyHandle>> cells_;

    /// body -> current cell and exact position.
    std::unordered_map<BodyHandle, Entry> entries_;
};

} // namespace arc::game
