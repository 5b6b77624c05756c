/// @file spatial_index.cpp
/// @brief SpatialIndex query implementation.

#include "arc/game/spatial_index.hpp"

#include <algorithm>

namespace arc::game {

SpatialIndex::SpatialIndex(float cellSize) : cellSize_(cellSize) {
    if (cellSize_ <= 0.0f) {
        cellSize_ = kDefaultCellSize;
    }
}

void SpatialIndex::Insert(BodyHandle body, const Vector3& position) {
    if (Contains(body)) {
        Update(body, position);
        return;
    }
    auto cell = WorldToCell(position);
    addToCell(body, cell);
    entries_[body] = Entry{cell, position};
}

void SpatialIndex::Update(BodyHandle body, const Vector3& newPosition) {
    auto it = entries_.find(body);
    if (it == entries_.end()) {
        Insert(body, newPosition);
        return;
    }

    it->second.position = newPosition;
    auto newCell = WorldToCell(newPosition);
    if (it->second.cell == newCell) {
        return;
    }

    removeFromCell(body, it->second.cell);
    addToCell(body, newCell);
    it->second.cell = newCell;
}

void SpatialIndex::Remove(BodyHandle body) {
    auto it = entries_.find(body);
    if (it == entries_.end()) {
        return;
    }
    removeFromCell(body, it->second.cell);
    entries_.erase(it);
}

void SpatialIndex::Clear() {
    cells_.clear();
    entries_.clear();
}

std::vector<BodyHandle> SpatialIndex::QueryRadius(const Vector3& center, float radius) const {
    std::vector<BodyHandle> result;

    if (radius <= 0.0f) {
        return result;
    }

    // Range of cells overlapping the query circle on the ground plane.
    int32_t minCellX = static_cast<int32_t>(std::floor((center.x - radius) / cellSize_));
    int32_t maxCellX = static_cast<int32_t>(std::floor((center.x + radius) / cellSize_));
    int32_t minCellY = static_cast<int32_t>(std::floor((center.z - radius) / cellSize_));
    int32_t maxCellY = static_cast<int32_t>(std::floor((center.z + radius) / cellSize_));

    const float radiusSq = radius * radius;
    for (int32_t cx = minCellX; cx <= maxCellX; ++cx) {
        for (int32_t cy = minCellY; cy <= maxCellY; ++cy) {
            auto it = cells_.find(CellCoord{cx, cy});
            if (it == cells_.end()) {
                continue;
            }
            for (auto body : it->second) {
                const auto& entry = entries_.at(body);
                if (entry.position.DistanceSquared(center) <= radiusSq) {
                    result.push_back(body);
                }
            }
        }
    }

    // Hash-map iteration order is unspecified; keep results reproducible.
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<BodyHandle> SpatialIndex::QueryPosition(const Vector3& pos) const {
    auto it = cells_.find(WorldToCell(pos));
    if (it == cells_.end()) {
        return {};
    }
    return it->second;
}

bool SpatialIndex::Contains(BodyHandle body) const {
    return entries_.contains(body);
}

void SpatialIndex::removeFromCell(BodyHandle body, CellCoord cell) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        return;
    }
    auto& vec = it->second;
    std::erase(vec, body);
    if (vec.empty()) {
        cells_.erase(it);
    }
}

void SpatialIndex::addToCell(BodyHandle body, CellCoord cell) {
    cells_[cell].push_back(body);
}

} // namespace arc::game
