#pragma once
#include "hexnav/grid/HexTile.hpp"
#include "hexnav/hex/HexCoord.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace hexnav::grid {

// Owns the tiles of the loaded map, keyed by axial coordinate.
//
// Read-only while a search is running: callers must cancel pending searches before
// Initialize() / Clear() / Insert() on an index a coordinator is using.
class TileIndex {
public:
    TileIndex() = default;

    static constexpr float kDefaultHexSize = 1.0f;

    // Resets storage. Tiles are keyed by axial coordinate; offset-to-axial conversion of
    // (width, height) cells is the caller's job. A hexSize <= 0 (or NaN) is replaced by
    // kDefaultHexSize.
    void Initialize(int32_t width, int32_t height, float hexSize);

    // Replaces (and logs) any tile already stored at coord. tile.coord is overwritten with coord.
    void Insert(const HexCoord& coord, HexTile tile);

    void Clear();

    [[nodiscard]] const HexTile* GetTile(const HexCoord& coord) const;
    [[nodiscard]] bool HasTile(const HexCoord& coord) const { return tiles_.find(coord) != tiles_.end(); }

    // Unknown coordinates are not walkable.
    [[nodiscard]] bool IsWalkable(const HexCoord& coord) const;

    [[nodiscard]] std::vector<HexCoord> WalkableNeighbors(const HexCoord& coord) const;
    // Same as above; clears `out` and reuses its storage.
    void WalkableNeighbors(const HexCoord& coord, std::vector<HexCoord>& out) const;

    [[nodiscard]] std::vector<HexTile> TilesInRadius(const HexCoord& center, int32_t radius) const;
    [[nodiscard]] std::vector<HexTile> Tiles() const;

    [[nodiscard]] HexCoord WorldToHex(const WorldPos& pos) const noexcept { return HexCoord::FromWorld(pos, hexSize_); }
    [[nodiscard]] WorldPos HexToWorld(const HexCoord& coord) const noexcept { return coord.ToWorld(hexSize_); }

    [[nodiscard]] int32_t Width()  const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }
    [[nodiscard]] float   HexSize() const noexcept { return hexSize_; }
    [[nodiscard]] std::size_t TileCount() const noexcept { return tiles_.size(); }

private:
    int32_t width_  = 0;
    int32_t height_ = 0;
    float   hexSize_ = kDefaultHexSize;
    std::unordered_map<HexCoord, HexTile, HexCoordHash> tiles_;
};

} // namespace hexnav::grid
