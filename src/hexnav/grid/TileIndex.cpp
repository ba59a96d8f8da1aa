#include "hexnav/grid/TileIndex.hpp"
#include "hexnav/core/Log.hpp"

#include <algorithm>

namespace hexnav::grid {

void TileIndex::Initialize(int32_t width, int32_t height, float hexSize)
{
    width_ = width;
    height_ = height;
    if (hexSize > 0.0f)
    {
        hexSize_ = hexSize;
    }
    else
    {
        HEXNAV_LOG_WARN("TileIndex: invalid hex size {}, using {}", hexSize, kDefaultHexSize);
        hexSize_ = kDefaultHexSize;
    }
    tiles_.clear();
    if (width > 0 && height > 0)
        tiles_.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
}

void TileIndex::Insert(const HexCoord& coord, HexTile tile)
{
    tile.coord = coord;
    auto [it, inserted] = tiles_.try_emplace(coord, tile);
    if (!inserted)
    {
        HEXNAV_LOG_WARN("TileIndex: tile at {} already exists. Replacing.", coord.ToString());
        it->second = tile;
    }
}

void TileIndex::Clear()
{
    tiles_.clear();
}

const HexTile* TileIndex::GetTile(const HexCoord& coord) const
{
    auto it = tiles_.find(coord);
    return it != tiles_.end() ? &it->second : nullptr;
}

bool TileIndex::IsWalkable(const HexCoord& coord) const
{
    auto it = tiles_.find(coord);
    return it != tiles_.end() && it->second.IsWalkable();
}

std::vector<HexCoord> TileIndex::WalkableNeighbors(const HexCoord& coord) const
{
    std::vector<HexCoord> out;
    out.reserve(HexCoord::kDirectionCount);
    WalkableNeighbors(coord, out);
    return out;
}

void TileIndex::WalkableNeighbors(const HexCoord& coord, std::vector<HexCoord>& out) const
{
    out.clear();
    for (const HexCoord& n : coord.Neighbors())
    {
        if (IsWalkable(n))
            out.push_back(n);
    }
}

std::vector<HexTile> TileIndex::TilesInRadius(const HexCoord& center, int32_t radius) const
{
    std::vector<HexTile> result;
    for (int32_t dq = -radius; dq <= radius; ++dq)
    {
        const int32_t rMin = std::max(-radius, -dq - radius);
        const int32_t rMax = std::min(radius, -dq + radius);
        for (int32_t dr = rMin; dr <= rMax; ++dr)
        {
            if (const HexTile* tile = GetTile({ center.q() + dq, center.r() + dr }))
                result.push_back(*tile);
        }
    }
    return result;
}

std::vector<HexTile> TileIndex::Tiles() const
{
    std::vector<HexTile> out;
    out.reserve(tiles_.size());
    for (const auto& [coord, tile] : tiles_)
        out.push_back(tile);
    return out;
}

} // namespace hexnav::grid
