#pragma once
#include "hexnav/grid/TileIndex.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace hexnav::grid {

// Text map: one line per row, '1' = land (blocked), '0' or anything else = water.
struct MapData {
    int32_t width  = 0;
    int32_t height = 0;
    std::vector<std::uint8_t> cells; // row-major, 1 = blocked

    [[nodiscard]] bool IsValid() const noexcept {
        return width > 0 && height > 0 &&
               cells.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    [[nodiscard]] bool IsBlocked(int32_t x, int32_t y) const {
        return cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] != 0;
    }
};

std::optional<MapData> ParseMapText(std::string_view text);
std::optional<MapData> LoadMapFile(const std::filesystem::path& path);

// Initialize(index, width, height, hexSize) and insert one tile per cell at
// HexCoord::FromOffset(x, y). Returns the number of tiles inserted.
std::size_t PopulateIndex(TileIndex& index, const MapData& map, float hexSize);

} // namespace hexnav::grid
