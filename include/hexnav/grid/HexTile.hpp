#pragma once
#include "hexnav/hex/HexCoord.hpp"

#include <cstdint>

namespace hexnav::grid {

enum class TileKind : std::uint8_t {
    Traversable, // open water: boats may enter
    Blocked,     // land
};

struct HexTile {
    HexCoord coord{};
    TileKind kind = TileKind::Traversable;

    [[nodiscard]] constexpr bool IsWalkable() const noexcept { return kind == TileKind::Traversable; }
    constexpr bool operator==(const HexTile&) const = default;
};

} // namespace hexnav::grid
