#pragma once
#include "hexnav/grid/TileIndex.hpp"
#include "hexnav/pathfinding/CancelToken.hpp"
#include "hexnav/pathfinding/Path.hpp"

#include <string_view>

namespace hexnav::pf {

// Pluggable search algorithm. Implementations never throw for expected outcomes
// (unreachable endpoints, no path); those come back as a PathStatus.
//
// An instance keeps per-search scratch state and serializes calls on it, so parallel
// searches need one instance each.
class IPathStrategy {
public:
    virtual ~IPathStrategy() = default;

    virtual PathResult FindPath(const HexCoord& start,
                                const HexCoord& goal,
                                const grid::TileIndex* index,
                                const CancelToken* cancel = nullptr) = 0;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
};

} // namespace hexnav::pf
