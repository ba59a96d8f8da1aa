#pragma once
// Shared entry checks for the built-in strategies. Private to src/.
#include "hexnav/core/Log.hpp"
#include "hexnav/grid/TileIndex.hpp"
#include "hexnav/pathfinding/Path.hpp"

#include <optional>
#include <string_view>

namespace hexnav::pf::detail {

// Order matters: missing index, start, goal, then the trivial start == goal case.
// Returns a finished result, or nullopt when the search has to run.
inline std::optional<PathResult> CheckPreconditions(std::string_view who,
                                                    const HexCoord& start,
                                                    const HexCoord& goal,
                                                    const grid::TileIndex* index)
{
    if (!index)
    {
        HEXNAV_LOG_ERROR("{}: tile index is null", who);
        return PathResult::Failure(PathStatus::InvalidConfig, "tile index is null");
    }

    if (!index->IsWalkable(start))
    {
        HEXNAV_LOG_WARN("{}: start position {} is not walkable", who, start.ToString());
        return PathResult::Failure(PathStatus::UnreachableStart, "start is not walkable");
    }

    if (!index->IsWalkable(goal))
    {
        HEXNAV_LOG_WARN("{}: goal position {} is not walkable", who, goal.ToString());
        return PathResult::Failure(PathStatus::UnreachableGoal, "goal is not walkable");
    }

    if (start == goal)
        return PathResult::Success(Path{ { start } }, 0);

    return std::nullopt;
}

} // namespace hexnav::pf::detail
