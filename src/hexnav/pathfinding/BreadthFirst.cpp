#include "hexnav/pathfinding/BreadthFirst.hpp"
#include "SearchPreconditions.hpp"

#include <algorithm>

namespace hexnav::pf {

PathResult BreadthFirstStrategy::FindPath(const HexCoord& start,
                                          const HexCoord& goal,
                                          const grid::TileIndex* index,
                                          const CancelToken* cancel)
{
    if (auto early = detail::CheckPreconditions(Name(), start, goal, index))
        return std::move(*early);

    std::lock_guard<std::mutex> lk(scratchMx_);

    frontier_.clear();
    cameFrom_.clear();

    frontier_.push_back(start);
    cameFrom_.emplace(start, start);

    std::size_t expanded = 0;

    while (!frontier_.empty())
    {
        if (cancel && cancel->is_cancelled())
            return PathResult::Failure(PathStatus::Cancelled, "search cancelled", expanded);

        const HexCoord current = frontier_.front();
        frontier_.pop_front();
        ++expanded;

        if (current == goal)
        {
            Path out;
            for (HexCoord c = goal; c != start; c = cameFrom_.at(c))
                out.points.push_back(c);
            out.points.push_back(start);
            std::reverse(out.points.begin(), out.points.end());
            return PathResult::Success(std::move(out), expanded);
        }

        index->WalkableNeighbors(current, neighbors_);
        for (const HexCoord& n : neighbors_)
        {
            if (cameFrom_.try_emplace(n, current).second)
                frontier_.push_back(n);
        }
    }

    HEXNAV_LOG_WARN("{}: no path found from {} to {}", Name(), start.ToString(), goal.ToString());
    return PathResult::Failure(PathStatus::NotFound, "no path", expanded);
}

} // namespace hexnav::pf
