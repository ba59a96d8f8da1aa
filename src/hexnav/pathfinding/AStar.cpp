#include "hexnav/pathfinding/AStar.hpp"
#include "SearchPreconditions.hpp"

#include <algorithm>

namespace hexnav::pf {

void AStarStrategy::PushOpen(Node& node)
{
    open_.push_back({ node.f(), &node });
    std::push_heap(open_.begin(), open_.end(), OpenCmp{});
}

Path AStarStrategy::Reconstruct(const Node& goal) const
{
    Path out;
    for (const Node* cur = &goal; cur != nullptr; cur = cur->parent)
        out.points.push_back(cur->coord);
    std::reverse(out.points.begin(), out.points.end());
    return out;
}

PathResult AStarStrategy::FindPath(const HexCoord& start,
                                   const HexCoord& goal,
                                   const grid::TileIndex* index,
                                   const CancelToken* cancel)
{
    if (auto early = detail::CheckPreconditions(Name(), start, goal, index))
        return std::move(*early);

    std::lock_guard<std::mutex> lk(scratchMx_);

    open_.clear();
    closed_.clear();
    nodes_.clear();

    Node& startNode = nodes_[start];
    startNode.coord = start;
    startNode.g = 0;
    startNode.h = start.DistanceTo(goal);
    PushOpen(startNode);

    std::size_t expanded = 0;

    while (!open_.empty())
    {
        if (cancel && cancel->is_cancelled())
            return PathResult::Failure(PathStatus::Cancelled, "search cancelled", expanded);

        std::pop_heap(open_.begin(), open_.end(), OpenCmp{});
        Node* current = open_.back().node;
        open_.pop_back();

        if (closed_.count(current->coord) != 0)
            continue; // stale duplicate of an already finalized node

        ++expanded;

        if (current->coord == goal)
            return PathResult::Success(Reconstruct(*current), expanded);

        closed_.insert(current->coord);

        index->WalkableNeighbors(current->coord, neighbors_);
        for (const HexCoord& n : neighbors_)
        {
            if (closed_.count(n) != 0)
                continue;

            const int32_t tentative = current->g + 1;

            auto [it, inserted] = nodes_.try_emplace(n);
            Node& neighbor = it->second;
            if (inserted)
                neighbor.coord = n;

            // g == 0 doubles as "not visited this search". Only the start node can truly
            // have g == 0 and it is closed before any neighbour is relaxed.
            if (neighbor.g == 0 || tentative < neighbor.g)
            {
                neighbor.parent = current;
                neighbor.g = tentative;
                neighbor.h = n.DistanceTo(goal);
                PushOpen(neighbor);
            }
        }
    }

    HEXNAV_LOG_WARN("{}: no path found from {} to {}", Name(), start.ToString(), goal.ToString());
    return PathResult::Failure(PathStatus::NotFound, "no path", expanded);
}

} // namespace hexnav::pf
