#pragma once
#include "hexnav/pathfinding/IPathStrategy.hpp"

#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace hexnav::pf {

// Uninformed FIFO search. On a unit-cost grid it finds paths of the same length as A*,
// at the price of expanding every tile closer than the goal.
class BreadthFirstStrategy final : public IPathStrategy {
public:
    BreadthFirstStrategy() = default;
    BreadthFirstStrategy(const BreadthFirstStrategy&) = delete;
    BreadthFirstStrategy& operator=(const BreadthFirstStrategy&) = delete;

    PathResult FindPath(const HexCoord& start,
                        const HexCoord& goal,
                        const grid::TileIndex* index,
                        const CancelToken* cancel = nullptr) override;

    [[nodiscard]] std::string_view Name() const noexcept override { return "Breadth-First Search"; }

private:
    std::mutex scratchMx_;
    std::deque<HexCoord> frontier_;
    std::unordered_map<HexCoord, HexCoord, HexCoordHash> cameFrom_;
    std::vector<HexCoord> neighbors_;
};

} // namespace hexnav::pf
