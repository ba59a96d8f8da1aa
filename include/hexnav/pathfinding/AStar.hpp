#pragma once
#include "hexnav/pathfinding/IPathStrategy.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hexnav::pf {

// A* over the hex graph with unit step cost and hex distance as heuristic
// (admissible + consistent, so returned paths are optimal).
//
// Equal-f nodes are expanded in heap order; which of several equal-length paths comes
// back is unspecified.
class AStarStrategy final : public IPathStrategy {
public:
    AStarStrategy() = default;
    AStarStrategy(const AStarStrategy&) = delete;
    AStarStrategy& operator=(const AStarStrategy&) = delete;

    PathResult FindPath(const HexCoord& start,
                        const HexCoord& goal,
                        const grid::TileIndex* index,
                        const CancelToken* cancel = nullptr) override;

    [[nodiscard]] std::string_view Name() const noexcept override { return "A* Pathfinding"; }

private:
    struct Node {
        HexCoord coord{};
        const Node* parent = nullptr;
        int32_t g = 0; // cost from start
        int32_t h = 0; // estimate to goal
        [[nodiscard]] int32_t f() const noexcept { return g + h; }
    };

    struct OpenEntry {
        int32_t f;
        Node* node;
    };
    // Min-heap on f for std::push_heap / std::pop_heap.
    struct OpenCmp {
        bool operator()(const OpenEntry& a, const OpenEntry& b) const noexcept { return a.f > b.f; }
    };

    void PushOpen(Node& node);
    Path Reconstruct(const Node& goal) const;

    // Scratch reused across calls; guarded so one instance never runs two searches at once.
    std::mutex scratchMx_;
    std::vector<OpenEntry> open_;
    std::unordered_set<HexCoord, HexCoordHash> closed_;
    std::unordered_map<HexCoord, Node, HexCoordHash> nodes_;
    std::vector<HexCoord> neighbors_;
};

} // namespace hexnav::pf
