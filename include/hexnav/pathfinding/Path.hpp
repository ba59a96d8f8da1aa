#pragma once
#include "hexnav/hex/HexCoord.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hexnav::pf {

// Start to goal inclusive. A single point means start == goal.
struct Path {
    std::vector<HexCoord> points;

    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
    [[nodiscard]] std::size_t length() const noexcept { return points.size(); }
    // Edge count.
    [[nodiscard]] std::size_t steps() const noexcept { return points.empty() ? 0 : points.size() - 1; }
};

enum class PathStatus : std::uint8_t {
    Succeeded,
    NotFound,         // open set exhausted: a normal outcome
    UnreachableStart, // "you can't stand there"
    UnreachableGoal,  // "you can't get there"
    InvalidConfig,    // missing tile index or strategy
    Cancelled,        // superseded or cancelled by the caller; not an error
    Failed            // unexpected fault during the search
};

[[nodiscard]] const char* StatusName(PathStatus status) noexcept;

struct PathResult {
    PathStatus status{PathStatus::Failed};
    std::optional<Path> path;   // engaged iff status == Succeeded
    std::size_t expanded{0};    // nodes popped from the open set
    std::string error;          // developer-facing message on failure

    [[nodiscard]] bool succeeded() const noexcept { return status == PathStatus::Succeeded; }

    static PathResult Success(Path p, std::size_t expandedNodes) {
        PathResult r;
        r.status = PathStatus::Succeeded;
        r.path = std::move(p);
        r.expanded = expandedNodes;
        return r;
    }
    static PathResult Failure(PathStatus s, std::string message = {}, std::size_t expandedNodes = 0) {
        PathResult r;
        r.status = s;
        r.error = std::move(message);
        r.expanded = expandedNodes;
        return r;
    }
};

} // namespace hexnav::pf
