#pragma once
// PathCoordinator - runs hex path searches off the frame thread.
//
// One active strategy, at most one in-flight search. A new FindPathAsync() cancels the
// previous one before it starts; results come back through the host's FrameDispatcher.
//
// Requires: taskflow (header-only) for the worker context.

#include "hexnav/grid/TileIndex.hpp"
#include "hexnav/pathfinding/CancelToken.hpp"
#include "hexnav/pathfinding/IPathStrategy.hpp"
#include "hexnav/pathfinding/Path.hpp"
#include "hexnav/pathfinding/jobs/FrameDispatcher.hpp"

#include <taskflow/taskflow.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hexnav::pathjobs {

class PathCoordinator {
public:
    struct Options {
        // false: search on the caller's thread, deliver on the next dispatcher tick.
        bool offload{true};
        // Taskflow executor workers. Values < 1 are treated as 1.
        unsigned worker_threads{1};
    };

    // Runs on the dispatcher's thread.
    using Callback = std::function<void(const pf::PathResult&)>;

    // `dispatcher` and `index` must outlive the coordinator. A null strategy selects A*.
    PathCoordinator(const grid::TileIndex* index,
                    FrameDispatcher& dispatcher,
                    Options options,
                    std::shared_ptr<pf::IPathStrategy> strategy = nullptr);
    PathCoordinator(const grid::TileIndex* index, FrameDispatcher& dispatcher)
        : PathCoordinator(index, dispatcher, Options{}) {}

    // Cancels the in-flight search and waits for the worker to let go of it.
    ~PathCoordinator();

    PathCoordinator(const PathCoordinator&) = delete;
    PathCoordinator& operator=(const PathCoordinator&) = delete;

    // Null is rejected. Takes effect on the next search.
    void SetStrategy(std::shared_ptr<pf::IPathStrategy> strategy);
    // Cancel searches before swapping or rebuilding the index.
    void SetTileIndex(const grid::TileIndex* index);

    // The future becomes ready on the dispatcher's thread, right before `onComplete` runs.
    // Cancellation (by `callerToken`, CancelCurrent() or a newer request) yields
    // PathStatus::Cancelled and no path.
    std::future<pf::PathResult> FindPathAsync(const HexCoord& start,
                                              const HexCoord& goal,
                                              std::shared_ptr<const pf::CancelToken> callerToken = nullptr,
                                              Callback onComplete = {});

    // Blocking, on the caller's thread.
    std::optional<pf::Path> FindPath(const HexCoord& start, const HexCoord& goal);
    pf::PathResult Search(const HexCoord& start, const HexCoord& goal);

    // Idempotent. A result the worker already produced but the dispatcher has not yet
    // delivered is reported as Cancelled too.
    void CancelCurrent();

    // True from FindPathAsync() until the worker finishes (or the search is cancelled).
    [[nodiscard]] bool HasSearchInFlight() const;
    [[nodiscard]] std::string StrategyName() const;
    [[nodiscard]] const Options& options() const noexcept { return opt_; }

private:
    static pf::PathResult RunSearch(pf::IPathStrategy& strategy,
                                    const HexCoord& start,
                                    const HexCoord& goal,
                                    const grid::TileIndex* index,
                                    const pf::CancelToken& token);

    void Deliver(std::shared_ptr<std::promise<pf::PathResult>> promise,
                 std::shared_ptr<const pf::CancelToken> composite,
                 pf::PathResult result,
                 Callback onComplete);

    void ReleaseSlot(std::uint64_t generation);

    // Clears the in-flight slot on every exit path of a search, exceptions included.
    struct SlotGuard {
        PathCoordinator* owner;
        std::uint64_t generation;
        ~SlotGuard() { owner->ReleaseSlot(generation); }
    };

    static unsigned resolve_worker_count(unsigned requested) { return requested > 0 ? requested : 1u; }

    const Options opt_;
    FrameDispatcher& dispatcher_;

    mutable std::mutex mx_;
    std::shared_ptr<pf::IPathStrategy> strategy_;
    const grid::TileIndex* index_{nullptr};
    // Internal token of the latest request. Kept after the worker finishes so a newer
    // request can still cancel a result that is waiting for delivery.
    std::shared_ptr<pf::CancelToken> latest_;
    bool inFlight_{false};
    std::uint64_t generation_{0};

    // Declared last: destroyed first, after the destructor has drained it.
    tf::Executor executor_;
};

} // namespace hexnav::pathjobs
