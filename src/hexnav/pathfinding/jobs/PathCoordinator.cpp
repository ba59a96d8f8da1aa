#include "hexnav/pathfinding/jobs/PathCoordinator.hpp"
#include "hexnav/core/Log.hpp"
#include "hexnav/pathfinding/AStar.hpp"

#include <exception>
#include <utility>

namespace hexnav::pathjobs {

PathCoordinator::PathCoordinator(const grid::TileIndex* index,
                                 FrameDispatcher& dispatcher,
                                 Options options,
                                 std::shared_ptr<pf::IPathStrategy> strategy)
    : opt_(options)
    , dispatcher_(dispatcher)
    , strategy_(strategy ? std::move(strategy) : std::make_shared<pf::AStarStrategy>())
    , index_(index)
    , executor_(resolve_worker_count(options.worker_threads))
{
    HEXNAV_LOG_DEBUG("PathCoordinator: {} worker(s), offload={}, strategy={}",
                     executor_.num_workers(), opt_.offload, strategy_->Name());
}

PathCoordinator::~PathCoordinator()
{
    CancelCurrent();
    // Tasks still queued or running hold `this`; let them finish before members go away.
    executor_.wait_for_all();
}

void PathCoordinator::SetStrategy(std::shared_ptr<pf::IPathStrategy> strategy)
{
    if (!strategy)
    {
        HEXNAV_LOG_ERROR("PathCoordinator: cannot set null strategy");
        return;
    }

    std::lock_guard<std::mutex> lk(mx_);
    strategy_ = std::move(strategy);
    HEXNAV_LOG_INFO("PathCoordinator: strategy set to {}", strategy_->Name());
}

void PathCoordinator::SetTileIndex(const grid::TileIndex* index)
{
    std::lock_guard<std::mutex> lk(mx_);
    index_ = index;
}

std::future<pf::PathResult> PathCoordinator::FindPathAsync(const HexCoord& start,
                                                           const HexCoord& goal,
                                                           std::shared_ptr<const pf::CancelToken> callerToken,
                                                           Callback onComplete)
{
    auto promise = std::make_shared<std::promise<pf::PathResult>>();
    std::future<pf::PathResult> future = promise->get_future();

    std::shared_ptr<pf::IPathStrategy> strategy;
    const grid::TileIndex* index = nullptr;
    std::shared_ptr<pf::CancelToken> internal;
    std::uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lk(mx_);

        // At most one search in flight: supersede the previous request first.
        if (latest_)
        {
            latest_->cancel();
            latest_.reset();
        }
        inFlight_ = false;

        strategy = strategy_;
        index = index_;

        if (strategy && index)
        {
            internal = std::make_shared<pf::CancelToken>();
            latest_ = internal;
            inFlight_ = true;
            generation = ++generation_;
        }
    }

    if (!strategy || !index)
    {
        HEXNAV_LOG_ERROR("PathCoordinator: {}", !strategy ? "no pathfinding strategy set" : "tile index is null");
        Deliver(std::move(promise), nullptr,
                pf::PathResult::Failure(pf::PathStatus::InvalidConfig, "missing strategy or tile index"),
                std::move(onComplete));
        return future;
    }

    std::shared_ptr<const pf::CancelToken> composite = pf::CancelToken::Linked({ internal, std::move(callerToken) });

    if (!opt_.offload)
    {
        pf::PathResult result;
        {
            SlotGuard guard{ this, generation };
            result = RunSearch(*strategy, start, goal, index, *composite);
        }
        // Delivery on the next Drain() stands in for the one-tick yield.
        Deliver(std::move(promise), std::move(composite), std::move(result), std::move(onComplete));
        return future;
    }

    executor_.silent_async(
        [this, strategy = std::move(strategy), index, start, goal, generation,
         composite = std::move(composite), promise = std::move(promise),
         onComplete = std::move(onComplete)]() mutable
        {
            pf::PathResult result;
            {
                SlotGuard guard{ this, generation };
                result = RunSearch(*strategy, start, goal, index, *composite);
            }
            Deliver(std::move(promise), std::move(composite), std::move(result), std::move(onComplete));
        });

    return future;
}

std::optional<pf::Path> PathCoordinator::FindPath(const HexCoord& start, const HexCoord& goal)
{
    return Search(start, goal).path;
}

pf::PathResult PathCoordinator::Search(const HexCoord& start, const HexCoord& goal)
{
    std::shared_ptr<pf::IPathStrategy> strategy;
    const grid::TileIndex* index = nullptr;
    {
        std::lock_guard<std::mutex> lk(mx_);
        strategy = strategy_;
        index = index_;
    }

    if (!strategy || !index)
    {
        HEXNAV_LOG_ERROR("PathCoordinator: cannot find path - missing references");
        return pf::PathResult::Failure(pf::PathStatus::InvalidConfig, "missing strategy or tile index");
    }

    pf::CancelToken never;
    return RunSearch(*strategy, start, goal, index, never);
}

void PathCoordinator::CancelCurrent()
{
    std::lock_guard<std::mutex> lk(mx_);
    if (latest_)
    {
        latest_->cancel();
        latest_.reset();
    }
    inFlight_ = false;
}

bool PathCoordinator::HasSearchInFlight() const
{
    std::lock_guard<std::mutex> lk(mx_);
    return inFlight_;
}

std::string PathCoordinator::StrategyName() const
{
    std::lock_guard<std::mutex> lk(mx_);
    return strategy_ ? std::string(strategy_->Name()) : std::string{};
}

pf::PathResult PathCoordinator::RunSearch(pf::IPathStrategy& strategy,
                                          const HexCoord& start,
                                          const HexCoord& goal,
                                          const grid::TileIndex* index,
                                          const pf::CancelToken& token)
{
    if (token.is_cancelled())
        return pf::PathResult::Failure(pf::PathStatus::Cancelled, "cancelled before start");

    try
    {
        return strategy.FindPath(start, goal, index, &token);
    }
    catch (const std::exception& e)
    {
        if (token.is_cancelled())
            return pf::PathResult::Failure(pf::PathStatus::Cancelled, "cancelled");

        HEXNAV_LOG_ERROR("PathCoordinator: error during pathfinding {} -> {} with {}: {}",
                         start.ToString(), goal.ToString(), strategy.Name(), e.what());
        return pf::PathResult::Failure(pf::PathStatus::Failed, e.what());
    }
    catch (...)
    {
        if (token.is_cancelled())
            return pf::PathResult::Failure(pf::PathStatus::Cancelled, "cancelled");

        HEXNAV_LOG_ERROR("PathCoordinator: unknown exception during pathfinding {} -> {} with {}",
                         start.ToString(), goal.ToString(), strategy.Name());
        return pf::PathResult::Failure(pf::PathStatus::Failed, "unknown exception");
    }
}

void PathCoordinator::Deliver(std::shared_ptr<std::promise<pf::PathResult>> promise,
                              std::shared_ptr<const pf::CancelToken> composite,
                              pf::PathResult result,
                              Callback onComplete)
{
    // The posted task must not touch `this`: it may run after the coordinator is gone.
    dispatcher_.Post(
        [promise = std::move(promise), composite = std::move(composite),
         result = std::move(result), onComplete = std::move(onComplete)]() mutable
        {
            // A stale result must never look like the answer to a newer request.
            if (composite && composite->is_cancelled() && result.status != pf::PathStatus::Cancelled)
                result = pf::PathResult::Failure(pf::PathStatus::Cancelled, "superseded", result.expanded);

            if (result.succeeded())
                HEXNAV_LOG_DEBUG("PathCoordinator: path found with {} waypoints", result.path->length());

            composite.reset();
            promise->set_value(result);
            if (onComplete)
                onComplete(result);
        });
}

void PathCoordinator::ReleaseSlot(std::uint64_t generation)
{
    std::lock_guard<std::mutex> lk(mx_);
    if (generation_ == generation)
        inFlight_ = false;
}

} // namespace hexnav::pathjobs
