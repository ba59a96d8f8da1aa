#include "hexnav/pathfinding/jobs/FrameDispatcher.hpp"
#include "hexnav/core/Log.hpp"

#include <exception>
#include <utility>

namespace hexnav::pathjobs {

void FrameDispatcher::Post(Task task)
{
    if (!task)
        return;

    std::lock_guard<std::mutex> lk(mx_);
    queue_.push_back(std::move(task));
}

std::size_t FrameDispatcher::Drain()
{
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lk(mx_);
        batch.swap(queue_);
    }

    for (Task& task : batch)
    {
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            HEXNAV_LOG_ERROR("FrameDispatcher: task threw: {}", e.what());
        }
        catch (...)
        {
            HEXNAV_LOG_ERROR("FrameDispatcher: task threw an unknown exception");
        }
    }
    return batch.size();
}

std::size_t FrameDispatcher::Pending() const
{
    std::lock_guard<std::mutex> lk(mx_);
    return queue_.size();
}

} // namespace hexnav::pathjobs
