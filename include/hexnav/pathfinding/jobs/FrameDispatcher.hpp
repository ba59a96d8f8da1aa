#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace hexnav::pathjobs {

// The caller's execution context: work posted from any thread runs on whichever thread
// calls Drain(), normally once per frame from the host's update loop.
//
// Tasks posted while Drain() is running are deferred to the next Drain(), so one Drain()
// equals one scheduling tick.
class FrameDispatcher {
public:
    using Task = std::function<void()>;

    FrameDispatcher() = default;
    FrameDispatcher(const FrameDispatcher&) = delete;
    FrameDispatcher& operator=(const FrameDispatcher&) = delete;

    void Post(Task task);

    // Runs the tasks queued before the call. Returns how many ran.
    std::size_t Drain();

    [[nodiscard]] std::size_t Pending() const;

private:
    mutable std::mutex mx_;
    std::vector<Task> queue_;
};

} // namespace hexnav::pathjobs
