#pragma once
#include <atomic>
#include <initializer_list>
#include <memory>
#include <vector>

namespace hexnav::pf {

// Cooperative cancellation token (shared across threads).
//
// A linked token reports cancelled when its own flag or any of its links is set, so
// either party can cancel. Links are kept alive by the token and released with it.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Null links are skipped.
    static std::shared_ptr<CancelToken> Linked(std::initializer_list<std::shared_ptr<const CancelToken>> links) {
        auto token = std::make_shared<CancelToken>();
        for (const auto& l : links) {
            if (l) token->links_.push_back(l);
        }
        return token;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_relaxed)) return true;
        for (const auto& l : links_) {
            if (l->is_cancelled()) return true;
        }
        return false;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::vector<std::shared_ptr<const CancelToken>> links_;
};

} // namespace hexnav::pf
