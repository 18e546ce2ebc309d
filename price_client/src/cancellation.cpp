#include "cancellation.hpp"
#include <algorithm>

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

void CancellationToken::request_cancel() noexcept {
    cancelled_.store(true);
}

bool CancellationToken::is_cancelled() const noexcept {
    return cancelled_.load();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!cancelled_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto tick = std::min<std::chrono::steady_clock::duration>(deadline - now, poll_interval);
        cv_.wait_for(lock, tick);
    }
    return false;
}
