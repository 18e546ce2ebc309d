#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Lets a caller abandon a fetch that is waiting on backoff or a rate limit.
class CancellationToken {
public:
    // Longest a waiter can go without re-checking the flag
    static constexpr std::chrono::milliseconds poll_interval{std::chrono::milliseconds(50)};

    // Sets the flag and wakes waiters immediately
    void cancel();

    // Sets the flag only. Lock-free, so it is safe to call from a signal
    // handler; waiters notice within poll_interval.
    void request_cancel() noexcept;

    bool is_cancelled() const noexcept;

    // Block for up to `duration`. Returns false if cancelled before it elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    static_assert(std::atomic<bool>::is_always_lock_free, "cancellation flag must be lock-free");

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
