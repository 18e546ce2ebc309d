#pragma once

#include "error_classifier.hpp"
#include "errors.hpp"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

// Raised when a backoff or rate-limit wait is interrupted by cancellation
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message) : std::runtime_error(message) {}
};

// Suspends for the given delay. Returns false if the wait was cancelled.
using SleepFunction = std::function<bool(std::chrono::milliseconds)>;

// Runs an operation with bounded exponential backoff. Only FetchFailures whose
// kind is retryable are retried; anything else propagates on the first throw.
class RetryController {
public:
    explicit RetryController(SleepFunction sleep);

    // Longest single backoff wait
    static constexpr std::chrono::milliseconds max_backoff{std::chrono::minutes(5)};

    // backoff_base_seconds * 2^attempt_index, saturated at max_backoff
    static std::chrono::milliseconds backoff_delay(double backoff_base_seconds, int attempt_index);

    // Calls operation(attempt_index) up to max_retries + 1 times. The last
    // failure is rethrown once retries are exhausted.
    template <typename Operation>
    auto execute(Operation&& operation, int max_retries, double backoff_base_seconds)
        -> decltype(operation(0));

private:
    SleepFunction sleep_;
};

template <typename Operation>
auto RetryController::execute(Operation&& operation, int max_retries, double backoff_base_seconds)
    -> decltype(operation(0)) {
    for (int attempt = 0;; ++attempt) {
        try {
            return operation(attempt);
        } catch (const FetchFailure& failure) {
            if (!is_retryable(failure.kind())) {
                throw;
            }

            if (attempt >= max_retries) {
                spdlog::warn("Giving up after {} attempt(s): {}", attempt + 1, failure.what());
                throw;
            }

            auto delay = backoff_delay(backoff_base_seconds, attempt);
            spdlog::warn("Attempt {}/{} failed ({}): {}. Backing off for {} ms",
                         attempt + 1, max_retries + 1, to_string(failure.kind()), failure.what(), delay.count());

            if (!sleep_(delay)) {
                throw OperationCancelled("Backoff wait cancelled after attempt " + std::to_string(attempt + 1));
            }
        }
    }
}
