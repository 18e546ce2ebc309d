#include "retry_controller.hpp"
#include <cmath>
#include <utility>

RetryController::RetryController(SleepFunction sleep)
    : sleep_(std::move(sleep)) {
}

std::chrono::milliseconds RetryController::backoff_delay(double backoff_base_seconds, int attempt_index) {
    if (attempt_index < 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_ms = backoff_base_seconds * std::pow(2.0, attempt_index) * 1000.0;
    if (!std::isfinite(delay_ms) || delay_ms >= static_cast<double>(max_backoff.count())) {
        return max_backoff;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(delay_ms)));
}
