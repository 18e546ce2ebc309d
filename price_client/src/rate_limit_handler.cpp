#include "rate_limit_handler.hpp"
#include "util.hpp"
#include <charconv>
#include <spdlog/spdlog.h>

RateLimitDecision RateLimitHandler::handle(const RateLimitSignal& signal, const ClientConfig& config) const {
    RateLimitDecision decision;
    decision.retry_after_seconds = signal.retry_after_seconds;

    if (config.fail_fast_on_rate_limit) {
        decision.action = RateLimitDecision::Action::Fail;
        return decision;
    }

    decision.action = RateLimitDecision::Action::Wait;
    decision.wait = std::chrono::seconds(
        signal.retry_after_seconds ? *signal.retry_after_seconds : config.default_rate_limit_wait_seconds);
    return decision;
}

std::optional<int> parse_retry_after(const std::string& header_value) {
    std::string value = util::trim(header_value);
    if (value.empty()) {
        return std::nullopt;
    }

    int seconds = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc() || end != value.data() + value.size() || seconds <= 0) {
        spdlog::warn("Invalid Retry-After header: '{}', using configured default", header_value);
        return std::nullopt;
    }

    return seconds;
}
