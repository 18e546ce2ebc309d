#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>

struct RateLimitDecision {
    enum class Action { Wait, Fail };

    Action action = Action::Fail;
    std::chrono::seconds wait{0};              // only meaningful for Wait
    std::optional<int> retry_after_seconds;    // what the remote asked for, if it said
};

class RateLimitHandler {
public:
    // Fail immediately in fail-fast mode, otherwise wait for the advertised
    // duration or the configured default. The caller allows one wait per fetch.
    RateLimitDecision handle(const RateLimitSignal& signal, const ClientConfig& config) const;
};

// Parse a Retry-After header given in delta-seconds. HTTP-date and garbage
// values yield nullopt so the configured default applies.
std::optional<int> parse_retry_after(const std::string& header_value);
