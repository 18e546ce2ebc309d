#include "types.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Incomplete: return "incomplete";
        case ErrorKind::DataIntegrity: return "data_integrity";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::InvalidInput: return "invalid_input";
    }
    return "unknown";
}

PriceRecord::PriceRecord(std::string symbol, double price, std::chrono::system_clock::time_point observed_at)
    : symbol_(std::move(symbol)), price_(price), observed_at_(observed_at) {
}

PriceRecord PriceRecord::make(const std::string& symbol, double price,
                              std::chrono::system_clock::time_point observed_at) {
    if (symbol.empty()) {
        throw std::invalid_argument("Price record requires a symbol");
    }
    if (!std::isfinite(price) || price <= 0.0) {
        throw std::invalid_argument(
            fmt::format("Invalid price value for {}: {} (must be positive and finite)", symbol, price));
    }
    return PriceRecord(symbol, price, observed_at);
}

void ClientConfig::validate() const {
    if (max_retries < 0) {
        throw std::invalid_argument(fmt::format("max_retries must be >= 0, got {}", max_retries));
    }
    if (!std::isfinite(backoff_base_seconds) || backoff_base_seconds <= 0.0) {
        throw std::invalid_argument(
            fmt::format("backoff_base_seconds must be > 0, got {}", backoff_base_seconds));
    }
    if (default_rate_limit_wait_seconds < 0) {
        throw std::invalid_argument(
            fmt::format("default_rate_limit_wait_seconds must be >= 0, got {}", default_rate_limit_wait_seconds));
    }
}
