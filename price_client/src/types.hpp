#pragma once
#include <string>
#include <chrono>
#include <optional>

// Classification of a single failed attempt. Decides retry and cache fallback.
enum class ErrorKind {
    Transient,      // network, timeout, 5xx
    Incomplete,     // missing or null price field
    DataIntegrity,  // payload itself is wrong, never masked
    RateLimited,    // remote asked us to back off
    InvalidInput    // rejected before any network call
};

const char* to_string(ErrorKind kind);

// A validated price for one symbol. Only constructible with a positive, finite price.
class PriceRecord {
public:
    static PriceRecord make(const std::string& symbol, double price,
                            std::chrono::system_clock::time_point observed_at = std::chrono::system_clock::now());

    const std::string& symbol() const { return symbol_; }
    double price() const { return price_; }
    std::chrono::system_clock::time_point observed_at() const { return observed_at_; }

private:
    PriceRecord(std::string symbol, double price, std::chrono::system_clock::time_point observed_at);

    std::string symbol_;
    double price_;
    std::chrono::system_clock::time_point observed_at_;
};

// Backpressure signal attached to a rate-limited response
struct RateLimitSignal {
    std::optional<int> retry_after_seconds;
};

// Raw result of one transport call
struct QuoteResponse {
    int status = 0;
    std::string body;
    std::optional<RateLimitSignal> rate_limit;
};

// Per-call tuning, passed by value into every fetch
struct ClientConfig {
    int max_retries = 3;
    double backoff_base_seconds = 0.3;
    bool fail_fast_on_rate_limit = false;
    int default_rate_limit_wait_seconds = 60;

    // Throws std::invalid_argument describing the first bad field
    void validate() const;
};

// What fetch hands back to callers
struct PriceQuote {
    std::string symbol;
    double price = 0.0;
    std::chrono::system_clock::time_point observed_at;
    bool degraded = false; // true when served from cache after a transient failure
    int attempts = 0;
};
