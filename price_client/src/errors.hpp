#pragma once
#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

// Thrown by a QuoteTransport when no HTTP response was obtained
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message, bool timed_out = false)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

// One failed attempt, already classified. Internal to the fetch pipeline.
class FetchFailure : public std::runtime_error {
public:
    FetchFailure(ErrorKind kind, const std::string& message,
                 std::optional<RateLimitSignal> rate_limit = std::nullopt)
        : std::runtime_error(message), kind_(kind), rate_limit_(rate_limit) {}

    ErrorKind kind() const { return kind_; }
    const std::optional<RateLimitSignal>& rate_limit() const { return rate_limit_; }

private:
    ErrorKind kind_;
    std::optional<RateLimitSignal> rate_limit_;
};

// The only error PriceClient::fetch lets escape
class ClientError : public std::runtime_error {
public:
    enum class Code {
        InvalidInput,
        DataIntegrity,
        NoDataAvailable,
        RateLimited,
        Cancelled
    };

    struct Detail {
        std::string symbol;
        std::string operation = "fetch";
        std::string cause;
        bool cached_value_existed = false;
        std::optional<int> retry_after_seconds;
        int attempts = 0;
    };

    ClientError(Code code, Detail detail);

    Code code() const { return code_; }
    const Detail& detail() const { return detail_; }
    const std::string& symbol() const { return detail_.symbol; }
    const std::string& cause() const { return detail_.cause; }
    bool cached_value_existed() const { return detail_.cached_value_existed; }
    const std::optional<int>& retry_after_seconds() const { return detail_.retry_after_seconds; }

private:
    Code code_;
    Detail detail_;
};

const char* to_string(ClientError::Code code);
