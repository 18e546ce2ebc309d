#include "http_quote_transport.hpp"
#include "errors.hpp"
#include "rate_limit_handler.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

HttpQuoteTransport::HttpQuoteTransport(const Config& config)
    : url_(config.quote_api_url),
      request_type_(config.quote_request_type),
      timeout_ms_(config.request_timeout_ms) {
    spdlog::info("Quote transport configured for {} (timeout {} ms)", url_, timeout_ms_);
}

QuoteResponse HttpQuoteTransport::request_quote(const std::string& symbol) {
    spdlog::debug("Requesting quote for {} from {}", symbol, url_);

    auto response = cpr::Get(
        cpr::Url{url_},
        cpr::Parameters{{"type", request_type_}},
        cpr::Header{{"Accept", "application/json"}, {"User-Agent", "PriceClient/1.0"}},
        cpr::Timeout{timeout_ms_}
    );

    if (response.error) {
        bool timed_out = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        throw TransportError("Request to " + url_ + " failed: " + response.error.message, timed_out);
    }

    QuoteResponse quote;
    quote.status = static_cast<int>(response.status_code);
    quote.body = response.text;

    if (quote.status == 429) {
        RateLimitSignal signal;
        auto it = response.header.find("Retry-After");
        if (it != response.header.end()) {
            signal.retry_after_seconds = parse_retry_after(it->second);
        }
        quote.rate_limit = signal;
    }

    return quote;
}
