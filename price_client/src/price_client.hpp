#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "price_cache.hpp"
#include "quote_transport.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// Fetches a validated price for a symbol, retrying transient failures and
// falling back to the last known good price only when the failure says
// nothing about the data itself. Safe to call concurrently; the transport
// must be as well.
class PriceClient {
public:
    // Waits `delay` unless the token is cancelled first. Returns false on cancel.
    using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken&)>;

    // A null cache gives this client a private one
    PriceClient(std::shared_ptr<QuoteTransport> transport, std::shared_ptr<PriceCache> cache = nullptr);
    PriceClient(std::shared_ptr<QuoteTransport> transport, std::shared_ptr<PriceCache> cache, Sleeper sleeper);
    ~PriceClient();

    // Throws ClientError on every failure path that is not served from cache
    PriceQuote fetch(const std::string& symbol, ClientConfig config);
    PriceQuote fetch(const std::string& symbol, ClientConfig config, const CancellationToken& token);

    // Shorthand for fetch(...).price
    double get_price(const std::string& symbol, ClientConfig config);

    const PriceCache& cache() const;

    // Non-copyable
    PriceClient(const PriceClient&) = delete;
    PriceClient& operator=(const PriceClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
