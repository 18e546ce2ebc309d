#include "price_client.hpp"
#include "error_classifier.hpp"
#include "rate_limit_handler.hpp"
#include "retry_controller.hpp"
#include "util.hpp"
#include "validator.hpp"
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

class PriceClient::Impl {
public:
    Impl(std::shared_ptr<QuoteTransport> transport, std::shared_ptr<PriceCache> cache, Sleeper sleeper)
        : transport_(std::move(transport)),
          cache_(cache ? std::move(cache) : std::make_shared<PriceCache>()),
          sleeper_(std::move(sleeper)) {
        if (!transport_) {
            throw std::invalid_argument("PriceClient requires a quote transport");
        }
        if (!sleeper_) {
            throw std::invalid_argument("PriceClient requires a sleeper");
        }
    }

    PriceQuote fetch(const std::string& symbol, const ClientConfig& config, const CancellationToken& token) {
        if (util::trim(symbol).empty()) {
            throw ClientError(ClientError::Code::InvalidInput,
                              detail(symbol, "Invalid symbol: must be a non-empty identifier"));
        }

        try {
            config.validate();
        } catch (const std::invalid_argument& e) {
            throw ClientError(ClientError::Code::InvalidInput,
                              detail(symbol, std::string("Invalid client config: ") + e.what()));
        }

        RetryController retry([this, &token](std::chrono::milliseconds delay) {
            return sleeper_(delay, token);
        });

        int attempts = 0;
        bool rate_limit_wait_used = false;

        while (true) {
            try {
                PriceRecord record = retry.execute(
                    [&](int) {
                        ++attempts;
                        return attempt(symbol);
                    },
                    config.max_retries, config.backoff_base_seconds);

                cache_->put(record);
                spdlog::info("Successfully fetched price for {}: {}", symbol, record.price());
                return make_quote(record, false, attempts);

            } catch (const FetchFailure& failure) {
                switch (failure.kind()) {
                    case ErrorKind::RateLimited: {
                        auto signal = failure.rate_limit().value_or(RateLimitSignal{});
                        if (rate_limit_wait_used) {
                            spdlog::warn("Still rate limited for {} after waiting, giving up", symbol);
                            auto d = detail(symbol, std::string("Rate limited again after waiting: ") + failure.what(), attempts);
                            d.retry_after_seconds = signal.retry_after_seconds;
                            throw ClientError(ClientError::Code::RateLimited, std::move(d));
                        }

                        auto decision = rate_limit_handler_.handle(signal, config);
                        if (decision.action == RateLimitDecision::Action::Fail) {
                            spdlog::warn("Rate limited for {}, failing fast", symbol);
                            auto d = detail(symbol, std::string("Rate limited: ") + failure.what(), attempts);
                            d.retry_after_seconds = decision.retry_after_seconds;
                            throw ClientError(ClientError::Code::RateLimited, std::move(d));
                        }

                        spdlog::warn("Rate limited for {}. Waiting {} seconds before one more attempt",
                                     symbol, decision.wait.count());
                        rate_limit_wait_used = true;
                        if (!sleeper_(std::chrono::duration_cast<std::chrono::milliseconds>(decision.wait), token)) {
                            throw ClientError(ClientError::Code::Cancelled,
                                              detail(symbol, "Rate limit wait cancelled", attempts));
                        }
                        continue;
                    }

                    case ErrorKind::DataIntegrity: {
                        // Never masked: the cache is neither read for a result nor overwritten
                        spdlog::error("Data integrity failure for {}: {}", symbol, failure.what());
                        throw ClientError(ClientError::Code::DataIntegrity, detail(symbol, failure.what(), attempts));
                    }

                    case ErrorKind::Transient:
                    case ErrorKind::Incomplete:
                        break;

                    case ErrorKind::InvalidInput:
                        throw ClientError(ClientError::Code::InvalidInput,
                                          detail(symbol, failure.what(), attempts));
                }

                if (!cache_fallback_permitted(failure.kind())) {
                    throw;
                }

                if (auto cached = cache_->get(symbol)) {
                    spdlog::warn("Using cached price for {} ({}, observed {}) after failure: {}",
                                 symbol, cached->price(), util::format_timestamp(cached->observed_at()),
                                 failure.what());
                    return make_quote(*cached, true, attempts);
                }
                spdlog::error("Failed to fetch price for {} after {} attempt(s), no cached value: {}",
                              symbol, attempts, failure.what());
                throw ClientError(ClientError::Code::NoDataAvailable, detail(symbol, failure.what(), attempts));

            } catch (const OperationCancelled& e) {
                spdlog::info("Fetch for {} cancelled: {}", symbol, e.what());
                throw ClientError(ClientError::Code::Cancelled, detail(symbol, e.what(), attempts));
            }
        }
    }

    const PriceCache& cache() const {
        return *cache_;
    }

private:
    // One round trip: transport, status check, validation
    PriceRecord attempt(const std::string& symbol) {
        QuoteResponse response;
        try {
            response = transport_->request_quote(symbol);
        } catch (const TransportError& e) {
            Failure failure = TransportFailure{e.what(), e.timed_out()};
            throw FetchFailure(classifier_.classify(failure),
                               fmt::format("Transport failure for {}: {}", symbol, e.what()));
        }

        if (!is_success_status(response.status)) {
            ErrorKind kind = classifier_.classify(HttpStatusFailure{response.status});
            std::optional<RateLimitSignal> signal;
            if (kind == ErrorKind::RateLimited) {
                signal = response.rate_limit.value_or(RateLimitSignal{});
            }
            throw FetchFailure(kind, fmt::format("Quote source returned HTTP {} for {}", response.status, symbol),
                               signal);
        }

        ValidationResult result = validator_.validate(response.body, symbol);
        if (!result.ok()) {
            spdlog::debug("Quote for {} failed validation ({})", symbol, to_string(result.status));
            throw FetchFailure(classifier_.classify(result), result.detail);
        }

        return PriceRecord::make(symbol, *result.price);
    }

    // Every propagated error reports whether a last-known-good price was on hand
    ClientError::Detail detail(const std::string& symbol, std::string cause, int attempts = 0) const {
        ClientError::Detail d;
        d.symbol = symbol;
        d.operation = "fetch";
        d.cause = std::move(cause);
        d.cached_value_existed = cache_->get(symbol).has_value();
        d.attempts = attempts;
        return d;
    }

    static PriceQuote make_quote(const PriceRecord& record, bool degraded, int attempts) {
        PriceQuote quote;
        quote.symbol = record.symbol();
        quote.price = record.price();
        quote.observed_at = record.observed_at();
        quote.degraded = degraded;
        quote.attempts = attempts;
        return quote;
    }

    std::shared_ptr<QuoteTransport> transport_;
    std::shared_ptr<PriceCache> cache_;
    Sleeper sleeper_;
    QuoteValidator validator_;
    ErrorClassifier classifier_;
    RateLimitHandler rate_limit_handler_;
};

namespace {

bool wait_on_token(std::chrono::milliseconds delay, const CancellationToken& token) {
    return token.wait_for(delay);
}

} // namespace

// --- PIMPL forwarding ---
PriceClient::PriceClient(std::shared_ptr<QuoteTransport> transport, std::shared_ptr<PriceCache> cache)
    : PriceClient(std::move(transport), std::move(cache), wait_on_token) {}

PriceClient::PriceClient(std::shared_ptr<QuoteTransport> transport, std::shared_ptr<PriceCache> cache, Sleeper sleeper)
    : pImpl_(std::make_unique<Impl>(std::move(transport), std::move(cache), std::move(sleeper))) {}

PriceClient::~PriceClient() = default;

PriceQuote PriceClient::fetch(const std::string& symbol, ClientConfig config) {
    CancellationToken never_cancelled;
    return pImpl_->fetch(symbol, config, never_cancelled);
}

PriceQuote PriceClient::fetch(const std::string& symbol, ClientConfig config, const CancellationToken& token) {
    return pImpl_->fetch(symbol, config, token);
}

double PriceClient::get_price(const std::string& symbol, ClientConfig config) {
    return fetch(symbol, config).price;
}

const PriceCache& PriceClient::cache() const {
    return pImpl_->cache();
}
