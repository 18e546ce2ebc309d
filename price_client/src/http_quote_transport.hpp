#pragma once

#include "config.hpp"
#include "quote_transport.hpp"
#include <string>

// QuoteTransport over HTTPS using cpr
class HttpQuoteTransport : public QuoteTransport {
public:
    explicit HttpQuoteTransport(const Config& config);

    QuoteResponse request_quote(const std::string& symbol) override;

private:
    std::string url_;
    std::string request_type_;
    int timeout_ms_;
};
