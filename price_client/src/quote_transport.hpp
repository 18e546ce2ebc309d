#pragma once
#include "types.hpp"
#include <string>

// Outbound port to the remote quote source. Implementations return whatever
// status and body the remote produced, and throw TransportError when no
// response was obtained at all.
class QuoteTransport {
public:
    virtual ~QuoteTransport() = default;

    virtual QuoteResponse request_quote(const std::string& symbol) = 0;
};
