#include "errors.hpp"
#include <utility>
#include <fmt/format.h>

namespace {

std::string describe(ClientError::Code code, const ClientError::Detail& detail) {
    auto message = fmt::format("{} failed for symbol '{}' [{}]: {}",
                               detail.operation, detail.symbol, to_string(code), detail.cause);
    if (detail.retry_after_seconds) {
        message += fmt::format(" (retry after {} seconds)", *detail.retry_after_seconds);
    }
    if (code != ClientError::Code::InvalidInput) {
        message += detail.cached_value_existed ? " (cached value exists)" : " (no cached value)";
    }
    return message;
}

} // namespace

ClientError::ClientError(Code code, Detail detail)
    : std::runtime_error(describe(code, detail)), code_(code), detail_(std::move(detail)) {
}

const char* to_string(ClientError::Code code) {
    switch (code) {
        case ClientError::Code::InvalidInput: return "invalid_input";
        case ClientError::Code::DataIntegrity: return "data_integrity";
        case ClientError::Code::NoDataAvailable: return "no_data_available";
        case ClientError::Code::RateLimited: return "rate_limited";
        case ClientError::Code::Cancelled: return "cancelled";
    }
    return "unknown";
}
