#include "error_classifier.hpp"
#include <stdexcept>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

ErrorKind ErrorClassifier::classify(const Failure& failure) const {
    return std::visit(overloaded{
        [](const TransportFailure&) { return ErrorKind::Transient; },
        [this](const HttpStatusFailure& f) { return classify_status(f.status); },
        [this](const ValidationResult& r) { return classify_validation(r.status); }
    }, failure);
}

ErrorKind ErrorClassifier::classify_status(int http_status) const {
    if (http_status == 429) {
        return ErrorKind::RateLimited;
    }

    if (is_success_status(http_status)) {
        throw std::invalid_argument("HTTP " + std::to_string(http_status) + " is not a failure status");
    }

    // 5xx, 408 and anything else without a usable body is infrastructure trouble,
    // not evidence that the price data is wrong
    return ErrorKind::Transient;
}

ErrorKind ErrorClassifier::classify_validation(ValidationStatus status) const {
    switch (status) {
        case ValidationStatus::MissingPrice:
        case ValidationStatus::NullPrice:
            return ErrorKind::Incomplete;
        case ValidationStatus::MalformedPayload:
        case ValidationStatus::NonNumericPrice:
        case ValidationStatus::NonPositivePrice:
        case ValidationStatus::SymbolMismatch:
            return ErrorKind::DataIntegrity;
        case ValidationStatus::Valid:
            break;
    }
    throw std::invalid_argument("A valid quote is not a failure");
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Transient || kind == ErrorKind::Incomplete;
}

bool cache_fallback_permitted(ErrorKind kind) {
    return kind == ErrorKind::Transient || kind == ErrorKind::Incomplete;
}

bool is_success_status(int http_status) {
    return http_status >= 200 && http_status < 300;
}
