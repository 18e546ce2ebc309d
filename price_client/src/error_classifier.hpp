#pragma once

#include "types.hpp"
#include "validator.hpp"
#include <string>
#include <variant>

// No HTTP response at all: connection refused, DNS, TLS, timeout
struct TransportFailure {
    std::string message;
    bool timed_out = false;
};

// A response arrived with a non-success status
struct HttpStatusFailure {
    int status = 0;
};

using Failure = std::variant<TransportFailure, HttpStatusFailure, ValidationResult>;

// Fixed policy table mapping every failure source onto one ErrorKind.
// Validation and transport failures go through the same table.
class ErrorClassifier {
public:
    ErrorKind classify(const Failure& failure) const;

    ErrorKind classify_status(int http_status) const;
    ErrorKind classify_validation(ValidationStatus status) const;
};

// Transient and Incomplete failures are retried before anything else happens
bool is_retryable(ErrorKind kind);

// Only infrastructure trouble may be masked by a cached price
bool cache_fallback_permitted(ErrorKind kind);

bool is_success_status(int http_status);
