#pragma once
#include <optional>
#include <string>

enum class ValidationStatus {
    Valid,
    MalformedPayload,
    MissingPrice,
    NullPrice,
    NonNumericPrice,
    NonPositivePrice,
    SymbolMismatch
};

const char* to_string(ValidationStatus status);

struct ValidationResult {
    ValidationStatus status = ValidationStatus::MalformedPayload;
    std::optional<double> price;   // set only when status is Valid
    std::string detail;            // human readable reason, names the symbol

    bool ok() const { return status == ValidationStatus::Valid; }
};

// Inspects a raw quote body. Accepts either a list of {"name", "price"}
// entries or a single object with "price" and optional "symbol"/"name".
// Checks run in a fixed order and the first failing one is reported.
class QuoteValidator {
public:
    ValidationResult validate(const std::string& raw_response, const std::string& requested_symbol) const;
};
