#include "validator.hpp"
#include <cmath>
#include <utility>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

namespace {

ValidationResult fail(ValidationStatus status, std::string detail) {
    ValidationResult result;
    result.status = status;
    result.detail = std::move(detail);
    return result;
}

// Locate the entry describing the requested symbol, or nullptr if the list has none
const nlohmann::json* find_entry(const nlohmann::json& data, const std::string& symbol) {
    if (data.is_object()) {
        return &data;
    }
    for (const auto& asset : data) {
        if (asset.is_object() && asset.contains("name") && asset["name"].is_string() &&
            asset["name"].get<std::string>() == symbol) {
            return &asset;
        }
    }
    return nullptr;
}

// Returns the mismatching identifier, if the payload names a different symbol.
// "name" is only consulted when "symbol" is absent.
std::optional<std::string> mismatched_symbol(const nlohmann::json& entry, const std::string& symbol) {
    const char* field = entry.contains("symbol") ? "symbol" : "name";
    if (!entry.contains(field)) {
        return std::nullopt;
    }
    const auto& value = entry[field];
    if (!value.is_string()) {
        return value.dump();
    }
    if (value.get<std::string>() != symbol) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

} // namespace

const char* to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid: return "valid";
        case ValidationStatus::MalformedPayload: return "malformed_payload";
        case ValidationStatus::MissingPrice: return "missing_price";
        case ValidationStatus::NullPrice: return "null_price";
        case ValidationStatus::NonNumericPrice: return "non_numeric_price";
        case ValidationStatus::NonPositivePrice: return "non_positive_price";
        case ValidationStatus::SymbolMismatch: return "symbol_mismatch";
    }
    return "unknown";
}

ValidationResult QuoteValidator::validate(const std::string& raw_response,
                                          const std::string& requested_symbol) const {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(raw_response);
    } catch (const nlohmann::json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers that overflow a double
        return fail(ValidationStatus::MalformedPayload,
                    fmt::format("Malformed payload for {}: {}", requested_symbol, e.what()));
    }

    if (!data.is_object() && !data.is_array()) {
        return fail(ValidationStatus::MalformedPayload,
                    fmt::format("Unexpected payload type for {}: {}", requested_symbol, data.type_name()));
    }

    const nlohmann::json* entry = find_entry(data, requested_symbol);
    if (entry == nullptr || !entry->contains("price")) {
        return fail(ValidationStatus::MissingPrice,
                    fmt::format("Price field missing for symbol {}", requested_symbol));
    }

    const auto& price = (*entry)["price"];
    if (price.is_null()) {
        return fail(ValidationStatus::NullPrice,
                    fmt::format("Price is null for symbol {}", requested_symbol));
    }

    if (!price.is_number()) {
        return fail(ValidationStatus::NonNumericPrice,
                    fmt::format("Invalid price format for {}: {}", requested_symbol, price.dump()));
    }

    double value = price.get<double>();
    if (!std::isfinite(value)) {
        return fail(ValidationStatus::NonNumericPrice,
                    fmt::format("Invalid price format for {}: {}", requested_symbol, value));
    }
    if (value <= 0.0) {
        return fail(ValidationStatus::NonPositivePrice,
                    fmt::format("Invalid price value for {}: {} (must be positive)", requested_symbol, value));
    }

    if (auto other = mismatched_symbol(*entry, requested_symbol)) {
        return fail(ValidationStatus::SymbolMismatch,
                    fmt::format("Symbol mismatch: requested {}, response names {}", requested_symbol, *other));
    }

    ValidationResult result;
    result.status = ValidationStatus::Valid;
    result.price = value;
    return result;
}
