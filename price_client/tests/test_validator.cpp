#include <gtest/gtest.h>
#include "validator.hpp"

class QuoteValidatorTest : public ::testing::Test {
protected:
    QuoteValidator validator_;
};

TEST_F(QuoteValidatorTest, AcceptsListEntryMatchingSymbol) {
    auto result = validator_.validate(R"([{"name": "ETH", "price": 3000.0}, {"name": "BTC", "price": 45000.50}])", "BTC");

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(*result.price, 45000.50);
}

TEST_F(QuoteValidatorTest, AcceptsSingleObjectWithoutSymbol) {
    auto result = validator_.validate(R"({"price": 3500.25})", "ETH");

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(*result.price, 3500.25);
}

TEST_F(QuoteValidatorTest, AcceptsExtremeButPositivePrices) {
    EXPECT_DOUBLE_EQ(*validator_.validate(R"({"price": 999999999999.99})", "BTC").price, 999999999999.99);
    EXPECT_DOUBLE_EQ(*validator_.validate(R"({"price": 0.00000123456789})", "SHIB").price, 0.00000123456789);
}

TEST_F(QuoteValidatorTest, MalformedJsonIsMalformedPayload) {
    auto result = validator_.validate("<html>Bad Gateway</html>", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::MalformedPayload);
    EXPECT_FALSE(result.price.has_value());
}

TEST_F(QuoteValidatorTest, EmptyBodyIsMalformedPayload) {
    EXPECT_EQ(validator_.validate("", "BTC").status, ValidationStatus::MalformedPayload);
}

TEST_F(QuoteValidatorTest, ScalarPayloadIsMalformed) {
    EXPECT_EQ(validator_.validate("45000.5", "BTC").status, ValidationStatus::MalformedPayload);
}

TEST_F(QuoteValidatorTest, MissingPriceField) {
    auto result = validator_.validate(R"({"volume": 1000000})", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::MissingPrice);
    EXPECT_NE(result.detail.find("missing"), std::string::npos);
    EXPECT_NE(result.detail.find("BTC"), std::string::npos);
}

TEST_F(QuoteValidatorTest, EmptyObjectIsMissingPrice) {
    EXPECT_EQ(validator_.validate("{}", "BTC").status, ValidationStatus::MissingPrice);
}

TEST_F(QuoteValidatorTest, SymbolAbsentFromListIsMissingPrice) {
    auto result = validator_.validate(R"([{"name": "ETH", "price": 3000.0}, {"name": "SOL", "price": 100.0}])", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::MissingPrice);
}

TEST_F(QuoteValidatorTest, NullPrice) {
    EXPECT_EQ(validator_.validate(R"({"price": null})", "BTC").status, ValidationStatus::NullPrice);
}

TEST_F(QuoteValidatorTest, StringPriceIsNonNumeric) {
    auto result = validator_.validate(R"({"price": "INVALID"})", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::NonNumericPrice);
    EXPECT_NE(result.detail.find("Invalid price format"), std::string::npos);
}

TEST_F(QuoteValidatorTest, NumericLookingStringIsStillNonNumeric) {
    EXPECT_EQ(validator_.validate(R"({"price": "45000.5"})", "BTC").status, ValidationStatus::NonNumericPrice);
}

TEST_F(QuoteValidatorTest, BooleanPriceIsNonNumeric) {
    EXPECT_EQ(validator_.validate(R"({"price": true})", "BTC").status, ValidationStatus::NonNumericPrice);
}

TEST_F(QuoteValidatorTest, NegativePriceIsNonPositive) {
    auto result = validator_.validate(R"({"price": -100})", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::NonPositivePrice);
    EXPECT_NE(result.detail.find("-100"), std::string::npos);
    EXPECT_NE(result.detail.find("must be positive"), std::string::npos);
}

TEST_F(QuoteValidatorTest, ZeroPriceIsNonPositive) {
    EXPECT_EQ(validator_.validate(R"({"price": 0})", "BTC").status, ValidationStatus::NonPositivePrice);
}

TEST_F(QuoteValidatorTest, MismatchedSymbolField) {
    auto result = validator_.validate(R"({"symbol": "ETH", "price": 3000.0})", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::SymbolMismatch);
    EXPECT_NE(result.detail.find("ETH"), std::string::npos);
}

TEST_F(QuoteValidatorTest, MismatchedNameField) {
    EXPECT_EQ(validator_.validate(R"({"name": "ETH", "price": 3000.0})", "BTC").status,
              ValidationStatus::SymbolMismatch);
}

TEST_F(QuoteValidatorTest, MatchingSymbolFieldIsValid) {
    EXPECT_TRUE(validator_.validate(R"({"symbol": "BTC", "price": 45000.5})", "BTC").ok());
}

TEST_F(QuoteValidatorTest, DisplayNameBesideSymbolIsIgnored) {
    auto result = validator_.validate(R"({"symbol": "BTC", "name": "Bitcoin", "price": 1.0})", "BTC");

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(*result.price, 1.0);
}

TEST_F(QuoteValidatorTest, SymbolFieldWinsOverMatchingName) {
    EXPECT_EQ(validator_.validate(R"({"symbol": "ETH", "name": "BTC", "price": 3000.0})", "BTC").status,
              ValidationStatus::SymbolMismatch);
}

TEST_F(QuoteValidatorTest, OverflowingNumberIsMalformedPayload) {
    auto result = validator_.validate(R"({"price": 1e400})", "BTC");

    EXPECT_EQ(result.status, ValidationStatus::MalformedPayload);
    EXPECT_FALSE(result.price.has_value());
    EXPECT_NE(result.detail.find("BTC"), std::string::npos);
}

TEST_F(QuoteValidatorTest, PriceChecksRunBeforeSymbolCheck) {
    // Both wrong: the price failure is reported first
    EXPECT_EQ(validator_.validate(R"({"symbol": "ETH", "price": -1})", "BTC").status,
              ValidationStatus::NonPositivePrice);
}

TEST_F(QuoteValidatorTest, UnicodeSymbolIsMatchedExactly) {
    auto result = validator_.validate(R"([{"name": "BTC₿", "price": 100.0}])", "BTC\xE2\x82\xBF");

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(*result.price, 100.0);
}
