#include <gtest/gtest.h>
#include "rate_limit_handler.hpp"

class RateLimitHandlerTest : public ::testing::Test {
protected:
    RateLimitHandler handler_;
    ClientConfig config_;
};

TEST_F(RateLimitHandlerTest, WaitsForAdvertisedDuration) {
    auto decision = handler_.handle(RateLimitSignal{60}, config_);

    EXPECT_EQ(decision.action, RateLimitDecision::Action::Wait);
    EXPECT_EQ(decision.wait, std::chrono::seconds(60));
}

TEST_F(RateLimitHandlerTest, FallsBackToConfiguredDefault) {
    config_.default_rate_limit_wait_seconds = 15;

    auto decision = handler_.handle(RateLimitSignal{}, config_);

    EXPECT_EQ(decision.action, RateLimitDecision::Action::Wait);
    EXPECT_EQ(decision.wait, std::chrono::seconds(15));
    EXPECT_FALSE(decision.retry_after_seconds.has_value());
}

TEST_F(RateLimitHandlerTest, FailFastCarriesRetryAfter) {
    config_.fail_fast_on_rate_limit = true;

    auto decision = handler_.handle(RateLimitSignal{60}, config_);

    EXPECT_EQ(decision.action, RateLimitDecision::Action::Fail);
    EXPECT_EQ(decision.wait, std::chrono::seconds(0));
    ASSERT_TRUE(decision.retry_after_seconds.has_value());
    EXPECT_EQ(*decision.retry_after_seconds, 60);
}

TEST_F(RateLimitHandlerTest, FailFastWithoutRetryAfter) {
    config_.fail_fast_on_rate_limit = true;

    auto decision = handler_.handle(RateLimitSignal{}, config_);

    EXPECT_EQ(decision.action, RateLimitDecision::Action::Fail);
    EXPECT_FALSE(decision.retry_after_seconds.has_value());
}

TEST(ParseRetryAfterTest, AcceptsDeltaSeconds) {
    EXPECT_EQ(parse_retry_after("60"), 60);
    EXPECT_EQ(parse_retry_after(" 5 "), 5);
}

TEST(ParseRetryAfterTest, RejectsEverythingElse) {
    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("invalid").has_value());
    EXPECT_FALSE(parse_retry_after("60s").has_value());
    EXPECT_FALSE(parse_retry_after("-1").has_value());
    EXPECT_FALSE(parse_retry_after("0").has_value());
    EXPECT_FALSE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
}
