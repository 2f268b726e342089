#include <gtest/gtest.h>
#include <callguard/callguard.hpp>

using namespace callguard;
using namespace std::chrono_literals;

static EndpointConfig valid_endpoint() {
    EndpointConfig cfg;
    cfg.name = "openai";
    return cfg;
}

TEST(ConfigTest, Defaults_AreValid) {
    EXPECT_NO_THROW(validate(valid_endpoint()));
    EXPECT_NO_THROW(validate(Config{}));
}

TEST(ConfigTest, Defaults_MatchDocumentedValues) {
    EndpointConfig cfg;
    EXPECT_EQ(cfg.max_requests_per_period, 60u);
    EXPECT_EQ(cfg.period, Duration(60s));
    EXPECT_EQ(cfg.default_timeout, Duration(90s));
    EXPECT_EQ(cfg.default_max_attempts, 3u);
    EXPECT_EQ(cfg.default_typed_attempts, 3u);
    EXPECT_FALSE(cfg.default_admission_wait.has_value());
    EXPECT_EQ(cfg.backoff.base, Duration(500ms));
    EXPECT_DOUBLE_EQ(cfg.backoff.multiplier, 2.0);
}

TEST(ConfigTest, EmptyName_Rejected) {
    EXPECT_THROW(validate(EndpointConfig{}), InvalidConfigException);
}

TEST(ConfigTest, NonPositivePeriod_Rejected) {
    auto cfg = valid_endpoint();
    cfg.period = 0s;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}

TEST(ConfigTest, NegativeTokenCeiling_Rejected) {
    auto cfg = valid_endpoint();
    cfg.max_tokens_per_period = -5;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}

TEST(ConfigTest, ZeroAttempts_Rejected) {
    auto cfg = valid_endpoint();
    cfg.default_max_attempts = 0;
    EXPECT_THROW(validate(cfg), InvalidConfigException);

    cfg = valid_endpoint();
    cfg.default_typed_attempts = 0;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}

TEST(ConfigTest, ZeroTimeout_Rejected) {
    auto cfg = valid_endpoint();
    cfg.default_timeout = 0ms;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}

TEST(ConfigTest, BadBackoff_Rejected) {
    auto cfg = valid_endpoint();
    cfg.backoff.multiplier = 0.5;
    EXPECT_THROW(validate(cfg), InvalidConfigException);

    cfg = valid_endpoint();
    cfg.backoff.base = 2s;
    cfg.backoff.max = 1s;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}

TEST(ConfigTest, ClientConfig_Checked) {
    Config cfg;
    cfg.poll_interval = 0ms;
    EXPECT_THROW(validate(cfg), InvalidConfigException);

    cfg = Config{};
    cfg.max_endpoints = 0;
    EXPECT_THROW(validate(cfg), InvalidConfigException);
}
