#include <gtest/gtest.h>
#include <callguard/callguard.hpp>

#include "../mock_provider.hpp"

#include <future>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

struct Rating {
    int score = 0;
    std::string reason;
};

void from_json(const json& j, Rating& r) {
    j.at("score").get_to(r.score);
    j.at("reason").get_to(r.reason);
}

} // namespace

class ClientTest : public ::testing::Test {
protected:
    ClientTest() : provider_(std::make_shared<MockProvider>()) {
        client_.register_endpoint(fast_endpoint("primary"), provider_);
    }

    Client client_;
    std::shared_ptr<MockProvider> provider_;
};

// ===========================================================================
// Registration
// ===========================================================================

TEST_F(ClientTest, RegisteredEndpoint_IsListed) {
    EXPECT_TRUE(client_.has_endpoint("primary"));
    EXPECT_FALSE(client_.has_endpoint("secondary"));
    ASSERT_EQ(client_.endpoints().size(), 1u);
    EXPECT_EQ(client_.limiter("primary").endpoint(), "primary");
}

TEST_F(ClientTest, DuplicateEndpoint_Rejected) {
    EXPECT_THROW(client_.register_endpoint(fast_endpoint("primary"), provider_),
                 InvalidRequestException);
}

TEST_F(ClientTest, MissingProvider_Rejected) {
    EXPECT_THROW(client_.register_endpoint(fast_endpoint("other"), nullptr),
                 InvalidRequestException);
}

TEST_F(ClientTest, InvalidEndpointConfig_Rejected) {
    EndpointConfig cfg = fast_endpoint("broken");
    cfg.period = 0ms;
    EXPECT_THROW(client_.register_endpoint(cfg, provider_), InvalidConfigException);
}

TEST(ClientLimitsTest, EndpointLimit_Enforced) {
    Config cfg;
    cfg.max_endpoints = 1;
    Client client(cfg);
    auto provider = std::make_shared<MockProvider>();

    client.register_endpoint(fast_endpoint("a"), provider);
    EXPECT_THROW(client.register_endpoint(fast_endpoint("b"), provider), InvalidRequestException);
}

TEST_F(ClientTest, UnknownEndpoint_Throws) {
    EXPECT_THROW(client_.invoke("nowhere", "hi"), EndpointNotFoundException);
    EXPECT_THROW(client_.invoke_async("nowhere", ProviderRequest{}), EndpointNotFoundException);
    EXPECT_THROW(client_.limiter("nowhere"), EndpointNotFoundException);
}

// ===========================================================================
// Calls
// ===========================================================================

TEST_F(ClientTest, Invoke_ReturnsText) {
    provider_->push(MockProvider::ok("hello back"));
    EXPECT_EQ(client_.invoke("primary", "hello"), "hello back");
    EXPECT_EQ(provider_->prompts().at(0), "hello");
}

TEST_F(ClientTest, Invoke_ChargesScope) {
    auto scope = client_.open_scope(2.0, "session");
    provider_->push(MockProvider::ok("a", 0.5));

    CallOptions opts;
    opts.scope = scope.id();
    client_.invoke("primary", "q", opts);

    EXPECT_DOUBLE_EQ(client_.current_usage(scope.id()), 0.5);
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.5);
}

TEST_F(ClientTest, InvokeAsync_RunsConcurrently) {
    provider_->set_default(MockProvider::slow("done", 100ms, 0.1));
    auto scope = client_.open_scope();

    CallOptions opts;
    opts.scope = scope.id();
    std::vector<std::future<CallResult>> futures;
    auto start = Clock::now();
    for (int i = 0; i < 4; ++i) {
        ProviderRequest req;
        req.prompt = "task " + std::to_string(i);
        futures.push_back(client_.invoke_async("primary", req, opts));
    }
    for (auto& f : futures) {
        EXPECT_EQ(f.get().text, "done");
    }

    EXPECT_LT(Clock::now() - start, 350ms);
    EXPECT_NEAR(scope.current_usage(), 0.4, 1e-9);
}

TEST_F(ClientTest, InvokeDetailed_ExposesRecord) {
    provider_->push(MockProvider::fail(ProviderErrorKind::Transient));
    provider_->push(MockProvider::ok("ok"));

    ProviderRequest req;
    req.prompt = "q";
    CallResult result = client_.invoke_detailed("primary", req);
    EXPECT_EQ(result.record.attempts, 2u);
    EXPECT_EQ(result.record.endpoint, "primary");
}

// ===========================================================================
// Typed calls
// ===========================================================================

TEST_F(ClientTest, InvokeTyped_ReturnsValidatedJson) {
    provider_->push(MockProvider::ok("[3, 1, 2]"));
    json value = client_.invoke_typed("primary", "numbers?", Shape::list(Shape::integer()));
    EXPECT_EQ(value, json::array({3, 1, 2}));
}

TEST_F(ClientTest, InvokeTypedAs_ConvertsToStruct) {
    Shape shape = Shape::object({
        {"score", Shape::integer(1, 5), "Rating from 1 to 5", true},
        {"reason", Shape::string(), "", true},
    });
    provider_->push(MockProvider::ok("{\"score\": 9, \"reason\": \"great\"}"));
    provider_->push(MockProvider::ok("{\"score\": 4, \"reason\": \"good\"}"));

    Rating r = client_.invoke_typed_as<Rating>("primary", "Rate it", shape);
    EXPECT_EQ(r.score, 4);
    EXPECT_EQ(r.reason, "good");
    EXPECT_EQ(provider_->calls(), 2u);
}

TEST_F(ClientTest, InvokeBoolean_UsesKeywords) {
    provider_->push(MockProvider::ok("After consideration: YES"));
    EXPECT_TRUE(client_.invoke_boolean("primary", "Proceed?"));
}

// ===========================================================================
// Monitoring
// ===========================================================================

TEST_F(ClientTest, Monitor_ReachesEveryComponent) {
    auto metrics = std::make_shared<MetricsMonitor>();
    client_.set_monitor(metrics);
    client_.register_endpoint(fast_endpoint("late"), provider_);

    auto scope = client_.open_scope();
    CallOptions opts;
    opts.scope = scope.id();
    provider_->set_default(MockProvider::ok("7", 0.2));

    client_.invoke("primary", "a", opts);
    client_.invoke_typed("late", "b", Shape::integer(), std::nullopt, opts);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.admissions, 2u);
    EXPECT_EQ(m.successful_calls, 2u);
    EXPECT_NEAR(m.total_spend, 0.4, 1e-9);
}
