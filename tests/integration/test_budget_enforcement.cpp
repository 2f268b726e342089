#include <gtest/gtest.h>
#include <callguard/callguard.hpp>

#include "../mock_provider.hpp"

#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;

// ===========================================================================
// $1 cap, three concurrent $0.40 calls: the third charge breaches the cap
// ===========================================================================

TEST(BudgetEnforcementTest, ConcurrentCalls_BreachDetectedOnce) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::slow("answer", 50ms, 0.40));
    client.register_endpoint(fast_endpoint("llm"), provider);

    auto scope = client.open_scope(1.0, "run");
    CallOptions opts;
    opts.scope = scope.id();

    std::atomic<int> clean{0};
    std::atomic<int> breached{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&]() {
            try {
                client.invoke("llm", "question", opts);
                clean.fetch_add(1);
            } catch (const BudgetExceededException& e) {
                EXPECT_TRUE(e.spend_occurred());
                EXPECT_DOUBLE_EQ(e.cap(), 1.0);
                EXPECT_GT(e.total(), 1.0);
                breached.fetch_add(1);
            } catch (...) {
                errors.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(clean.load(), 2);
    EXPECT_EQ(breached.load(), 1);

    // The overspend is recorded, not hidden
    EXPECT_NEAR(scope.current_usage(), 1.2, 1e-9);

    // Nothing more may start under the exhausted scope
    std::size_t calls_before = provider->calls();
    try {
        client.invoke("llm", "one more", opts);
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_FALSE(e.spend_occurred());
        EXPECT_EQ(e.record().outcome, CallOutcome::BudgetBlocked);
    }
    EXPECT_EQ(provider->calls(), calls_before);
}

// ===========================================================================
// A call queued for admission rechecks the scope once admitted
// ===========================================================================

TEST(BudgetEnforcementTest, QueuedCall_ScopeFilledWhileWaiting_NeverSent) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::slow("answer", 50ms, 1.00));

    EndpointConfig cfg = fast_endpoint("llm");
    cfg.max_requests_per_period = 1;
    cfg.period = 300ms;
    client.register_endpoint(cfg, provider);

    auto scope = client.open_scope(0.50, "run");
    CallOptions opts;
    opts.scope = scope.id();

    auto first = std::async(std::launch::async, [&]() {
        return client.invoke("llm", "first", opts);
    });
    std::this_thread::sleep_for(10ms);

    try {
        client.invoke("llm", "second", opts);
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_FALSE(e.spend_occurred());
        EXPECT_EQ(e.record().outcome, CallOutcome::BudgetBlocked);
    }

    try {
        first.get();
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_TRUE(e.spend_occurred());
    }

    EXPECT_EQ(provider->calls(), 1u);
    EXPECT_DOUBLE_EQ(scope.current_usage(), 1.00);
}

// ===========================================================================
// Nested scopes: a child's spend counts against every ancestor
// ===========================================================================

TEST(BudgetEnforcementTest, NestedScopes_ChildSpendReachesParent) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::ok("done", 0.25));
    client.register_endpoint(fast_endpoint("llm"), provider);

    auto session = client.open_scope(1.0, "session");
    auto task = client.ledger().open_scope(0.5, session.id(), "task");

    CallOptions in_task;
    in_task.scope = task.id();
    client.invoke("llm", "step 1", in_task);
    client.invoke("llm", "step 2", in_task);

    EXPECT_DOUBLE_EQ(task.current_usage(), 0.5);
    EXPECT_DOUBLE_EQ(session.current_usage(), 0.5);

    // The child is at its cap; the parent still has room
    EXPECT_THROW(client.invoke("llm", "step 3", in_task), BudgetExceededException);

    CallOptions in_session;
    in_session.scope = session.id();
    client.invoke("llm", "summary", in_session);
    EXPECT_DOUBLE_EQ(session.current_usage(), 0.75);
    EXPECT_EQ(provider->calls(), 3u);
}

TEST(BudgetEnforcementTest, ParentCap_BindsUncappedChild) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::ok("done", 0.3));
    client.register_endpoint(fast_endpoint("llm"), provider);

    auto session = client.open_scope(0.5);
    auto child = client.ledger().open_scope(std::nullopt, session.id());

    CallOptions opts;
    opts.scope = child.id();
    client.invoke("llm", "a", opts);

    try {
        client.invoke("llm", "b", opts);
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_EQ(e.scope_id(), session.id());
        EXPECT_TRUE(e.spend_occurred());
    }
    EXPECT_NEAR(child.current_usage(), 0.6, 1e-9);
}

TEST(BudgetEnforcementTest, ClosedScope_KeepsFinalTotal) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::ok("done", 0.1));
    client.register_endpoint(fast_endpoint("llm"), provider);

    ScopeId id = 0;
    {
        auto scope = client.open_scope(1.0);
        id = scope.id();
        CallOptions opts;
        opts.scope = id;
        client.invoke("llm", "a", opts);
        scope.close();
        EXPECT_DOUBLE_EQ(scope.current_usage(), 0.1);
    }

    EXPECT_FALSE(client.ledger().is_open(id));
    CallOptions stale;
    stale.scope = id;
    EXPECT_THROW(client.invoke("llm", "b", stale), ScopeClosedException);
}

// ===========================================================================
// Unmetered calls leave every scope untouched
// ===========================================================================

TEST(BudgetEnforcementTest, UnscopedCall_IsNotMetered) {
    Client client;
    auto provider = std::make_shared<MockProvider>();
    provider->set_default(MockProvider::ok("done", 5.0));
    client.register_endpoint(fast_endpoint("llm"), provider);

    auto scope = client.open_scope(1.0);
    EXPECT_EQ(client.invoke("llm", "free"), "done");
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.0);
}
