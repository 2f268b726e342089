#include <gtest/gtest.h>
#include <callguard/callguard.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;

namespace {

// Records every event it sees
class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    std::size_t count(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
            [type](const MonitorEvent& e) { return e.type == type; }));
    }

    std::vector<MonitorEvent> events;

private:
    std::mutex mutex_;
};

// Fails whenever it is told a scope closed
class FailingCloseMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        if (event.type == EventType::ScopeClosed) {
            throw std::runtime_error("monitor backend unavailable");
        }
    }
};

} // namespace

// ===========================================================================
// Scope lifecycle
// ===========================================================================

TEST(BudgetLedgerTest, OpenScope_StartsEmpty) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(5.0);

    EXPECT_TRUE(scope.is_open());
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.0);
    ASSERT_TRUE(scope.cap().has_value());
    EXPECT_DOUBLE_EQ(scope.cap().value(), 5.0);
    EXPECT_DOUBLE_EQ(scope.amount_left().value(), 5.0);
    EXPECT_EQ(ledger.open_scope_count(), 1u);
}

TEST(BudgetLedgerTest, OpenScope_NegativeCapRejected) {
    BudgetLedger ledger;
    EXPECT_THROW(ledger.open_scope(-1.0), InvalidRequestException);
}

TEST(BudgetLedgerTest, OpenScope_UnknownParentRejected) {
    BudgetLedger ledger;
    EXPECT_THROW(ledger.open_scope(1.0, ScopeId{42}), ScopeClosedException);
}

TEST(BudgetLedgerTest, UncappedScope_HasNoAmountLeft) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope();
    ledger.charge(scope.id(), 100.0);

    EXPECT_FALSE(scope.amount_left().has_value());
    EXPECT_DOUBLE_EQ(scope.current_usage(), 100.0);
}

TEST(BudgetLedgerTest, HandleDestruction_ClosesScope) {
    BudgetLedger ledger;
    ScopeId id = 0;
    {
        auto scope = ledger.open_scope(1.0);
        id = scope.id();
        EXPECT_TRUE(ledger.is_open(id));
    }
    EXPECT_FALSE(ledger.is_open(id));
    EXPECT_EQ(ledger.open_scope_count(), 0u);
}

TEST(BudgetLedgerTest, CloseTwice_IsNoOp) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    ledger.charge(scope.id(), 0.25);

    scope.close();
    EXPECT_FALSE(scope.is_open());
    EXPECT_NO_THROW(scope.close());
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.25);
}

TEST(BudgetLedgerTest, CloseScopeThroughLedger_HandleStillSafe) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    EXPECT_TRUE(ledger.close_scope(scope.id()));
    EXPECT_FALSE(ledger.close_scope(scope.id()));
    EXPECT_NO_THROW(scope.close());
}

TEST(BudgetLedgerTest, MovedHandle_OwnsScope) {
    BudgetLedger ledger;
    auto first = ledger.open_scope(1.0);
    ScopeId id = first.id();

    ScopeHandle second = std::move(first);
    EXPECT_TRUE(second.is_open());
    EXPECT_TRUE(ledger.is_open(id));

    second.close();
    EXPECT_FALSE(ledger.is_open(id));
}

TEST(BudgetLedgerTest, ChargeClosedScope_Throws) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    ScopeId id = scope.id();
    scope.close();

    EXPECT_THROW(ledger.charge(id, 0.1), ScopeClosedException);
    EXPECT_THROW(scope.open_child(0.5), ScopeClosedException);
}

TEST(BudgetLedgerTest, NegativeCharge_Rejected) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    EXPECT_THROW(ledger.charge(scope.id(), -0.5), InvalidRequestException);
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.0);
}

// ===========================================================================
// Nesting and propagation
// ===========================================================================

TEST(BudgetLedgerTest, ChildCharge_PropagatesToAncestors) {
    BudgetLedger ledger;
    auto outer = ledger.open_scope(10.0, std::nullopt, "outer");
    auto middle = outer.open_child(5.0, "middle");
    auto inner = middle.open_child(std::nullopt, "inner");

    ledger.charge(inner.id(), 1.5);
    ledger.charge(middle.id(), 0.5);

    EXPECT_DOUBLE_EQ(inner.current_usage(), 1.5);
    EXPECT_DOUBLE_EQ(middle.current_usage(), 2.0);
    EXPECT_DOUBLE_EQ(outer.current_usage(), 2.0);

    auto chain = ledger.scope_chain(inner.id());
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0], inner.id());
    EXPECT_EQ(chain[1], middle.id());
    EXPECT_EQ(chain[2], outer.id());
}

TEST(BudgetLedgerTest, Snapshot_ReportsStructure) {
    BudgetLedger ledger;
    auto parent = ledger.open_scope(2.0, std::nullopt, "parent");
    auto a = parent.open_child(1.0, "a");
    auto b = parent.open_child(1.0, "b");

    auto snap = ledger.snapshot(parent.id());
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->label, "parent");
    EXPECT_TRUE(snap->open);
    ASSERT_EQ(snap->children.size(), 2u);
    EXPECT_EQ(snap->children[0], a.id());
    EXPECT_EQ(snap->children[1], b.id());

    auto child_snap = ledger.snapshot(a.id());
    ASSERT_TRUE(child_snap.has_value());
    ASSERT_TRUE(child_snap->parent.has_value());
    EXPECT_EQ(child_snap->parent.value(), parent.id());
}

TEST(BudgetLedgerTest, ClosingParent_DetachesChildren) {
    BudgetLedger ledger;
    auto parent = ledger.open_scope(2.0);
    auto child = parent.open_child(1.0);
    ScopeId parent_id = parent.id();

    parent.close();
    EXPECT_TRUE(child.is_open());
    EXPECT_FALSE(ledger.snapshot(child.id())->parent.has_value());

    ledger.charge(child.id(), 0.5);
    EXPECT_DOUBLE_EQ(child.current_usage(), 0.5);
    EXPECT_FALSE(ledger.is_open(parent_id));
}

TEST(BudgetLedgerTest, ClosingChild_RemovesFromParent) {
    BudgetLedger ledger;
    auto parent = ledger.open_scope(2.0);
    {
        auto child = parent.open_child(1.0);
        ledger.charge(child.id(), 0.3);
    }
    EXPECT_TRUE(ledger.children(parent.id()).empty());
    // Spend recorded through the child stays with the parent
    EXPECT_DOUBLE_EQ(parent.current_usage(), 0.3);
}

// ===========================================================================
// Caps: prevention and detection
// ===========================================================================

TEST(BudgetLedgerTest, ChargeOverCap_RecordsThenThrows) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    ledger.charge(scope.id(), 0.6);

    try {
        ledger.charge(scope.id(), 0.6);
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_TRUE(e.spend_occurred());
        EXPECT_EQ(e.scope_id(), scope.id());
        EXPECT_DOUBLE_EQ(e.cap(), 1.0);
        EXPECT_DOUBLE_EQ(e.total(), 1.2);
    }
    // The spend is real and stays recorded
    EXPECT_DOUBLE_EQ(scope.current_usage(), 1.2);
}

TEST(BudgetLedgerTest, ChargeExactlyToCap_DoesNotThrow) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(1.0);
    EXPECT_NO_THROW(ledger.charge(scope.id(), 1.0));
    EXPECT_THROW(ledger.ensure_can_start(scope.id()), BudgetExceededException);
}

TEST(BudgetLedgerTest, EnsureCanStart_BlocksWithoutSpend) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(0.5);
    ledger.charge(scope.id(), 0.5);

    try {
        ledger.ensure_can_start(scope.id());
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_FALSE(e.spend_occurred());
    }
    EXPECT_DOUBLE_EQ(scope.current_usage(), 0.5);
}

TEST(BudgetLedgerTest, ZeroCap_BlocksImmediately) {
    BudgetLedger ledger;
    auto scope = ledger.open_scope(0.0);
    EXPECT_THROW(ledger.ensure_can_start(scope.id()), BudgetExceededException);
}

TEST(BudgetLedgerTest, AncestorCap_BlocksChild) {
    BudgetLedger ledger;
    auto outer = ledger.open_scope(1.0);
    auto inner = outer.open_child();  // uncapped

    ledger.charge(inner.id(), 1.0);
    try {
        ledger.ensure_can_start(inner.id());
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_EQ(e.scope_id(), outer.id());
        ASSERT_EQ(e.scope_chain().size(), 2u);
    }
}

TEST(BudgetLedgerTest, InnermostBreach_IsReported) {
    BudgetLedger ledger;
    auto outer = ledger.open_scope(1.0);
    auto inner = outer.open_child(0.5);

    try {
        ledger.charge(inner.id(), 2.0);
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_EQ(e.scope_id(), inner.id());
    }
    EXPECT_DOUBLE_EQ(outer.current_usage(), 2.0);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST(BudgetLedgerTest, ConcurrentCharges_AllRecorded) {
    constexpr int THREADS = 8;
    constexpr int CHARGES_PER_THREAD = 250;

    BudgetLedger ledger;
    auto outer = ledger.open_scope();
    auto inner = outer.open_child();

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < CHARGES_PER_THREAD; ++i) {
                ledger.charge(inner.id(), 0.01);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_NEAR(inner.current_usage(), THREADS * CHARGES_PER_THREAD * 0.01, 1e-6);
    EXPECT_NEAR(outer.current_usage(), inner.current_usage(), 1e-9);
}

// ===========================================================================
// Monitoring
// ===========================================================================

TEST(BudgetLedgerTest, Events_ReportLifecycleAndCharges) {
    auto monitor = std::make_shared<RecordingMonitor>();
    BudgetLedger ledger;
    ledger.set_monitor(monitor);

    {
        auto scope = ledger.open_scope(0.1);
        ledger.charge(scope.id(), 0.0);
        ledger.charge(scope.id(), 0.05);
        EXPECT_THROW(ledger.charge(scope.id(), 0.1), BudgetExceededException);
    }

    EXPECT_EQ(monitor->count(EventType::ScopeOpened), 1u);
    EXPECT_EQ(monitor->count(EventType::ZeroCharge), 1u);
    EXPECT_EQ(monitor->count(EventType::ScopeCharged), 2u);
    EXPECT_EQ(monitor->count(EventType::BudgetExceeded), 1u);
    EXPECT_EQ(monitor->count(EventType::ScopeClosed), 1u);
}

TEST(BudgetLedgerTest, MonitorThrowsOnClose_DestructorStillCloses) {
    BudgetLedger ledger;
    ledger.set_monitor(std::make_shared<FailingCloseMonitor>());

    ScopeId id = 0;
    {
        auto scope = ledger.open_scope(1.0);
        id = scope.id();
        ledger.charge(id, 0.25);
    }
    EXPECT_FALSE(ledger.is_open(id));

    auto reassigned = ledger.open_scope(1.0);
    ScopeId first = reassigned.id();
    reassigned = ledger.open_scope(2.0);
    EXPECT_FALSE(ledger.is_open(first));
    EXPECT_TRUE(reassigned.is_open());
}

TEST(BudgetLedgerTest, MonitorThrowsOnClose_ExplicitCloseReports) {
    BudgetLedger ledger;
    ledger.set_monitor(std::make_shared<FailingCloseMonitor>());

    auto scope = ledger.open_scope(1.0);
    ScopeId id = scope.id();
    EXPECT_THROW(scope.close(), std::runtime_error);
    EXPECT_FALSE(scope.is_open());
    EXPECT_FALSE(ledger.is_open(id));
    EXPECT_NO_THROW(scope.close());
}
