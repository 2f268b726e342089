#pragma once

#include "callguard/types.hpp"
#include "callguard/monitor.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace callguard {

class BudgetLedger;

// Read-only view of one spending scope
struct ScopeSnapshot {
    ScopeId id{0};
    std::string label;
    std::optional<Dollars> cap;
    Dollars total{0.0};
    std::optional<ScopeId> parent;
    std::vector<ScopeId> children;
    bool open{false};
};

// RAII ownership of an open scope. Closing happens on destruction or
// on an explicit close(); a second close is a no-op. An exception thrown
// by the monitor propagates from close() but not from the destructor or
// move assignment.
class ScopeHandle {
public:
    ScopeHandle() = default;
    ~ScopeHandle();

    ScopeHandle(const ScopeHandle&) = delete;
    ScopeHandle& operator=(const ScopeHandle&) = delete;
    ScopeHandle(ScopeHandle&& other) noexcept;
    ScopeHandle& operator=(ScopeHandle&& other) noexcept;

    ScopeId id() const noexcept { return id_; }
    bool is_open() const noexcept { return ledger_ != nullptr; }

    // Live total while open, final total once closed
    Dollars current_usage() const;
    std::optional<Dollars> cap() const noexcept { return cap_; }
    std::optional<Dollars> amount_left() const;

    ScopeHandle open_child(std::optional<Dollars> cap = std::nullopt,
                           std::string label = {});

    void close();

private:
    friend class BudgetLedger;
    ScopeHandle(BudgetLedger* ledger, ScopeId id, std::optional<Dollars> cap);
    void close_quietly() noexcept;

    BudgetLedger* ledger_{nullptr};
    ScopeId id_{0};
    std::optional<Dollars> cap_;
    Dollars final_usage_{0.0};
};

// Nested spending scopes shared by every call that runs under them.
// The ledger must outlive the handles it hands out.
class BudgetLedger {
public:
    BudgetLedger() = default;

    BudgetLedger(const BudgetLedger&) = delete;
    BudgetLedger& operator=(const BudgetLedger&) = delete;

    // ==================== Scope Lifecycle ====================

    // cap: nullopt means unlimited. parent must be open if given.
    ScopeHandle open_scope(std::optional<Dollars> cap = std::nullopt,
                           std::optional<ScopeId> parent = std::nullopt,
                           std::string label = {});

    // Returns false if the scope is unknown or already closed.
    // Open children are detached and become roots.
    bool close_scope(ScopeId id);

    // ==================== Charging ====================

    // Records amount against scope and every ancestor, then throws
    // BudgetExceededException (spend_occurred = true) if any capped
    // scope in the chain went over its cap.
    void charge(ScopeId scope, Dollars amount);

    // Throws BudgetExceededException (spend_occurred = false) if a capped
    // scope in the chain is already at or over its cap.
    void ensure_can_start(ScopeId scope) const;

    // ==================== Queries ====================

    Dollars current_usage(ScopeId scope) const;
    std::optional<Dollars> amount_left(ScopeId scope) const;
    std::optional<ScopeSnapshot> snapshot(ScopeId scope) const;
    std::vector<ScopeId> children(ScopeId scope) const;

    // scope first, outermost ancestor last
    std::vector<ScopeId> scope_chain(ScopeId scope) const;

    bool is_open(ScopeId scope) const;
    std::size_t open_scope_count() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct Scope {
        ScopeId id{0};
        std::string label;
        std::optional<Dollars> cap;
        Dollars total{0.0};
        std::optional<ScopeId> parent;
        std::unordered_set<ScopeId> children;
    };

    mutable std::mutex mutex_;
    std::unordered_map<ScopeId, Scope> scopes_;
    ScopeId next_scope_id_{1};
    std::shared_ptr<Monitor> monitor_;

    friend class ScopeHandle;

    // Final total, or nullopt if the scope was not open
    std::optional<Dollars> close_and_report(ScopeId id);

    // Caller holds mutex_
    std::vector<ScopeId> chain_locked(ScopeId scope) const;
    const Scope& find_locked(ScopeId scope) const;
};

} // namespace callguard
