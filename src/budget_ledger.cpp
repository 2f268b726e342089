#include "callguard/budget_ledger.hpp"
#include "callguard/exceptions.hpp"

#include <algorithm>
#include <exception>

namespace callguard {

// ========== ScopeHandle ==========

ScopeHandle::ScopeHandle(BudgetLedger* ledger, ScopeId id, std::optional<Dollars> cap)
    : ledger_(ledger)
    , id_(id)
    , cap_(cap)
{}

ScopeHandle::~ScopeHandle() {
    close_quietly();
}

ScopeHandle::ScopeHandle(ScopeHandle&& other) noexcept
    : ledger_(other.ledger_)
    , id_(other.id_)
    , cap_(other.cap_)
    , final_usage_(other.final_usage_)
{
    other.ledger_ = nullptr;
}

ScopeHandle& ScopeHandle::operator=(ScopeHandle&& other) noexcept {
    if (this != &other) {
        close_quietly();
        ledger_ = other.ledger_;
        id_ = other.id_;
        cap_ = other.cap_;
        final_usage_ = other.final_usage_;
        other.ledger_ = nullptr;
    }
    return *this;
}

Dollars ScopeHandle::current_usage() const {
    if (!ledger_) return final_usage_;
    return ledger_->current_usage(id_);
}

std::optional<Dollars> ScopeHandle::amount_left() const {
    if (!cap_.has_value()) return std::nullopt;
    return cap_.value() - current_usage();
}

ScopeHandle ScopeHandle::open_child(std::optional<Dollars> cap, std::string label) {
    if (!ledger_) {
        throw ScopeClosedException(id_);
    }
    return ledger_->open_scope(cap, id_, std::move(label));
}

void ScopeHandle::close() {
    if (!ledger_) return;
    BudgetLedger* ledger = ledger_;
    ledger_ = nullptr;
    // Empty if the ledger already closed it through close_scope()
    if (auto total = ledger->close_and_report(id_)) {
        final_usage_ = total.value();
    }
}

// The scope is gone from the ledger before the monitor hears about it, so
// only the ScopeClosed notification is lost when a monitor throws here.
void ScopeHandle::close_quietly() noexcept {
    try {
        close();
    } catch (const std::exception&) {
    }
}

// ========== BudgetLedger ==========

ScopeHandle BudgetLedger::open_scope(std::optional<Dollars> cap,
                                     std::optional<ScopeId> parent,
                                     std::string label) {
    if (cap.has_value() && cap.value() < 0.0) {
        throw InvalidRequestException("Scope cap must be non-negative");
    }

    ScopeId id = 0;
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (parent.has_value()) {
            auto it = scopes_.find(parent.value());
            if (it == scopes_.end()) {
                throw ScopeClosedException(parent.value());
            }
            id = next_scope_id_++;
            it->second.children.insert(id);
        } else {
            id = next_scope_id_++;
        }

        Scope scope;
        scope.id = id;
        scope.label = label;
        scope.cap = cap;
        scope.parent = parent;
        scopes_.emplace(id, std::move(scope));
        mon = monitor_;
    }

    MonitorEvent event{};
    event.type = EventType::ScopeOpened;
    event.scope_id = id;
    event.amount = cap;
    event.message = label.empty() ? std::string("Scope opened")
                                  : "Scope opened: " + label;
    emit(mon, std::move(event));

    return ScopeHandle(this, id, cap);
}

bool BudgetLedger::close_scope(ScopeId id) {
    return close_and_report(id).has_value();
}

std::optional<Dollars> BudgetLedger::close_and_report(ScopeId id) {
    Dollars total = 0.0;
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scopes_.find(id);
        if (it == scopes_.end()) return std::nullopt;

        if (it->second.parent.has_value()) {
            auto parent_it = scopes_.find(it->second.parent.value());
            if (parent_it != scopes_.end()) {
                parent_it->second.children.erase(id);
            }
        }
        for (ScopeId child : it->second.children) {
            auto child_it = scopes_.find(child);
            if (child_it != scopes_.end()) {
                child_it->second.parent.reset();
            }
        }

        total = it->second.total;
        scopes_.erase(it);
        mon = monitor_;
    }

    MonitorEvent event{};
    event.type = EventType::ScopeClosed;
    event.scope_id = id;
    event.amount = total;
    event.message = "Scope closed";
    emit(mon, std::move(event));
    return total;
}

void BudgetLedger::charge(ScopeId scope, Dollars amount) {
    if (amount < 0.0) {
        throw InvalidRequestException("Charge amount must be non-negative, got " +
                                      std::to_string(amount));
    }

    std::optional<BudgetExceededException> breach;
    Dollars new_total = 0.0;
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scopes_.find(scope) == scopes_.end()) {
            throw ScopeClosedException(scope);
        }

        auto chain = chain_locked(scope);
        for (ScopeId id : chain) {
            scopes_.at(id).total += amount;
        }
        new_total = scopes_.at(scope).total;

        // Innermost breached scope is reported
        for (ScopeId id : chain) {
            const Scope& s = scopes_.at(id);
            if (s.cap.has_value() && s.total > s.cap.value()) {
                breach.emplace(id, s.cap.value(), s.total, true, chain);
                break;
            }
        }
        mon = monitor_;
    }

    MonitorEvent event{};
    event.type = (amount == 0.0) ? EventType::ZeroCharge : EventType::ScopeCharged;
    event.scope_id = scope;
    event.amount = amount;
    event.message = (amount == 0.0)
        ? std::string("Zero-cost charge recorded")
        : "Scope total now $" + std::to_string(new_total);
    emit(mon, std::move(event));

    if (breach.has_value()) {
        MonitorEvent exceeded{};
        exceeded.type = EventType::BudgetExceeded;
        exceeded.scope_id = breach->scope_id();
        exceeded.amount = breach->total();
        exceeded.message = breach->what();
        emit(mon, std::move(exceeded));
        throw *breach;
    }
}

void BudgetLedger::ensure_can_start(ScopeId scope) const {
    std::optional<BudgetExceededException> breach;
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scopes_.find(scope) == scopes_.end()) {
            throw ScopeClosedException(scope);
        }
        auto chain = chain_locked(scope);
        for (ScopeId id : chain) {
            const Scope& s = scopes_.at(id);
            if (s.cap.has_value() && s.total >= s.cap.value()) {
                breach.emplace(id, s.cap.value(), s.total, false, chain);
                break;
            }
        }
        mon = monitor_;
    }

    if (breach.has_value()) {
        MonitorEvent event{};
        event.type = EventType::BudgetExceeded;
        event.scope_id = breach->scope_id();
        event.amount = breach->total();
        event.message = breach->what();
        emit(mon, std::move(event));
        throw *breach;
    }
}

// ==================== Queries ====================

Dollars BudgetLedger::current_usage(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(scope).total;
}

std::optional<Dollars> BudgetLedger::amount_left(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Scope& s = find_locked(scope);
    if (!s.cap.has_value()) return std::nullopt;
    return s.cap.value() - s.total;
}

std::optional<ScopeSnapshot> BudgetLedger::snapshot(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return std::nullopt;

    const Scope& s = it->second;
    ScopeSnapshot snap;
    snap.id = s.id;
    snap.label = s.label;
    snap.cap = s.cap;
    snap.total = s.total;
    snap.parent = s.parent;
    snap.children.assign(s.children.begin(), s.children.end());
    std::sort(snap.children.begin(), snap.children.end());
    snap.open = true;
    return snap;
}

std::vector<ScopeId> BudgetLedger::children(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Scope& s = find_locked(scope);
    std::vector<ScopeId> result(s.children.begin(), s.children.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ScopeId> BudgetLedger::scope_chain(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    find_locked(scope);
    return chain_locked(scope);
}

bool BudgetLedger::is_open(ScopeId scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scopes_.find(scope) != scopes_.end();
}

std::size_t BudgetLedger::open_scope_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scopes_.size();
}

void BudgetLedger::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

// ==================== Internal Helpers ====================

std::vector<ScopeId> BudgetLedger::chain_locked(ScopeId scope) const {
    std::vector<ScopeId> chain;
    std::optional<ScopeId> current = scope;
    while (current.has_value()) {
        auto it = scopes_.find(current.value());
        if (it == scopes_.end()) break;
        chain.push_back(it->first);
        current = it->second.parent;
    }
    return chain;
}

const BudgetLedger::Scope& BudgetLedger::find_locked(ScopeId scope) const {
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        throw ScopeClosedException(scope);
    }
    return it->second;
}

} // namespace callguard
