#pragma once

#include "callguard/types.hpp"
#include "callguard/cancellation.hpp"
#include "callguard/config.hpp"
#include "callguard/monitor.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace callguard {

class AdmissionLimiter;

// Permission for one call to proceed. Holds an in-flight slot until
// released or destroyed. Must not outlive its limiter.
class Admission {
public:
    Admission() = default;
    ~Admission();

    Admission(const Admission&) = delete;
    Admission& operator=(const Admission&) = delete;
    Admission(Admission&& other) noexcept;
    Admission& operator=(Admission&& other) noexcept;

    TicketId ticket() const noexcept { return ticket_; }
    TokenCount reserved_tokens() const noexcept { return tokens_; }
    Timestamp granted_at() const noexcept { return granted_at_; }
    Duration waited() const noexcept { return waited_; }
    bool active() const noexcept { return limiter_ != nullptr; }

    // Replace the token estimate with actual usage. Never blocks or rejects.
    void reconcile(TokenCount actual_tokens);

    // Give back the request and its tokens as if it had never been admitted
    void refund();

    // Free the in-flight slot; the request keeps counting until it ages out
    void release();

private:
    friend class AdmissionLimiter;
    Admission(AdmissionLimiter* limiter, TicketId ticket, TokenCount tokens,
              Timestamp granted_at, Duration waited);

    AdmissionLimiter* limiter_{nullptr};
    TicketId ticket_{0};
    TokenCount tokens_{0};
    Timestamp granted_at_{};
    Duration waited_{};
};

// Per-endpoint request/token gate over a sliding window. Callers block
// until admitted and are served strictly in arrival order.
class AdmissionLimiter {
public:
    explicit AdmissionLimiter(EndpointConfig config,
                              Duration poll_interval = std::chrono::milliseconds(10));

    AdmissionLimiter(const AdmissionLimiter&) = delete;
    AdmissionLimiter& operator=(const AdmissionLimiter&) = delete;

    // Blocks until granted. Throws AdmissionTimeoutException once deadline
    // passes, CallCancelledException if cancel fires, QueueFullException
    // when too many callers already wait, and InvalidRequestException for a
    // token count no window could ever hold.
    Admission admit(TokenCount estimated_tokens,
                    std::optional<Timestamp> deadline = std::nullopt,
                    const CancellationToken* cancel = nullptr);

    // Non-blocking: admits only if nobody is queued and capacity is free.
    std::optional<Admission> try_admit(TokenCount estimated_tokens);

    // ==================== Queries ====================

    std::size_t requests_in_window() const;
    TokenCount tokens_in_window() const;
    std::size_t available_requests() const;
    TokenCount available_tokens() const;
    std::size_t in_flight() const;
    std::size_t queue_length() const;

    const EndpointConfig& config() const noexcept { return config_; }
    const EndpointId& endpoint() const noexcept { return config_.name; }

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    friend class Admission;

    struct Entry {
        TicketId ticket{0};
        Timestamp admitted_at{};
        TokenCount tokens{0};
        bool in_flight{true};
    };

    EndpointConfig config_;
    Duration poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // Admissions still counting against the window, oldest first
    std::deque<Entry> log_;
    TokenCount window_tokens_{0};
    std::size_t in_flight_{0};

    // Tickets waiting for admission, in arrival order
    std::deque<TicketId> waiters_;
    TicketId next_ticket_{1};

    std::shared_ptr<Monitor> monitor_;

    void check_token_request(TokenCount tokens) const;

    // Caller holds mutex_
    void prune_locked(Timestamp now);
    bool can_admit_locked(TokenCount tokens) const;
    std::optional<Timestamp> next_expiry_locked() const;
    Entry* find_locked(TicketId ticket);
    void remove_waiter_locked(TicketId ticket);

    // Called by Admission
    void reconcile(TicketId ticket, TokenCount actual_tokens);
    void refund(TicketId ticket);
    void release(TicketId ticket);

    void emit_event(EventType type, const std::string& message,
                    std::optional<TokenCount> tokens = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace callguard
