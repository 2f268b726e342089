#include "callguard/admission_limiter.hpp"
#include "callguard/exceptions.hpp"

#include <algorithm>
#include <limits>

namespace callguard {

// ========== Admission ==========

Admission::Admission(AdmissionLimiter* limiter, TicketId ticket, TokenCount tokens,
                     Timestamp granted_at, Duration waited)
    : limiter_(limiter)
    , ticket_(ticket)
    , tokens_(tokens)
    , granted_at_(granted_at)
    , waited_(waited)
{}

Admission::~Admission() {
    release();
}

Admission::Admission(Admission&& other) noexcept
    : limiter_(other.limiter_)
    , ticket_(other.ticket_)
    , tokens_(other.tokens_)
    , granted_at_(other.granted_at_)
    , waited_(other.waited_)
{
    other.limiter_ = nullptr;
}

Admission& Admission::operator=(Admission&& other) noexcept {
    if (this != &other) {
        release();
        limiter_ = other.limiter_;
        ticket_ = other.ticket_;
        tokens_ = other.tokens_;
        granted_at_ = other.granted_at_;
        waited_ = other.waited_;
        other.limiter_ = nullptr;
    }
    return *this;
}

void Admission::reconcile(TokenCount actual_tokens) {
    if (!limiter_) return;
    limiter_->reconcile(ticket_, actual_tokens);
    tokens_ = std::max<TokenCount>(actual_tokens, 0);
}

void Admission::refund() {
    if (!limiter_) return;
    limiter_->refund(ticket_);
    limiter_ = nullptr;
}

void Admission::release() {
    if (!limiter_) return;
    limiter_->release(ticket_);
    limiter_ = nullptr;
}

// ========== AdmissionLimiter ==========

AdmissionLimiter::AdmissionLimiter(EndpointConfig config, Duration poll_interval)
    : config_(std::move(config))
    , poll_interval_(poll_interval)
{
    validate(config_);
    if (poll_interval_ <= Duration::zero()) {
        throw InvalidConfigException("poll_interval must be positive");
    }
}

Admission AdmissionLimiter::admit(TokenCount estimated_tokens,
                                  std::optional<Timestamp> deadline,
                                  const CancellationToken* cancel) {
    check_token_request(estimated_tokens);

    const auto submitted_at = Clock::now();
    std::unique_lock<std::mutex> lock(mutex_);

    if (waiters_.size() >= config_.max_queue_size) {
        throw QueueFullException(config_.name);
    }

    const TicketId ticket = next_ticket_++;
    waiters_.push_back(ticket);
    bool announced = false;

    while (true) {
        auto now = Clock::now();
        prune_locked(now);

        if (cancel != nullptr && cancel->cancelled()) {
            remove_waiter_locked(ticket);
            lock.unlock();
            emit_event(EventType::AdmissionCancelled, "Cancelled while queued",
                       estimated_tokens);
            CallRecord record;
            record.endpoint = config_.name;
            record.estimated_tokens = estimated_tokens;
            record.outcome = CallOutcome::Cancelled;
            record.started_at = submitted_at;
            record.finished_at = Clock::now();
            throw CallCancelledException(record);
        }

        if (waiters_.front() == ticket && can_admit_locked(estimated_tokens)) {
            waiters_.pop_front();
            log_.push_back(Entry{ticket, now, estimated_tokens, true});
            window_tokens_ += estimated_tokens;
            ++in_flight_;
            // The next head may fit as well
            cv_.notify_all();
            lock.unlock();

            Duration waited = now - submitted_at;
            emit_event(EventType::AdmissionGranted, "Admitted",
                       estimated_tokens,
                       std::chrono::duration<double, std::micro>(waited).count());
            return Admission(this, ticket, estimated_tokens, now, waited);
        }

        if (deadline.has_value() && now >= deadline.value()) {
            remove_waiter_locked(ticket);
            lock.unlock();
            Duration waited = now - submitted_at;
            emit_event(EventType::AdmissionTimedOut, "Admission deadline elapsed",
                       estimated_tokens,
                       std::chrono::duration<double, std::micro>(waited).count());
            throw AdmissionTimeoutException(config_.name, waited);
        }

        if (!announced) {
            announced = true;
            std::size_t ahead = waiters_.size() - 1;
            lock.unlock();
            emit_event(EventType::AdmissionQueued,
                       "Waiting behind " + std::to_string(ahead) + " callers",
                       estimated_tokens);
            lock.lock();
            continue;
        }

        // Sleep until something can change: the oldest entry ages out, the
        // deadline passes, or the cancel flag needs another look
        std::optional<Timestamp> wake = next_expiry_locked();
        if (deadline.has_value()) {
            wake = wake.has_value() ? std::min(wake.value(), deadline.value())
                                    : deadline.value();
        }
        if (cancel != nullptr) {
            Timestamp poll = now + poll_interval_;
            wake = wake.has_value() ? std::min(wake.value(), poll) : poll;
        }

        if (wake.has_value()) {
            cv_.wait_until(lock, wake.value());
        } else {
            // Only a release, refund or reconcile can make room
            cv_.wait(lock);
        }
    }
}

std::optional<Admission> AdmissionLimiter::try_admit(TokenCount estimated_tokens) {
    check_token_request(estimated_tokens);

    std::unique_lock<std::mutex> lock(mutex_);
    auto now = Clock::now();
    prune_locked(now);

    if (!waiters_.empty() || !can_admit_locked(estimated_tokens)) {
        return std::nullopt;
    }

    const TicketId ticket = next_ticket_++;
    log_.push_back(Entry{ticket, now, estimated_tokens, true});
    window_tokens_ += estimated_tokens;
    ++in_flight_;
    lock.unlock();

    emit_event(EventType::AdmissionGranted, "Admitted without waiting",
               estimated_tokens, 0.0);
    return Admission(this, ticket, estimated_tokens, now, Duration::zero());
}

// ==================== Queries ====================

std::size_t AdmissionLimiter::requests_in_window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = Clock::now() - config_.period;
    return static_cast<std::size_t>(std::count_if(log_.begin(), log_.end(),
        [cutoff](const Entry& e) { return e.in_flight || e.admitted_at > cutoff; }));
}

TokenCount AdmissionLimiter::tokens_in_window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = Clock::now() - config_.period;
    TokenCount sum = 0;
    for (auto& e : log_) {
        if (e.in_flight || e.admitted_at > cutoff) {
            sum += e.tokens;
        }
    }
    return sum;
}

std::size_t AdmissionLimiter::available_requests() const {
    if (config_.max_requests_per_period == 0) {
        return std::numeric_limits<std::size_t>::max();
    }
    std::size_t used = requests_in_window();
    return used >= config_.max_requests_per_period
               ? 0 : config_.max_requests_per_period - used;
}

TokenCount AdmissionLimiter::available_tokens() const {
    if (config_.max_tokens_per_period == 0) {
        return std::numeric_limits<TokenCount>::max();
    }
    return std::max<TokenCount>(config_.max_tokens_per_period - tokens_in_window(), 0);
}

std::size_t AdmissionLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t AdmissionLimiter::queue_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

void AdmissionLimiter::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

// ==================== Internal Helpers ====================

void AdmissionLimiter::check_token_request(TokenCount tokens) const {
    if (tokens < 0) {
        throw InvalidRequestException("Estimated tokens must be non-negative");
    }
    if (config_.max_tokens_per_period > 0 && tokens > config_.max_tokens_per_period) {
        throw InvalidRequestException(
            "Request for " + std::to_string(tokens) + " tokens can never fit the " +
            std::to_string(config_.max_tokens_per_period) + " token window of " +
            config_.name);
    }
}

void AdmissionLimiter::prune_locked(Timestamp now) {
    auto cutoff = now - config_.period;
    auto it = log_.begin();
    while (it != log_.end()) {
        // In-flight calls keep counting no matter how old they are
        if (!it->in_flight && it->admitted_at <= cutoff) {
            window_tokens_ -= it->tokens;
            it = log_.erase(it);
        } else {
            ++it;
        }
    }
}

bool AdmissionLimiter::can_admit_locked(TokenCount tokens) const {
    if (config_.max_requests_per_period > 0 &&
        log_.size() >= config_.max_requests_per_period) {
        return false;
    }
    if (config_.max_tokens_per_period > 0 &&
        window_tokens_ + tokens > config_.max_tokens_per_period) {
        return false;
    }
    if (config_.max_concurrent > 0 && in_flight_ >= config_.max_concurrent) {
        return false;
    }
    return true;
}

std::optional<Timestamp> AdmissionLimiter::next_expiry_locked() const {
    std::optional<Timestamp> earliest;
    for (auto& e : log_) {
        if (e.in_flight) continue;
        Timestamp expiry = e.admitted_at + config_.period;
        if (!earliest.has_value() || expiry < earliest.value()) {
            earliest = expiry;
        }
    }
    return earliest;
}

AdmissionLimiter::Entry* AdmissionLimiter::find_locked(TicketId ticket) {
    auto it = std::find_if(log_.begin(), log_.end(),
        [ticket](const Entry& e) { return e.ticket == ticket; });
    return (it != log_.end()) ? &*it : nullptr;
}

void AdmissionLimiter::remove_waiter_locked(TicketId ticket) {
    auto it = std::find(waiters_.begin(), waiters_.end(), ticket);
    if (it != waiters_.end()) {
        waiters_.erase(it);
    }
    // A new head may now be admissible
    cv_.notify_all();
}

void AdmissionLimiter::reconcile(TicketId ticket, TokenCount actual_tokens) {
    TokenCount actual = std::max<TokenCount>(actual_tokens, 0);
    TokenCount estimated = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = find_locked(ticket);
        if (entry == nullptr) return;
        estimated = entry->tokens;
        window_tokens_ += actual - estimated;
        entry->tokens = actual;
        if (actual < estimated) {
            cv_.notify_all();
        }
    }
    emit_event(EventType::TokensReconciled,
               "Estimated " + std::to_string(estimated) + ", used " + std::to_string(actual),
               actual);
}

void AdmissionLimiter::refund(TicketId ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(log_.begin(), log_.end(),
        [ticket](const Entry& e) { return e.ticket == ticket; });
    if (it == log_.end()) return;
    if (it->in_flight && in_flight_ > 0) {
        --in_flight_;
    }
    window_tokens_ -= it->tokens;
    log_.erase(it);
    cv_.notify_all();
}

void AdmissionLimiter::release(TicketId ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_locked(ticket);
    if (entry == nullptr || !entry->in_flight) return;
    entry->in_flight = false;
    if (in_flight_ > 0) {
        --in_flight_;
    }
    cv_.notify_all();
}

void AdmissionLimiter::emit_event(EventType type, const std::string& message,
                                  std::optional<TokenCount> tokens,
                                  std::optional<double> duration_us) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mon = monitor_;
    }
    if (!mon) return;

    MonitorEvent event{};
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.endpoint = config_.name;
    event.tokens = tokens;
    event.duration_us = duration_us;
    mon->on_event(event);
}

} // namespace callguard
