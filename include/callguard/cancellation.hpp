#pragma once

#include <atomic>
#include <memory>

namespace callguard {

// Shared flag a caller fires to abandon a pending call. Copies share state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { state_->store(true); }
    bool cancelled() const noexcept { return state_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace callguard
