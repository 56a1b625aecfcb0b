#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace tidesync::sync {

/**
 * CancellationToken - cooperative cancellation for one sync cycle.
 *
 * Set from any thread (a host expiration handler, a UI cancel button);
 * polled by the orchestrator between phases and batches. A token with a
 * deadline reports cancelled once the deadline has passed.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    [[nodiscard]] static std::shared_ptr<CancellationToken> with_budget(Clock::duration budget) {
        auto token = std::make_shared<CancellationToken>();
        token->set_deadline(Clock::now() + budget);
        return token;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    void set_deadline(Clock::time_point deadline) noexcept {
        deadline_ns_.store(deadline.time_since_epoch().count(), std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) return true;
        const auto deadline = deadline_ns_.load(std::memory_order_acquire);
        return deadline != kNoDeadline && Clock::now().time_since_epoch().count() >= deadline;
    }

    [[nodiscard]] bool was_cancelled_explicitly() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    static constexpr Clock::rep kNoDeadline = 0;

    std::atomic<bool> cancelled_{false};
    std::atomic<Clock::rep> deadline_ns_{kNoDeadline};
};

} // namespace tidesync::sync
