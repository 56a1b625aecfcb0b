#pragma once

#include "core/result.hpp"
#include "sync/cancellation.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace tidesync::sync {

struct RetryConfig {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double max_jitter{0.3};  // fraction of the delay
};

/**
 * RetryPolicy - exponential backoff with jitter for transient remote
 * failures.
 *
 * Delay before attempt n+1 is min(base * 2^(n-1), max) plus a uniform
 * jitter of up to max_jitter of that delay. A RateLimited error carrying
 * a retry-after (Error::detail, seconds) waits at least that long.
 * ServerResponseLost is retried once at most.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Jitter = std::function<double()>;  // uniform in [0, 1)

    explicit RetryPolicy(RetryConfig config = {}, Sleeper sleeper = {}, Jitter jitter = {});

    [[nodiscard]] const RetryConfig& config() const { return config_; }

    /**
     * `attempt` is the number of attempts already made (1 after the first failure).
     */
    [[nodiscard]] bool should_retry(const Error& error, int attempt) const;

    [[nodiscard]] std::chrono::milliseconds delay_for(const Error& error, int attempt) const;

    /**
     * Run `op` until it succeeds, fails with a non-retryable error, runs out
     * of attempts, or the token is cancelled (Cancelled error).
     */
    template<typename F>
    [[nodiscard]] auto run(F&& op, const std::shared_ptr<CancellationToken>& token) const -> decltype(op()) {
        using ResultType = decltype(op());
        int attempt = 1;
        while (true) {
            auto result = op();
            if (result.is_ok()) {
                return result;
            }
            const auto& error = result.unwrap_err();
            if (!should_retry(error, attempt)) {
                return result;
            }
            if (token && token->is_cancelled()) {
                return ResultType::err(Error{"Cancelled while waiting to retry: " + error.message,
                                             ErrorCode::Cancelled});
            }
            const auto delay = delay_for(error, attempt);
            report_retry(error, attempt, delay);
            sleeper_(delay);
            ++attempt;
        }
    }

private:
    static void report_retry(const Error& error, int attempt, std::chrono::milliseconds delay);

    RetryConfig config_;
    Sleeper sleeper_;
    Jitter jitter_;
};

} // namespace tidesync::sync
