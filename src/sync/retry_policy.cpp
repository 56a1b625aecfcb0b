#include "sync/retry_policy.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace tidesync::sync {

RetryPolicy::RetryPolicy(RetryConfig config, Sleeper sleeper, Jitter jitter)
    : config_(config)
    , sleeper_(std::move(sleeper))
    , jitter_(std::move(jitter))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (!jitter_) {
        jitter_ = []() {
            static thread_local std::mt19937 gen(std::random_device{}());
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(gen);
        };
    }
}

bool RetryPolicy::should_retry(const Error& error, int attempt) const {
    if (attempt >= config_.max_attempts || !is_transient(error.code)) {
        return false;
    }
    if (error.code == ErrorCode::ServerResponseLost) {
        return attempt < 2;
    }
    return true;
}

std::chrono::milliseconds RetryPolicy::delay_for(const Error& error, int attempt) const {
    using std::chrono::milliseconds;

    const int exponent = std::clamp(attempt - 1, 0, 30);
    const double exponential = static_cast<double>(config_.base_delay.count()) * static_cast<double>(1LL << exponent);
    const double capped = std::min(exponential, static_cast<double>(config_.max_delay.count()));
    const double jitter = std::clamp(jitter_(), 0.0, 1.0) * config_.max_jitter * capped;
    auto delay = milliseconds(static_cast<milliseconds::rep>(capped + jitter));

    if (error.code == ErrorCode::RateLimited && error.detail > 0) {
        delay = std::max(delay, milliseconds(static_cast<milliseconds::rep>(error.detail) * 1000));
    }
    return delay;
}

void RetryPolicy::report_retry(const Error& error, int attempt, std::chrono::milliseconds delay) {
    qCInfo(tidesyncRemoteLog) << "retrying after" << to_string(error.code).data()
                              << "attempt=" << attempt
                              << "delay_ms=" << static_cast<qint64>(delay.count());
}

} // namespace tidesync::sync
