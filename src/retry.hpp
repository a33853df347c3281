#pragma once
#include "api_result.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace finly {

using RetryPredicate = std::function<bool(const ApiError&)>;

struct RetryPolicy {
    uint32_t max_attempts = 4;                       // >= 1, includes the first try
    std::chrono::milliseconds base_delay{1000};
    double backoff_multiplier = 2.0;
    RetryPredicate retry_predicate;                  // empty = default predicate
};

// Network failures and 5xx are retryable; every 4xx is not.
bool default_retry_predicate(const ApiError& error);

// Only 503 Service Unavailable. Used for creates, where replaying a POST
// after an ambiguous network failure could duplicate the side effect.
bool service_unavailable_predicate(const ApiError& error);

// Delay slept after failed attempt `attempt` (1-based):
// base_delay * backoff_multiplier^(attempt-1).
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt);

// Per-verb policies derived from config.
RetryPolicy read_policy(const RetryConfig& config);    // GET: 1 + max_retries attempts
RetryPolicy create_policy(const RetryConfig& config);  // POST: retry on 503 only
RetryPolicy update_policy(const RetryConfig& config);  // PUT/PATCH/DELETE: one retry

// Runs a fallible operation, retrying transient failures with exponential
// backoff. The operation returns any result type exposing `bool ok()` and
// an `ApiError error` member.
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryExecutor(Sleeper sleeper = nullptr, EventBus* bus = nullptr);

    template <typename Op>
    auto execute(Op&& operation, const RetryPolicy& policy) const -> decltype(operation()) {
        if (policy.max_attempts == 0) {
            throw std::invalid_argument("RetryPolicy requires max_attempts >= 1");
        }
        const RetryPredicate& should_retry = policy.retry_predicate
            ? policy.retry_predicate
            : default_predicate_;

        for (uint32_t attempt = 1;; ++attempt) {
            auto result = operation();
            if (result.ok()) return result;

            // Fail fast: no delay after the last attempt or on a terminal error.
            if (attempt >= policy.max_attempts || !should_retry(result.error)) {
                return result;
            }

            auto delay = backoff_delay(policy, attempt);
            std::cerr << "[retry] Attempt " << attempt << "/" << policy.max_attempts
                      << " failed (" << result.error.describe() << "), retrying in "
                      << delay.count() << "ms\n";
            RequestRetryEvent ev;
            ev.attempt = attempt;
            ev.delay_ms = static_cast<uint64_t>(delay.count());
            ev.status_code = result.error.status_code;
            publish(bus_, ev);

            sleeper_(delay);
        }
    }

private:
    Sleeper sleeper_;
    EventBus* bus_;
    RetryPredicate default_predicate_;
};

} // namespace finly
