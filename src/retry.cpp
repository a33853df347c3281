#include "retry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <thread>

namespace finly {

bool default_retry_predicate(const ApiError& error) {
    return error.kind == ErrorKind::Transport || error.kind == ErrorKind::Server;
}

bool service_unavailable_predicate(const ApiError& error) {
    return error.status_code == 503;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt) {
    if (attempt == 0) return std::chrono::milliseconds(0);
    double factor = std::pow(policy.backoff_multiplier, static_cast<double>(attempt - 1));
    double ms = static_cast<double>(policy.base_delay.count()) * factor;
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(ms)));
}

// 1 + retries, saturating instead of wrapping to zero attempts.
static uint32_t attempts_for(uint32_t retries) {
    return retries == UINT32_MAX ? retries : retries + 1;
}

static RetryPolicy base_policy(const RetryConfig& config) {
    RetryPolicy p;
    p.base_delay = std::chrono::milliseconds(config.base_delay_ms);
    p.backoff_multiplier = config.backoff_multiplier;
    return p;
}

RetryPolicy read_policy(const RetryConfig& config) {
    RetryPolicy p = base_policy(config);
    p.max_attempts = attempts_for(config.max_retries);
    p.retry_predicate = default_retry_predicate;
    return p;
}

RetryPolicy create_policy(const RetryConfig& config) {
    RetryPolicy p = base_policy(config);
    p.max_attempts = attempts_for(config.max_retries);
    p.retry_predicate = service_unavailable_predicate;
    return p;
}

RetryPolicy update_policy(const RetryConfig& config) {
    RetryPolicy p = base_policy(config);
    p.max_attempts = attempts_for(std::min<uint32_t>(config.max_retries, 1));
    p.retry_predicate = default_retry_predicate;
    return p;
}

RetryExecutor::RetryExecutor(Sleeper sleeper, EventBus* bus)
    : sleeper_(std::move(sleeper)), bus_(bus), default_predicate_(default_retry_predicate) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

} // namespace finly
