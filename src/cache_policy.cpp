#include "cache_policy.hpp"
#include "util.hpp"
#include <algorithm>

namespace finly {
namespace cache_policy {

namespace {

constexpr uint64_t kMinute = 60 * 1000;

struct EndpointTtl {
    const char* prefix;
    uint64_t fresh_ms;
    uint64_t stale_ms;
};

const EndpointTtl kEndpointTtls[] = {
    {"categories",               5 * kMinute, 15 * kMinute},
    {"categories/setup-status",  2 * kMinute,  5 * kMinute},
    {"expenses",                 2 * kMinute,  5 * kMinute},
    {"analytics/stats",          2 * kMinute,  5 * kMinute},
    {"analytics/insights",       5 * kMinute, 10 * kMinute},
    {"analytics/daily-spending", 2 * kMinute,  5 * kMinute},
    {"analytics/trend",          2 * kMinute,  5 * kMinute},
    {"analytics/transactions",   1 * kMinute,  3 * kMinute},
};

struct InvalidationRule {
    const char* resource;
    std::vector<std::string> prefixes;
};

// Categories carry derived totals and analytics aggregate expense data,
// so expense writes reach both.
const std::vector<InvalidationRule>& invalidation_rules() {
    static const std::vector<InvalidationRule> rules = {
        {"expenses",      {"expenses", "categories", "analytics"}},
        {"categories",    {"categories", "analytics"}},
        {"income",        {"income", "analytics"}},
        {"tags",          {"tags", "expenses"}},
        {"subscriptions", {"subscriptions"}},
        {"auth",          {"auth"}},
        {"import",        {"expenses", "categories", "income", "analytics", "tags"}},
    };
    return rules;
}

const char* const kRevalidationAllowlist[] = {
    "categories",
    "expenses",
    "analytics",
    "income",
    "tags",
};

const char* const kPublicEndpoints[] = {
    "auth/login",
    "auth/signup",
    "auth/refresh-token",
    "auth/verify-email",
    "auth/forgot-password",
    "auth/reset-password",
};

// "expenses" matches "expenses" and "expenses/..." but not "expensesx".
bool path_under(const std::string& path, const std::string& prefix) {
    if (!starts_with(path, prefix)) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/' ||
           path[prefix.size()] == '?';
}

} // namespace

CacheTtl ttl_for(const std::string& path, const CacheConfig& defaults) {
    std::string p = normalize_path(path);
    CacheTtl ttl{defaults.ttl_fresh_ms, defaults.ttl_stale_ms};

    size_t best_len = 0;
    for (const auto& e : kEndpointTtls) {
        std::string prefix(e.prefix);
        if (path_under(p, prefix) && prefix.size() > best_len) {
            best_len = prefix.size();
            ttl = CacheTtl{e.fresh_ms, e.stale_ms};
        }
    }

    ttl.fresh_ms = std::min(ttl.fresh_ms, ttl.stale_ms);
    return ttl;
}

std::string resource_of(const std::string& path) {
    std::string p = normalize_path(path);
    size_t end = p.find_first_of("/?");
    return end == std::string::npos ? p : p.substr(0, end);
}

std::vector<std::string> invalidation_prefixes(const std::string& path) {
    std::string resource = resource_of(path);
    for (const auto& rule : invalidation_rules()) {
        if (resource == rule.resource) return rule.prefixes;
    }
    if (resource.empty()) return {};
    return {resource};
}

bool revalidation_eligible(const std::string& path) {
    std::string p = normalize_path(path);
    for (const char* prefix : kRevalidationAllowlist) {
        if (path_under(p, prefix)) return true;
    }
    return false;
}

bool is_public_endpoint(const std::string& path) {
    std::string p = normalize_path(path);
    for (const char* endpoint : kPublicEndpoints) {
        if (path_under(p, endpoint)) return true;
    }
    return false;
}

} // namespace cache_policy
} // namespace finly
