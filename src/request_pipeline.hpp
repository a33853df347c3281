#pragma once
#include "api_result.hpp"
#include "background.hpp"
#include "cache_store.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "retry.hpp"
#include "token_manager.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace finly {

struct RequestOptions {
    QueryParams params;
    bool skip_cache = false;                 // GET only: bypass the cache read
    std::optional<long> timeout_seconds;     // default: config.timeout_seconds
    std::optional<RetryPolicy> retry_policy; // default: per-verb policy
};

// Single entry point for every backend call. Composes TokenManager,
// RetryExecutor and CacheStore:
//
//   GET:       cache check -> fresh: return, stale: return + revalidate,
//              miss: network -> cache write (429 falls back to any entry)
//   mutations: network -> synchronous prefix invalidation
//
// Any non-public request that fails with 401 refreshes the session once
// and is replayed once with the new token.
class RequestPipeline {
public:
    RequestPipeline(const Config& config, HttpClient& http, TokenManager& tokens,
                    CacheStore& cache, const RetryExecutor& retry,
                    EventBus* bus = nullptr);

    RequestPipeline(const RequestPipeline&) = delete;
    RequestPipeline& operator=(const RequestPipeline&) = delete;

    ApiResult get(const std::string& path, const RequestOptions& options = {});
    ApiResult post(const std::string& path, const nlohmann::json& body,
                   const RequestOptions& options = {});
    ApiResult put(const std::string& path, const nlohmann::json& body,
                  const RequestOptions& options = {});
    ApiResult patch(const std::string& path, const nlohmann::json& body,
                    const RequestOptions& options = {});
    ApiResult del(const std::string& path, const RequestOptions& options = {});

    // Block until every background revalidation has finished.
    void wait_idle();

    size_t revalidations_running() const;

private:
    ApiResult fetch(const std::string& method, const std::string& key,
                    const nlohmann::json* body, const RequestOptions& options,
                    const RetryPolicy& policy);
    ApiResult send_once(const std::string& method, const std::string& key,
                        const std::string& body, long timeout_seconds,
                        std::string& used_token);
    ApiResult mutate(const std::string& method, const std::string& path,
                     const nlohmann::json* body, const RequestOptions& options,
                     const RetryPolicy& default_policy);
    void start_revalidation(const std::string& key, const RequestOptions& options);

    const Config& config_;
    HttpClient& http_;
    TokenManager& tokens_;
    CacheStore& cache_;
    const RetryExecutor& retry_;
    EventBus* bus_;

    mutable std::mutex revalidating_mutex_;
    std::set<std::string> revalidating_;

    // Last member: joined before anything a job touches is destroyed.
    BackgroundTasks background_;
};

} // namespace finly
