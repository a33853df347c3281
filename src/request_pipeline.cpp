#include "request_pipeline.hpp"
#include "cache_policy.hpp"
#include <iostream>

namespace finly {

using json = nlohmann::json;

namespace {

std::string path_of(const std::string& key) {
    auto q = key.find('?');
    return q == std::string::npos ? key : key.substr(0, q);
}

ApiResult from_cache(json payload, bool stale) {
    ApiResult result = ApiResult::from_data(std::move(payload));
    result.from_cache = true;
    result.stale = stale;
    return result;
}

} // namespace

RequestPipeline::RequestPipeline(const Config& config, HttpClient& http,
                                 TokenManager& tokens, CacheStore& cache,
                                 const RetryExecutor& retry, EventBus* bus)
    : config_(config), http_(http), tokens_(tokens), cache_(cache),
      retry_(retry), bus_(bus) {}

// ── Transport ───────────────────────────────────────────────────

ApiResult RequestPipeline::send_once(const std::string& method, const std::string& key,
                                     const std::string& body, long timeout_seconds,
                                     std::string& used_token) {
    HttpRequest req;
    req.method = method;
    req.url = config_.api_url(key);
    req.body = body;
    req.timeout_seconds = timeout_seconds;
    req.headers = {{"Accept", "application/json"}};
    if (!body.empty()) req.headers.emplace_back("Content-Type", "application/json");
    // Re-read per attempt so retries after a refresh carry the new token.
    used_token = tokens_.attach_auth(req.headers);

    HttpResponse response;
    try {
        response = http_.send(req);
    } catch (const std::exception& e) {
        ApiError error;
        error.kind = ErrorKind::Transport;
        error.message = e.what();
        return ApiResult::failure(std::move(error));
    }
    return parse_envelope(response);
}

ApiResult RequestPipeline::fetch(const std::string& method, const std::string& key,
                                 const json* body, const RequestOptions& options,
                                 const RetryPolicy& policy) {
    const std::string payload = body ? body->dump() : "";
    const long timeout = options.timeout_seconds.value_or(config_.timeout_seconds);
    std::string used_token;

    auto attempt = [&]() { return send_once(method, key, payload, timeout, used_token); };
    ApiResult result = retry_.execute(attempt, policy);

    const std::string path = path_of(key);
    if (result.error.kind != ErrorKind::Auth || cache_policy::is_public_endpoint(path)) {
        return result;
    }
    if (used_token.empty()) return result; // never authenticated, nothing to refresh

    std::cerr << "[api] " << method << " " << path << " got 401, refreshing session\n";
    RefreshResult refreshed = tokens_.refresh(used_token);
    if (!refreshed.success) {
        // The caller sees the original 401, flagged so it can route to login.
        result.error.session_expired = true;
        return result;
    }

    result = retry_.execute(attempt, policy);
    if (result.error.kind == ErrorKind::Auth) {
        std::cerr << "[api] " << method << " " << path
                  << " rejected again after refresh, ending session\n";
        tokens_.clear_tokens();
        result.error.session_expired = true;
        SessionExpiredEvent ev;
        ev.reason = "Request rejected after token refresh";
        publish(bus_, ev);
    }
    return result;
}

// ── Reads ───────────────────────────────────────────────────────

ApiResult RequestPipeline::get(const std::string& path, const RequestOptions& options) {
    const std::string key = make_cache_key(path, options.params);
    const bool caching = cache_.config().enabled;

    if (caching && !options.skip_cache) {
        CacheLookup hit = cache_.get(key);
        if (hit.freshness == Freshness::Fresh) {
            return from_cache(std::move(hit.payload), false);
        }
        if (hit.freshness == Freshness::Stale) {
            start_revalidation(key, options);
            return from_cache(std::move(hit.payload), true);
        }
    }

    uint64_t generation = cache_.generation();
    RetryPolicy policy = options.retry_policy.value_or(read_policy(config_.retry));
    ApiResult result = fetch("GET", key, nullptr, options, policy);

    if (result.ok()) {
        // Skipped when a mutation invalidated the cache while we were waiting.
        if (caching) cache_.set_if_current(key, result.data, generation);
        return result;
    }

    if (result.error.kind == ErrorKind::RateLimit && caching) {
        if (auto entry = cache_.peek(key)) {
            std::cerr << "[api] GET " << path_of(key)
                      << " rate limited, serving cached entry\n";
            return from_cache(std::move(entry->payload), true);
        }
    }
    return result;
}

void RequestPipeline::start_revalidation(const std::string& key,
                                         const RequestOptions& options) {
    if (!cache_.config().stale_while_revalidate) return;
    if (!cache_policy::revalidation_eligible(path_of(key))) return;
    {
        std::lock_guard<std::mutex> lock(revalidating_mutex_);
        if (!revalidating_.insert(key).second) return; // already refreshing
    }

    RequestOptions bg = options;
    bg.skip_cache = true;
    uint64_t generation = cache_.generation();

    auto job = [this, key, bg, generation]() {
        bool success = false;
        try {
            RetryPolicy policy = bg.retry_policy.value_or(read_policy(config_.retry));
            ApiResult result = fetch("GET", key, nullptr, bg, policy);
            if (result.ok()) {
                success = true;
                if (!cache_.set_if_current(key, result.data, generation)) {
                    std::cerr << "[cache] Revalidated " << key
                              << " dropped, invalidated meanwhile\n";
                }
            } else {
                std::cerr << "[cache] Revalidation of " << key << " failed: "
                          << result.error.describe() << '\n';
            }
        } catch (const std::exception& e) {
            std::cerr << "[cache] Revalidation of " << key << " failed: " << e.what() << '\n';
        }
        {
            std::lock_guard<std::mutex> lock(revalidating_mutex_);
            revalidating_.erase(key);
        }
        RevalidationFinishedEvent ev;
        ev.key = key;
        ev.success = success;
        publish(bus_, ev);
    };

    try {
        background_.spawn("revalidate " + key, std::move(job));
    } catch (const std::exception& e) {
        std::cerr << "[cache] Could not start revalidation of " << key << ": "
                  << e.what() << '\n';
        std::lock_guard<std::mutex> lock(revalidating_mutex_);
        revalidating_.erase(key);
    }
}

// ── Mutations ───────────────────────────────────────────────────

ApiResult RequestPipeline::mutate(const std::string& method, const std::string& path,
                                  const json* body, const RequestOptions& options,
                                  const RetryPolicy& default_policy) {
    const std::string key = make_cache_key(path, options.params);
    RetryPolicy policy = options.retry_policy.value_or(default_policy);
    ApiResult result = fetch(method, key, body, options, policy);
    if (!result.ok()) {
        std::cerr << "[api] " << method << " " << path_of(key) << " failed: "
                  << result.error.describe() << '\n';
        return result;
    }

    // Before returning, so any later read misses on the affected prefixes.
    for (const auto& prefix : cache_policy::invalidation_prefixes(path_of(key))) {
        size_t removed = cache_.invalidate(prefix);
        CacheInvalidatedEvent ev;
        ev.prefix = prefix;
        ev.removed = removed;
        publish(bus_, ev);
    }
    return result;
}

ApiResult RequestPipeline::post(const std::string& path, const json& body,
                                const RequestOptions& options) {
    return mutate("POST", path, &body, options, create_policy(config_.retry));
}

ApiResult RequestPipeline::put(const std::string& path, const json& body,
                               const RequestOptions& options) {
    return mutate("PUT", path, &body, options, update_policy(config_.retry));
}

ApiResult RequestPipeline::patch(const std::string& path, const json& body,
                                 const RequestOptions& options) {
    return mutate("PATCH", path, &body, options, update_policy(config_.retry));
}

ApiResult RequestPipeline::del(const std::string& path, const RequestOptions& options) {
    return mutate("DELETE", path, nullptr, options, update_policy(config_.retry));
}

void RequestPipeline::wait_idle() {
    background_.wait_idle();
}

size_t RequestPipeline::revalidations_running() const {
    return background_.running();
}

} // namespace finly
