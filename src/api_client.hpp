#pragma once
#include "api_result.hpp"
#include "cache_store.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "request_pipeline.hpp"
#include "retry.hpp"
#include "store.hpp"
#include "token_manager.hpp"
#include <memory>
#include <optional>
#include <string>

namespace finly {

// Application-scoped client. Owns the persistent store and every
// component of the request path; callers construct one and pass it
// around instead of reaching for globals.
class ApiClient {
public:
    // `sleeper` and `clock` default to real time; tests inject their own.
    ApiClient(const Config& config, HttpClient& http,
              std::unique_ptr<KeyValueStore> store,
              RetryExecutor::Sleeper sleeper = nullptr,
              CacheStore::Clock clock = nullptr);

    // Store created from config.store.
    ApiClient(const Config& config, HttpClient& http);

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    // ── Requests ────────────────────────────────────────────────
    ApiResult get(const std::string& path, const RequestOptions& options = {});
    ApiResult post(const std::string& path, const nlohmann::json& body = nlohmann::json::object(),
                   const RequestOptions& options = {});
    ApiResult put(const std::string& path, const nlohmann::json& body,
                  const RequestOptions& options = {});
    ApiResult patch(const std::string& path, const nlohmann::json& body,
                    const RequestOptions& options = {});
    ApiResult del(const std::string& path, const RequestOptions& options = {});

    // ── Session ─────────────────────────────────────────────────
    ApiResult login(const std::string& email, const std::string& password);

    // Accounts start unverified: tokens usually arrive with verify_email().
    ApiResult signup(const std::string& name, const std::string& email,
                     const std::string& password);
    ApiResult verify_email(const std::string& email, const std::string& otp);

    // Tells the server, then wipes tokens, user data and the response cache
    // whatever the server answered.
    void logout();

    bool is_authenticated() const;

    // User object saved by the last login or verification.
    std::optional<nlohmann::json> cached_user() const;

    // Block until background revalidations are done.
    void wait_idle();

    const Config& config() const { return config_; }
    EventBus& events() { return bus_; }
    TokenManager& tokens() { return tokens_; }
    CacheStore& cache() { return cache_; }

private:
    // Persist tokens (and user) from an auth response's data.
    ApiResult adopt_session(ApiResult result);

    Config config_;
    EventBus bus_;
    std::unique_ptr<KeyValueStore> store_;
    TokenManager tokens_;
    CacheStore cache_;
    RetryExecutor retry_;
    RequestPipeline pipeline_;
};

} // namespace finly
