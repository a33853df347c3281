#include "api_client.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace finly {

using json = nlohmann::json;

static std::unique_ptr<KeyValueStore> require_store(std::unique_ptr<KeyValueStore> store) {
    if (!store) throw std::invalid_argument("ApiClient requires a store");
    return store;
}

ApiClient::ApiClient(const Config& config, HttpClient& http,
                     std::unique_ptr<KeyValueStore> store,
                     RetryExecutor::Sleeper sleeper, CacheStore::Clock clock)
    : config_(config),
      store_(require_store(std::move(store))),
      tokens_(*store_, http, config_, &bus_),
      cache_(*store_, config_.cache, std::move(clock)),
      retry_(std::move(sleeper), &bus_),
      pipeline_(config_, http, tokens_, cache_, retry_, &bus_) {}

ApiClient::ApiClient(const Config& config, HttpClient& http)
    : ApiClient(config, http, create_store(config)) {}

ApiResult ApiClient::get(const std::string& path, const RequestOptions& options) {
    return pipeline_.get(path, options);
}

ApiResult ApiClient::post(const std::string& path, const json& body,
                          const RequestOptions& options) {
    return pipeline_.post(path, body, options);
}

ApiResult ApiClient::put(const std::string& path, const json& body,
                         const RequestOptions& options) {
    return pipeline_.put(path, body, options);
}

ApiResult ApiClient::patch(const std::string& path, const json& body,
                           const RequestOptions& options) {
    return pipeline_.patch(path, body, options);
}

ApiResult ApiClient::del(const std::string& path, const RequestOptions& options) {
    return pipeline_.del(path, options);
}

// ── Session ─────────────────────────────────────────────────────

ApiResult ApiClient::adopt_session(ApiResult result) {
    if (!result.ok()) return result;

    auto tokens = tokens_from_json(result.data);
    if (!tokens) return result;

    try {
        tokens_.set_tokens(*tokens);
        if (result.data.contains("user")) {
            store_->set(kUserDataKey, result.data["user"].dump());
        }
    } catch (const std::exception& e) {
        std::cerr << "[auth] Failed to persist session: " << e.what() << '\n';
        ApiError error;
        error.kind = ErrorKind::InvalidResponse;
        error.status_code = 200;
        error.message = std::string("Session could not be saved: ") + e.what();
        return ApiResult::failure(std::move(error));
    }

    TokensRefreshedEvent ev;
    ev.from_refresh = false;
    publish(&bus_, ev);
    return result;
}

ApiResult ApiClient::login(const std::string& email, const std::string& password) {
    json body = {{"email", email}, {"password", password}};
    return adopt_session(pipeline_.post("auth/login", body));
}

ApiResult ApiClient::signup(const std::string& name, const std::string& email,
                            const std::string& password) {
    json body = {{"name", name}, {"email", email}, {"password", password}};
    return adopt_session(pipeline_.post("auth/signup", body));
}

ApiResult ApiClient::verify_email(const std::string& email, const std::string& otp) {
    json body = {{"email", email}, {"otp", otp}};
    return adopt_session(pipeline_.post("auth/verify-email", body));
}

void ApiClient::logout() {
    if (tokens_.is_authenticated()) {
        ApiResult result = pipeline_.post("auth/logout", json::object());
        if (!result.ok()) {
            std::cerr << "[auth] Server logout failed, clearing local session anyway: "
                      << result.error.describe() << '\n';
        }
    }
    pipeline_.wait_idle();
    tokens_.clear_tokens();
    cache_.clear();
}

bool ApiClient::is_authenticated() const {
    return tokens_.is_authenticated();
}

std::optional<json> ApiClient::cached_user() const {
    try {
        auto raw = store_->get(kUserDataKey);
        if (!raw) return std::nullopt;
        return json::parse(*raw);
    } catch (const std::exception& e) {
        std::cerr << "[auth] Stored user unreadable: " << e.what() << '\n';
        return std::nullopt;
    }
}

void ApiClient::wait_idle() {
    pipeline_.wait_idle();
}

} // namespace finly
