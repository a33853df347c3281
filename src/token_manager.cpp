#include "token_manager.hpp"
#include <iostream>
#include <stdexcept>

namespace finly {

using json = nlohmann::json;

std::optional<TokenPair> tokens_from_json(const json& data) {
    if (!data.is_object() || !data.contains("tokens") || !data["tokens"].is_object())
        return std::nullopt;
    const auto& t = data["tokens"];
    TokenPair pair;
    pair.access_token = t.value("accessToken", "");
    pair.refresh_token = t.value("refreshToken", "");
    if (pair.access_token.empty()) return std::nullopt;
    return pair;
}

TokenManager::TokenManager(KeyValueStore& store, HttpClient& http,
                           const Config& config, EventBus* bus)
    : store_(store), http_(http), config_(config), bus_(bus) {
    load();
}

void TokenManager::load() {
    try {
        auto access = store_.get(kAccessTokenKey);
        if (!access || access->empty()) return;
        TokenPair pair;
        pair.access_token = *access;
        pair.refresh_token = store_.get(kRefreshTokenKey).value_or("");
        tokens_ = std::move(pair);
    } catch (const std::exception& e) {
        std::cerr << "[auth] Failed to load stored tokens: " << e.what() << '\n';
    }
}

std::optional<std::string> TokenManager::get_access_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tokens_) return std::nullopt;
    return tokens_->access_token;
}

std::optional<std::string> TokenManager::get_refresh_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tokens_ || tokens_->refresh_token.empty()) return std::nullopt;
    return tokens_->refresh_token;
}

bool TokenManager::is_authenticated() const {
    return get_access_token().has_value();
}

void TokenManager::set_tokens(const TokenPair& tokens) {
    store_.set(kAccessTokenKey, tokens.access_token);
    store_.set(kRefreshTokenKey, tokens.refresh_token);
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = tokens;
}

std::string TokenManager::attach_auth(std::vector<Header>& headers) const {
    auto token = get_access_token();
    if (!token) return "";
    headers.emplace_back("Authorization", "Bearer " + *token);
    return *token;
}

void TokenManager::clear_tokens() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_.reset();
    }
    try {
        store_.remove_many({kAccessTokenKey, kRefreshTokenKey, kUserDataKey, kTokenExpiryKey});
    } catch (const std::exception& e) {
        std::cerr << "[auth] Failed to clear stored tokens: " << e.what() << '\n';
    }
}

RefreshResult TokenManager::refresh(const std::string& stale_access_token) {
    std::shared_future<RefreshResult> shared;
    std::promise<RefreshResult> promise;
    std::string refresh_token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_.valid()) {
            shared = in_flight_;
        } else if (!stale_access_token.empty() && tokens_ &&
                   tokens_->access_token != stale_access_token) {
            // Someone already refreshed after this caller's request went out.
            RefreshResult current;
            current.success = true;
            current.tokens = *tokens_;
            return current;
        } else if (!stale_access_token.empty() && !tokens_) {
            // The session was already torn down by an earlier failed refresh.
            RefreshResult gone;
            gone.error.kind = ErrorKind::RefreshFailed;
            gone.error.message = "Session already expired";
            gone.error.session_expired = true;
            return gone;
        } else {
            in_flight_ = promise.get_future().share();
            refresh_token = tokens_ ? tokens_->refresh_token : "";
        }
    }
    if (shared.valid()) return shared.get();

    RefreshResult result;
    try {
        result = do_refresh(refresh_token);
    } catch (const std::exception& e) {
        result.success = false;
        result.error.kind = ErrorKind::RefreshFailed;
        result.error.message = std::string("Token refresh failed: ") + e.what();
    }

    if (result.success) {
        try {
            set_tokens(result.tokens);
        } catch (const std::exception& e) {
            std::cerr << "[auth] Refreshed tokens could not be persisted: "
                      << e.what() << '\n';
            std::lock_guard<std::mutex> lock(mutex_);
            tokens_ = result.tokens;
        }
    } else {
        clear_tokens();
        result.error.session_expired = true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = std::shared_future<RefreshResult>();
    }
    promise.set_value(result);

    if (result.success) {
        std::cerr << "[auth] Access token refreshed\n";
        TokensRefreshedEvent ev;
        ev.from_refresh = true;
        publish(bus_, ev);
    } else {
        std::cerr << "[auth] Refresh failed, session cleared: "
                  << result.error.describe() << '\n';
        SessionExpiredEvent ev;
        ev.reason = result.error.message;
        publish(bus_, ev);
    }
    return result;
}

RefreshResult TokenManager::do_refresh(const std::string& refresh_token) {
    RefreshResult result;
    result.error.kind = ErrorKind::RefreshFailed;

    if (refresh_token.empty()) {
        result.error.message = "No refresh token stored";
        return result;
    }

    HttpRequest req;
    req.method = "POST";
    req.url = config_.api_url(kRefreshEndpoint);
    req.body = json{{"refreshToken", refresh_token}}.dump();
    req.headers = {{"Content-Type", "application/json"}};
    req.timeout_seconds = config_.timeout_seconds;

    ApiResult response = parse_envelope(http_.send(req));
    if (!response.ok()) {
        result.error.status_code = response.error.status_code;
        result.error.code = response.error.code;
        result.error.message = "Token refresh rejected: " + response.error.message;
        return result;
    }

    auto tokens = tokens_from_json(response.data);
    if (!tokens) {
        result.error.status_code = 200;
        result.error.message = "Refresh response carried no tokens";
        return result;
    }
    // Servers that do not rotate refresh tokens omit it.
    if (tokens->refresh_token.empty()) tokens->refresh_token = refresh_token;

    result.success = true;
    result.tokens = std::move(*tokens);
    result.error = ApiError{};
    return result;
}

} // namespace finly
