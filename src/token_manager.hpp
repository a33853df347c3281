#pragma once
#include "api_result.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "store.hpp"
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace finly {

// ── Store keys ───────────────────────────────────────────────────
constexpr const char* kAccessTokenKey  = "auth:access_token";
constexpr const char* kRefreshTokenKey = "auth:refresh_token";
constexpr const char* kUserDataKey     = "auth:user";
constexpr const char* kTokenExpiryKey  = "auth:token_expiry";

constexpr const char* kRefreshEndpoint = "auth/refresh-token";

// Opaque bearer strings; never parsed here.
struct TokenPair {
    std::string access_token;
    std::string refresh_token;
};

struct RefreshResult {
    bool success = false;
    TokenPair tokens;
    ApiError error;
};

// Extract `tokens` from an auth envelope's data object
// ({"tokens": {"accessToken", "refreshToken"}}).
std::optional<TokenPair> tokens_from_json(const nlohmann::json& data);

// Owns the access/refresh token pair. Tokens are mirrored in memory and
// persisted in the KeyValueStore. Refresh is single-flight: concurrent
// callers share one refresh call and its outcome.
class TokenManager {
public:
    TokenManager(KeyValueStore& store, HttpClient& http, const Config& config,
                 EventBus* bus = nullptr);

    std::optional<std::string> get_access_token() const;
    std::optional<std::string> get_refresh_token() const;
    bool is_authenticated() const;

    // Persist a new pair (login, signup, refresh).
    void set_tokens(const TokenPair& tokens);

    // Adds `Authorization: Bearer <token>` when a token exists; otherwise
    // leaves the request unauthenticated. Returns the token that was attached.
    std::string attach_auth(std::vector<Header>& headers) const;

    // Refresh the pair. If a refresh is already in flight the caller waits
    // for that same operation. If `stale_access_token` is given and the
    // stored token has already moved past it, the stored pair is returned
    // without a network call. On failure every stored token is wiped and
    // SessionExpired is published.
    RefreshResult refresh(const std::string& stale_access_token = "");

    // Delete all auth-related entries (logout, irrecoverable refresh failure).
    void clear_tokens();

private:
    RefreshResult do_refresh(const std::string& refresh_token);
    void load();

    KeyValueStore& store_;
    HttpClient& http_;
    const Config& config_;
    EventBus* bus_;

    mutable std::mutex mutex_;
    std::optional<TokenPair> tokens_;
    std::shared_future<RefreshResult> in_flight_;
};

} // namespace finly
