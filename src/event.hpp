#pragma once
#include <string>
#include <cstdint>

namespace finly {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TokensRefreshed      = "TokensRefreshed";
    constexpr const char* SessionExpired       = "SessionExpired";
    constexpr const char* RequestRetry         = "RequestRetry";
    constexpr const char* CacheInvalidated     = "CacheInvalidated";
    constexpr const char* RevalidationFinished = "RevalidationFinished";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// A new token pair was persisted (login, signup, or refresh).
struct TokensRefreshedEvent : Event {
    static constexpr const char* TAG = event_tags::TokensRefreshed;
    bool from_refresh = false; // false when set by login/signup

    TokensRefreshedEvent() { type_tag = TAG; }
};

// Local session state was wiped; the user has to log in again.
struct SessionExpiredEvent : Event {
    static constexpr const char* TAG = event_tags::SessionExpired;
    std::string reason;

    SessionExpiredEvent() { type_tag = TAG; }
};

struct RequestRetryEvent : Event {
    static constexpr const char* TAG = event_tags::RequestRetry;
    uint32_t attempt = 0;     // attempt that just failed (1-based)
    uint64_t delay_ms = 0;    // sleep before the next attempt
    long status_code = 0;

    RequestRetryEvent() { type_tag = TAG; }
};

struct CacheInvalidatedEvent : Event {
    static constexpr const char* TAG = event_tags::CacheInvalidated;
    std::string prefix;
    size_t removed = 0;

    CacheInvalidatedEvent() { type_tag = TAG; }
};

struct RevalidationFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::RevalidationFinished;
    std::string key;
    bool success = false;

    RevalidationFinishedEvent() { type_tag = TAG; }
};

} // namespace finly
