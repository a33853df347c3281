#pragma once
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace finly {

enum class ErrorKind {
    None,
    Transport,       // no response received
    Server,          // 5xx
    Client,          // 4xx other than 401 / 429
    Auth,            // 401
    RateLimit,       // 429
    RefreshFailed,   // refresh endpoint rejected the session
    InvalidResponse  // 2xx with a body that is not a valid envelope
};

const char* error_kind_name(ErrorKind kind);

// Map an HTTP status to its error class. 0 means no response.
ErrorKind classify_status(long status_code);

struct ApiError {
    ErrorKind kind = ErrorKind::None;
    long status_code = 0;
    std::string code;          // backend error code, if any
    std::string message;
    nlohmann::json details;
    bool session_expired = false; // local tokens were wiped; caller must re-authenticate

    // One-line human readable summary
    std::string describe() const;
};

// Caller-facing result of every client operation. Expected conditions
// (cache miss, stale entry) never surface here as errors.
struct ApiResult {
    bool success = false;
    nlohmann::json data;       // envelope `data`, null when absent
    std::string message;       // envelope `message`
    ApiError error;
    bool from_cache = false;
    bool stale = false;        // served from cache past its fresh TTL

    bool ok() const { return success; }

    static ApiResult from_data(nlohmann::json data);
    static ApiResult failure(ApiError error);
};

// Decode the `{success, data?, message?, error?}` envelope. `success:false`
// is treated exactly like a transport-level error of the embedded status.
ApiResult parse_envelope(const HttpResponse& response);

} // namespace finly
