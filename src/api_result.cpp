#include "api_result.hpp"

namespace finly {

using json = nlohmann::json;

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::Transport:       return "transport";
        case ErrorKind::Server:          return "server";
        case ErrorKind::Client:          return "client";
        case ErrorKind::Auth:            return "auth";
        case ErrorKind::RateLimit:       return "rate_limit";
        case ErrorKind::RefreshFailed:   return "refresh_failed";
        case ErrorKind::InvalidResponse: return "invalid_response";
    }
    return "unknown";
}

ErrorKind classify_status(long status_code) {
    if (status_code == 0) return ErrorKind::Transport;
    if (status_code == 401) return ErrorKind::Auth;
    if (status_code == 429) return ErrorKind::RateLimit;
    if (status_code >= 500 && status_code <= 599) return ErrorKind::Server;
    if (status_code >= 400) return ErrorKind::Client;
    return ErrorKind::None;
}

std::string ApiError::describe() const {
    std::string out = error_kind_name(kind);
    if (status_code != 0) out += " (HTTP " + std::to_string(status_code) + ")";
    if (!code.empty()) out += " [" + code + "]";
    if (!message.empty()) out += ": " + message;
    return out;
}

ApiResult ApiResult::from_data(json data) {
    ApiResult result;
    result.success = true;
    result.data = std::move(data);
    return result;
}

ApiResult ApiResult::failure(ApiError error) {
    ApiResult result;
    result.success = false;
    result.error = std::move(error);
    return result;
}

namespace {

// Copy backend-provided error details from an envelope body, if it has one.
void fill_from_envelope(const json& body, ApiError& err) {
    if (!body.is_object()) return;
    if (body.contains("message") && body["message"].is_string())
        err.message = body["message"].get<std::string>();
    if (!body.contains("error") || !body["error"].is_object()) return;

    const auto& e = body["error"];
    if (e.contains("code") && e["code"].is_string())
        err.code = e["code"].get<std::string>();
    if (e.contains("message") && e["message"].is_string())
        err.message = e["message"].get<std::string>();
    if (e.contains("details"))
        err.details = e["details"];
}

long envelope_status(const json& body) {
    if (!body.is_object() || !body.contains("error") || !body["error"].is_object())
        return 0;
    const auto& e = body["error"];
    if (e.contains("statusCode") && e["statusCode"].is_number_integer())
        return e["statusCode"].get<long>();
    return 0;
}

} // namespace

ApiResult parse_envelope(const HttpResponse& response) {
    ApiError err;
    err.status_code = response.status_code;

    if (response.status_code == 0) {
        err.kind = ErrorKind::Transport;
        err.message = "No response from server";
        if (!response.error.empty()) err.message += ": " + response.error;
        return ApiResult::failure(std::move(err));
    }

    bool is_2xx = response.status_code >= 200 && response.status_code < 300;

    json body;
    bool parsed = false;
    if (!response.body.empty()) {
        try {
            body = json::parse(response.body);
            parsed = true;
        } catch (const json::parse_error&) {
            parsed = false;
        }
    }

    if (!is_2xx) {
        err.kind = classify_status(response.status_code);
        if (err.kind == ErrorKind::None) err.kind = ErrorKind::Client; // 1xx / 3xx
        if (parsed) fill_from_envelope(body, err);
        if (err.message.empty())
            err.message = "Request failed with status " + std::to_string(response.status_code);
        return ApiResult::failure(std::move(err));
    }

    if (response.body.empty()) {
        return ApiResult::from_data(nullptr);
    }

    if (!parsed || !body.is_object()) {
        err.kind = ErrorKind::InvalidResponse;
        err.message = "Response is not a JSON envelope";
        return ApiResult::failure(std::move(err));
    }

    bool success = body.contains("success") && body["success"].is_boolean() &&
                   body["success"].get<bool>();
    if (!success) {
        long status = envelope_status(body);
        if (status != 0) err.status_code = status;
        err.kind = classify_status(err.status_code);
        if (err.kind == ErrorKind::None) err.kind = ErrorKind::Client;
        fill_from_envelope(body, err);
        if (err.message.empty()) err.message = "Request was not successful";
        return ApiResult::failure(std::move(err));
    }

    ApiResult result = ApiResult::from_data(body.contains("data") ? body["data"] : json());
    if (body.contains("message") && body["message"].is_string())
        result.message = body["message"].get<std::string>();
    return result;
}

} // namespace finly
