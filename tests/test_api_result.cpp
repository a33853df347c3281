#include <catch2/catch_test_macros.hpp>
#include "api_result.hpp"

using namespace finly;

// ── classify_status ──────────────────────────────────────────────

TEST_CASE("classify_status: maps status codes to error kinds", "[api_result]") {
    REQUIRE(classify_status(0) == ErrorKind::Transport);
    REQUIRE(classify_status(200) == ErrorKind::None);
    REQUIRE(classify_status(400) == ErrorKind::Client);
    REQUIRE(classify_status(401) == ErrorKind::Auth);
    REQUIRE(classify_status(403) == ErrorKind::Client);
    REQUIRE(classify_status(404) == ErrorKind::Client);
    REQUIRE(classify_status(429) == ErrorKind::RateLimit);
    REQUIRE(classify_status(500) == ErrorKind::Server);
    REQUIRE(classify_status(503) == ErrorKind::Server);
    REQUIRE(classify_status(599) == ErrorKind::Server);
}

// ── parse_envelope ───────────────────────────────────────────────

TEST_CASE("parse_envelope: success with data and message", "[api_result]") {
    HttpResponse resp{200, R"({"success":true,"data":{"id":7},"message":"Created"})"};
    auto r = parse_envelope(resp);
    REQUIRE(r.ok());
    REQUIRE(r.data["id"] == 7);
    REQUIRE(r.message == "Created");
    REQUIRE_FALSE(r.from_cache);
}

TEST_CASE("parse_envelope: success without data yields null", "[api_result]") {
    auto r = parse_envelope(HttpResponse{200, R"({"success":true})"});
    REQUIRE(r.ok());
    REQUIRE(r.data.is_null());
}

TEST_CASE("parse_envelope: empty 204 body is success", "[api_result]") {
    auto r = parse_envelope(HttpResponse{204, ""});
    REQUIRE(r.ok());
    REQUIRE(r.data.is_null());
}

TEST_CASE("parse_envelope: status 0 is a transport error", "[api_result]") {
    auto r = parse_envelope(HttpResponse{0, ""});
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error.kind == ErrorKind::Transport);
    REQUIRE(r.error.message == "No response from server");

    auto timed_out = parse_envelope(transport_failure("timed out"));
    REQUIRE(timed_out.error.message == "No response from server: timed out");
}

TEST_CASE("parse_envelope: non-2xx carries backend error details", "[api_result]") {
    HttpResponse resp{422, R"({"success":false,"error":{"code":"VALIDATION",
        "message":"amount must be positive","statusCode":422,"details":{"field":"amount"}}})"};
    auto r = parse_envelope(resp);
    REQUIRE(r.error.kind == ErrorKind::Client);
    REQUIRE(r.error.status_code == 422);
    REQUIRE(r.error.code == "VALIDATION");
    REQUIRE(r.error.message == "amount must be positive");
    REQUIRE(r.error.details["field"] == "amount");
}

TEST_CASE("parse_envelope: non-JSON error body still classified", "[api_result]") {
    auto r = parse_envelope(HttpResponse{502, "<html>Bad Gateway</html>"});
    REQUIRE(r.error.kind == ErrorKind::Server);
    REQUIRE(r.error.status_code == 502);
    REQUIRE_FALSE(r.error.message.empty());
}

TEST_CASE("parse_envelope: success:false on 200 uses embedded status", "[api_result]") {
    HttpResponse resp{200, R"({"success":false,"error":{"message":"busy","statusCode":503}})"};
    auto r = parse_envelope(resp);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error.kind == ErrorKind::Server);
    REQUIRE(r.error.status_code == 503);
    REQUIRE(r.error.message == "busy");
}

TEST_CASE("parse_envelope: success:false without status is a client error", "[api_result]") {
    auto r = parse_envelope(HttpResponse{200, R"({"success":false,"message":"nope"})"});
    REQUIRE(r.error.kind == ErrorKind::Client);
    REQUIRE(r.error.message == "nope");
}

TEST_CASE("parse_envelope: unparseable 2xx body is invalid response", "[api_result]") {
    REQUIRE(parse_envelope(HttpResponse{200, "not json"}).error.kind ==
            ErrorKind::InvalidResponse);
    REQUIRE(parse_envelope(HttpResponse{200, "[1,2]"}).error.kind ==
            ErrorKind::InvalidResponse);
}

TEST_CASE("parse_envelope: 401 and 429 keep their own kinds", "[api_result]") {
    REQUIRE(parse_envelope(HttpResponse{401, "{}"}).error.kind == ErrorKind::Auth);
    REQUIRE(parse_envelope(HttpResponse{429, "{}"}).error.kind == ErrorKind::RateLimit);
}

// ── describe ─────────────────────────────────────────────────────

TEST_CASE("ApiError::describe: includes kind, status and code", "[api_result]") {
    ApiError e;
    e.kind = ErrorKind::Client;
    e.status_code = 404;
    e.code = "NOT_FOUND";
    e.message = "Expense not found";
    REQUIRE(e.describe() == "client (HTTP 404) [NOT_FOUND]: Expense not found");
}
