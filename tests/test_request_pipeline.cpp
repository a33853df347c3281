#include <catch2/catch_test_macros.hpp>
#include "request_pipeline.hpp"
#include "mock_http_client.hpp"
#include "mock_store.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace finly;
using json = nlohmann::json;
using std::chrono::milliseconds;

static constexpr uint64_t kMinute = 60 * 1000;

// Path and query after the API prefix: "http://test/api/v1/expenses?x=1" -> "expenses?x=1".
static std::string endpoint(const HttpRequest& req) {
    static const std::string prefix = "http://test/api/v1/";
    return req.url.compare(0, prefix.size(), prefix) == 0 ? req.url.substr(prefix.size())
                                                          : req.url;
}

static std::string bearer(const HttpRequest& req) {
    std::string auth = find_header(req.headers, "Authorization");
    return auth.size() > 7 ? auth.substr(7) : "";
}

struct PipelineFixture {
    Config config;
    MockStore store;
    MockHttpClient http;
    EventBus bus;
    std::atomic<uint64_t> now{10'000'000};
    std::mutex sleep_mutex;
    std::vector<milliseconds> sleeps;

    std::unique_ptr<TokenManager> tokens;
    std::unique_ptr<CacheStore> cache;
    std::unique_ptr<RetryExecutor> retry;
    std::unique_ptr<RequestPipeline> pipeline;

    PipelineFixture() {
        config.base_url = "http://test";
    }

    ~PipelineFixture() {
        if (pipeline) pipeline->wait_idle();
    }

    void seed_tokens(const std::string& access, const std::string& refresh) {
        store.set(kAccessTokenKey, access);
        store.set(kRefreshTokenKey, refresh);
    }

    // Build the component graph after config and store are prepared.
    RequestPipeline& start() {
        tokens = std::make_unique<TokenManager>(store, http, config, &bus);
        cache = std::make_unique<CacheStore>(store, config.cache, [this] { return now.load(); });
        retry = std::make_unique<RetryExecutor>([this](milliseconds d) {
            std::lock_guard<std::mutex> lock(sleep_mutex);
            sleeps.push_back(d);
        }, &bus);
        pipeline = std::make_unique<RequestPipeline>(config, http, *tokens, *cache, *retry, &bus);
        return *pipeline;
    }

    int calls_to(const std::string& ep) const {
        int n = 0;
        for (const auto& r : http.requests()) {
            if (endpoint(r) == ep) n++;
        }
        return n;
    }
};

// ── End-to-end cache consistency ─────────────────────────────────

TEST_CASE("RequestPipeline: expense write invalidates categories, then cache hits again", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("access", "refresh");
    f.http.handler = [](const HttpRequest& req) {
        if (endpoint(req) == "categories") return ok_response(json::array({{{"name", "Food"}}}));
        if (endpoint(req) == "expenses" && req.method == "POST")
            return ok_response({{"id", 1}}, 201);
        return error_response(404, "not found");
    };
    auto& p = f.start();

    auto first = p.get("categories");
    REQUIRE(first.ok());
    REQUIRE_FALSE(first.from_cache);
    REQUIRE(f.calls_to("categories") == 1);

    auto created = p.post("expenses", {{"amount", 12.5}, {"categoryId", "food"}});
    REQUIRE(created.ok());
    REQUIRE(created.data["id"] == 1);

    auto after_write = p.get("categories");
    REQUIRE(after_write.ok());
    REQUIRE_FALSE(after_write.from_cache);
    REQUIRE(f.calls_to("categories") == 2);

    f.now += 60 * 1000;
    auto hit = p.get("categories");
    REQUIRE(hit.ok());
    REQUIRE(hit.from_cache);
    REQUIRE_FALSE(hit.stale);
    REQUIRE(hit.data[0]["name"] == "Food");
    REQUIRE(f.calls_to("categories") == 2);
}

TEST_CASE("RequestPipeline: invalidation leaves unrelated prefixes cached", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("access", "refresh");
    f.http.handler = [](const HttpRequest& req) {
        if (req.method == "POST") return ok_response(json::object(), 201);
        return ok_response({{"ep", endpoint(req)}});
    };
    auto& p = f.start();

    REQUIRE(p.get("subscriptions").ok());
    REQUIRE(p.get("income").ok());
    REQUIRE(p.get("analytics/stats").ok());
    REQUIRE(p.post("expenses", {{"amount", 3}}).ok());

    REQUIRE(p.get("subscriptions").from_cache);
    REQUIRE(p.get("income").from_cache);
    REQUIRE_FALSE(p.get("analytics/stats").from_cache);
}

TEST_CASE("RequestPipeline: mutation publishes one event per invalidated prefix", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = ok_response(json::object());
    std::vector<std::string> prefixes;
    subscribe<CacheInvalidatedEvent>(f.bus, [&](const CacheInvalidatedEvent& ev) {
        prefixes.push_back(ev.prefix);
    });
    auto& p = f.start();

    REQUIRE(p.del("expenses/9").ok());
    REQUIRE(prefixes == std::vector<std::string>{"expenses", "categories", "analytics"});
}

TEST_CASE("RequestPipeline: failed mutation does not invalidate", "[pipeline]") {
    PipelineFixture f;
    f.http.handler = [](const HttpRequest& req) {
        if (req.method == "GET") return ok_response(json::array());
        return error_response(422, "invalid amount", "VALIDATION");
    };
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    auto result = p.post("expenses", {{"amount", -1}});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.kind == ErrorKind::Client);
    REQUIRE(result.error.code == "VALIDATION");
    REQUIRE(p.get("categories").from_cache);
}

TEST_CASE("RequestPipeline: mutations are never cached", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = ok_response({{"ok", true}});
    auto& p = f.start();

    REQUIRE(p.put("goals/1", {{"target", 100}}).ok());
    REQUIRE(p.patch("goals/1", {{"target", 200}}).ok());
    REQUIRE(f.cache->size() == 0);
    REQUIRE(f.http.call_count() == 2);
}

// ── Request shape ────────────────────────────────────────────────

TEST_CASE("RequestPipeline: GET sends canonical URL and bearer token", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("tok-1", "r");
    f.http.next_response = ok_response(json::array());
    auto& p = f.start();

    RequestOptions opts;
    opts.params = {{"month", "3"}, {"category", "food & drink"}};
    REQUIRE(p.get("/expenses", opts).ok());

    auto req = f.http.last_request();
    REQUIRE(req.method == "GET");
    REQUIRE(req.url == "http://test/api/v1/expenses?category=food%20%26%20drink&month=3");
    REQUIRE(bearer(req) == "tok-1");
    REQUIRE(req.body.empty());
    REQUIRE(req.timeout_seconds == 30);
}

TEST_CASE("RequestPipeline: mutation sends JSON body and per-request timeout", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = ok_response(json::object());
    auto& p = f.start();

    RequestOptions opts;
    opts.timeout_seconds = 5;
    REQUIRE(p.patch("expenses/4", {{"note", "lunch"}}, opts).ok());

    auto req = f.http.last_request();
    REQUIRE(req.method == "PATCH");
    REQUIRE(json::parse(req.body)["note"] == "lunch");
    REQUIRE(find_header(req.headers, "Content-Type") == "application/json");
    REQUIRE(req.timeout_seconds == 5);
    REQUIRE(bearer(req).empty());
}

TEST_CASE("RequestPipeline: DELETE has no body", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = HttpResponse{204, ""};
    auto& p = f.start();

    REQUIRE(p.del("tags/2").ok());
    REQUIRE(f.http.last_request().method == "DELETE");
    REQUIRE(f.http.last_request().body.empty());
}

// ── Cache options ────────────────────────────────────────────────

TEST_CASE("RequestPipeline: skip_cache bypasses a fresh entry and refreshes it", "[pipeline]") {
    PipelineFixture f;
    int version = 0;
    f.http.handler = [&](const HttpRequest&) { return ok_response({{"v", ++version}}); };
    auto& p = f.start();

    REQUIRE(p.get("categories").data["v"] == 1);
    RequestOptions opts;
    opts.skip_cache = true;
    auto forced = p.get("categories", opts);
    REQUIRE_FALSE(forced.from_cache);
    REQUIRE(forced.data["v"] == 2);

    auto cached = p.get("categories");
    REQUIRE(cached.from_cache);
    REQUIRE(cached.data["v"] == 2);
}

TEST_CASE("RequestPipeline: disabled cache always hits the network", "[pipeline]") {
    PipelineFixture f;
    f.config.cache.enabled = false;
    f.http.next_response = ok_response(json::array());
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    REQUIRE(p.get("categories").ok());
    REQUIRE(f.http.call_count() == 2);
    REQUIRE(f.cache->size() == 0);
}

TEST_CASE("RequestPipeline: different query params are cached separately", "[pipeline]") {
    PipelineFixture f;
    f.http.handler = [](const HttpRequest& req) { return ok_response({{"ep", endpoint(req)}}); };
    auto& p = f.start();

    RequestOptions march;
    march.params = {{"month", "3"}};
    RequestOptions april;
    april.params = {{"month", "4"}};

    REQUIRE(p.get("expenses", march).data["ep"] == "expenses?month=3");
    REQUIRE(p.get("expenses", april).data["ep"] == "expenses?month=4");
    REQUIRE(p.get("expenses?month=3").from_cache);
    REQUIRE(f.http.call_count() == 2);
}

// ── Stale-while-revalidate ───────────────────────────────────────

TEST_CASE("RequestPipeline: stale hit returns immediately and revalidates in background", "[pipeline]") {
    PipelineFixture f;
    int version = 0;
    f.http.handler = [&](const HttpRequest&) { return ok_response({{"v", ++version}}); };
    std::vector<RevalidationFinishedEvent> finished;
    std::mutex finished_mutex;
    subscribe<RevalidationFinishedEvent>(f.bus, [&](const RevalidationFinishedEvent& ev) {
        std::lock_guard<std::mutex> lock(finished_mutex);
        finished.push_back(ev);
    });
    auto& p = f.start();

    REQUIRE(p.get("categories").data["v"] == 1);
    f.now += 6 * kMinute; // categories: fresh 5m, stale 15m

    auto stale = p.get("categories");
    REQUIRE(stale.ok());
    REQUIRE(stale.from_cache);
    REQUIRE(stale.stale);
    REQUIRE(stale.data["v"] == 1);

    p.wait_idle();
    REQUIRE(f.http.call_count() == 2);
    REQUIRE(finished.size() == 1);
    REQUIRE(finished[0].key == "categories");
    REQUIRE(finished[0].success);

    auto refreshed = p.get("categories");
    REQUIRE(refreshed.from_cache);
    REQUIRE_FALSE(refreshed.stale);
    REQUIRE(refreshed.data["v"] == 2);
}

TEST_CASE("RequestPipeline: stale hit outside the allowlist is not revalidated", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = ok_response(json::array());
    auto& p = f.start();

    REQUIRE(p.get("subscriptions").ok());
    f.now += 6 * kMinute; // default ttl: fresh 5m, stale 10m

    auto stale = p.get("subscriptions");
    REQUIRE(stale.stale);
    p.wait_idle();
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: revalidation can be switched off", "[pipeline]") {
    PipelineFixture f;
    f.config.cache.stale_while_revalidate = false;
    f.http.next_response = ok_response(json::array());
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    f.now += 6 * kMinute;
    REQUIRE(p.get("categories").stale);
    p.wait_idle();
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: expired entry is a miss", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = ok_response(json::array());
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    f.now += 16 * kMinute;
    auto result = p.get("categories");
    REQUIRE_FALSE(result.from_cache);
    REQUIRE(f.http.call_count() == 2);
}

TEST_CASE("RequestPipeline: background failure is swallowed and entry kept", "[pipeline]") {
    PipelineFixture f;
    f.config.retry.max_retries = 0;
    std::atomic<int> calls{0};
    f.http.handler = [&](const HttpRequest&) {
        if (calls++ == 0) return ok_response({{"v", 1}});
        return error_response(500, "boom");
    };
    bool success = true;
    subscribe<RevalidationFinishedEvent>(f.bus, [&](const RevalidationFinishedEvent& ev) {
        success = ev.success;
    });
    auto& p = f.start();

    REQUIRE(p.get("expenses").ok());
    f.now += 3 * kMinute; // expenses: fresh 2m, stale 5m
    auto stale = p.get("expenses");
    REQUIRE(stale.ok());
    p.wait_idle();

    REQUIRE_FALSE(success);
    auto again = p.get("expenses");
    REQUIRE(again.from_cache);
    REQUIRE(again.data["v"] == 1);
}

TEST_CASE("RequestPipeline: concurrent stale hits start one revalidation", "[pipeline]") {
    PipelineFixture f;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> calls{0};
    f.http.handler = [&](const HttpRequest&) {
        if (calls++ > 0) opened.wait();
        return ok_response({{"v", calls.load()}});
    };
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    f.now += 6 * kMinute;
    for (int i = 0; i < 5; i++) {
        REQUIRE(p.get("categories").stale);
    }
    REQUIRE(p.revalidations_running() == 1);
    gate.set_value();
    p.wait_idle();
    REQUIRE(calls.load() == 2);
    REQUIRE(p.revalidations_running() == 0);
}

TEST_CASE("RequestPipeline: revalidation result is dropped if a mutation invalidated meanwhile", "[pipeline]") {
    PipelineFixture f;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> category_calls{0};
    f.http.handler = [&](const HttpRequest& req) {
        if (req.method == "POST") return ok_response(json::object(), 201);
        if (category_calls++ > 0) opened.wait();
        return ok_response({{"v", category_calls.load()}});
    };
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    f.now += 6 * kMinute;
    REQUIRE(p.get("categories").stale);       // background fetch now blocked
    REQUIRE(p.post("expenses", {{"amount", 1}}).ok());

    gate.set_value();
    p.wait_idle();
    REQUIRE_FALSE(f.cache->peek("categories").has_value());
}

// ── Retry ────────────────────────────────────────────────────────

TEST_CASE("RequestPipeline: GET retries 5xx with exponential backoff", "[pipeline]") {
    PipelineFixture f;
    f.http.response_queue = {
        error_response(502, "bad gateway"),
        HttpResponse{0, ""},
        ok_response({{"ok", true}}),
    };
    auto& p = f.start();

    auto result = p.get("analytics/stats");
    REQUIRE(result.ok());
    REQUIRE(f.http.call_count() == 3);
    REQUIRE(f.sleeps == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000)});
}

TEST_CASE("RequestPipeline: GET gives up after 1 + max_retries attempts", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(500, "down");
    auto& p = f.start();

    auto result = p.get("categories");
    REQUIRE(result.error.kind == ErrorKind::Server);
    REQUIRE(f.http.call_count() == 4);
    REQUIRE(f.sleeps.size() == 3);
}

TEST_CASE("RequestPipeline: POST retries only on 503", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(500, "down");
    auto& p = f.start();

    REQUIRE_FALSE(p.post("expenses", {{"amount", 1}}).ok());
    REQUIRE(f.http.call_count() == 1);

    f.http.reset();
    f.http.response_queue = {error_response(503, "busy"), ok_response(json::object(), 201)};
    REQUIRE(p.post("expenses", {{"amount", 1}}).ok());
    REQUIRE(f.http.call_count() == 2);
}

TEST_CASE("RequestPipeline: POST is not replayed after a transport failure", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = HttpResponse{0, ""};
    auto& p = f.start();

    auto result = p.post("expenses", {{"amount", 1}});
    REQUIRE(result.error.kind == ErrorKind::Transport);
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: updates and deletes get one retry", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(500, "down");
    auto& p = f.start();

    REQUIRE_FALSE(p.put("expenses/1", {{"amount", 2}}).ok());
    REQUIRE(f.http.call_count() == 2);
    f.http.reset();
    REQUIRE_FALSE(p.del("expenses/1").ok());
    REQUIRE(f.http.call_count() == 2);
}

TEST_CASE("RequestPipeline: per-request retry policy override", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(500, "down");
    auto& p = f.start();

    RequestOptions opts;
    RetryPolicy once;
    once.max_attempts = 1;
    opts.retry_policy = once;
    REQUIRE_FALSE(p.get("categories", opts).ok());
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: client errors are surfaced without retry", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(404, "Expense not found", "NOT_FOUND");
    auto& p = f.start();

    auto result = p.get("expenses/404");
    REQUIRE(result.error.kind == ErrorKind::Client);
    REQUIRE(result.error.status_code == 404);
    REQUIRE(result.error.message == "Expense not found");
    REQUIRE(f.http.call_count() == 1);
}

// ── Rate limiting ────────────────────────────────────────────────

TEST_CASE("RequestPipeline: 429 falls back to an expired cache entry", "[pipeline]") {
    PipelineFixture f;
    f.http.response_queue = {ok_response({{"v", 1}})};
    f.http.next_response = error_response(429, "slow down");
    auto& p = f.start();

    REQUIRE(p.get("categories").ok());
    f.now += 60 * kMinute; // far past stale

    auto result = p.get("categories");
    REQUIRE(result.ok());
    REQUIRE(result.from_cache);
    REQUIRE(result.stale);
    REQUIRE(result.data["v"] == 1);
}

TEST_CASE("RequestPipeline: 429 without cache entry is a rate limit error", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(429, "slow down");
    auto& p = f.start();

    auto result = p.get("categories");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.kind == ErrorKind::RateLimit);
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: 429 on a mutation is surfaced", "[pipeline]") {
    PipelineFixture f;
    f.http.response_queue = {ok_response(json::array())};
    f.http.next_response = error_response(429, "slow down");
    auto& p = f.start();

    REQUIRE(p.get("expenses").ok());
    auto result = p.post("expenses", {{"amount", 1}});
    REQUIRE(result.error.kind == ErrorKind::RateLimit);
}

// ── 401 refresh and replay ───────────────────────────────────────

TEST_CASE("RequestPipeline: 401 refreshes once and replays with the new token", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("expired", "refresh-1");
    f.http.handler = [](const HttpRequest& req) {
        if (endpoint(req) == "auth/refresh-token") return tokens_response("fresh", "refresh-2");
        if (bearer(req) != "fresh") return error_response(401, "token expired");
        return ok_response(json::array({{{"amount", 5}}}));
    };
    auto& p = f.start();

    auto result = p.get("expenses");
    REQUIRE(result.ok());
    REQUIRE(result.data[0]["amount"] == 5);
    REQUIRE(f.calls_to("auth/refresh-token") == 1);
    REQUIRE(f.calls_to("expenses") == 2);
    REQUIRE(bearer(f.http.last_request()) == "fresh");
    REQUIRE(f.tokens->get_refresh_token().value_or("") == "refresh-2");
}

TEST_CASE("RequestPipeline: 401 replay applies to mutations too", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("expired", "refresh-1");
    f.http.handler = [](const HttpRequest& req) {
        if (endpoint(req) == "auth/refresh-token") return tokens_response("fresh", "refresh-2");
        if (bearer(req) != "fresh") return error_response(401, "token expired");
        return ok_response({{"id", 3}}, 201);
    };
    auto& p = f.start();

    auto result = p.post("income", {{"amount", 1000}});
    REQUIRE(result.ok());
    REQUIRE(f.calls_to("income") == 2);
}

TEST_CASE("RequestPipeline: refresh failure returns the 401 as an auth error", "[pipeline]") {
    for (long refresh_status : {401L, 500L}) {
        PipelineFixture f;
        f.seed_tokens("expired", "refresh-1");
        f.http.handler = [refresh_status](const HttpRequest& req) {
            if (endpoint(req) == "auth/refresh-token")
                return error_response(refresh_status, "refresh rejected");
            return error_response(401, "token expired");
        };
        int expired = 0;
        subscribe<SessionExpiredEvent>(f.bus, [&](const SessionExpiredEvent&) { expired++; });
        auto& p = f.start();

        auto result = p.get("expenses");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error.kind == ErrorKind::Auth);
        REQUIRE(result.error.status_code == 401);
        REQUIRE(result.error.session_expired);
        REQUIRE_FALSE(f.tokens->is_authenticated());
        REQUIRE(f.store.keys_with_prefix("auth:").empty());
        REQUIRE(f.calls_to("expenses") == 1);
        REQUIRE(f.calls_to("auth/refresh-token") == 1);
        REQUIRE(expired == 1);
    }
}

TEST_CASE("RequestPipeline: second 401 after refresh ends the session", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("expired", "refresh-1");
    f.http.handler = [](const HttpRequest& req) {
        if (endpoint(req) == "auth/refresh-token") return tokens_response("fresh", "refresh-2");
        return error_response(401, "still no");
    };
    auto& p = f.start();

    auto result = p.get("expenses");
    REQUIRE(result.error.kind == ErrorKind::Auth);
    REQUIRE(result.error.session_expired);
    REQUIRE(f.calls_to("auth/refresh-token") == 1);
    REQUIRE(f.calls_to("expenses") == 2);
    REQUIRE_FALSE(f.tokens->is_authenticated());
}

TEST_CASE("RequestPipeline: public endpoints never trigger a refresh", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("some-token", "refresh-1");
    f.http.next_response = error_response(401, "bad credentials");
    auto& p = f.start();

    auto result = p.post("auth/login", {{"email", "a@b.c"}, {"password", "x"}});
    REQUIRE(result.error.kind == ErrorKind::Auth);
    REQUIRE(f.calls_to("auth/refresh-token") == 0);
    REQUIRE(f.tokens->is_authenticated());
}

TEST_CASE("RequestPipeline: unauthenticated 401 is returned without refresh", "[pipeline]") {
    PipelineFixture f;
    f.http.next_response = error_response(401, "login required");
    auto& p = f.start();

    auto result = p.get("expenses");
    REQUIRE(result.error.kind == ErrorKind::Auth);
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RequestPipeline: concurrent 401s share a single refresh", "[pipeline]") {
    PipelineFixture f;
    f.seed_tokens("expired", "refresh-1");
    f.http.handler = [](const HttpRequest& req) {
        if (endpoint(req) == "auth/refresh-token") {
            std::this_thread::sleep_for(milliseconds(50));
            return tokens_response("fresh", "refresh-2");
        }
        if (bearer(req) != "fresh") return error_response(401, "token expired");
        return ok_response({{"ep", endpoint(req)}});
    };
    auto& p = f.start();

    constexpr int kCallers = 8;
    std::vector<ApiResult> results(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([&, i] {
            results[i] = p.get("expenses/" + std::to_string(i));
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(f.calls_to("auth/refresh-token") == 1);
    for (int i = 0; i < kCallers; i++) {
        REQUIRE(results[i].ok());
        REQUIRE(results[i].data["ep"] == "expenses/" + std::to_string(i));
    }
}
