#include "api_client.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: finly <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  login EMAIL PASSWORD     Sign in and store the session\n"
              << "  signup NAME EMAIL PASSWORD\n"
              << "                           Create an account (then verify)\n"
              << "  verify EMAIL CODE        Confirm the emailed code and sign in\n"
              << "  logout                   End the session and clear the cache\n"
              << "  get PATH [-p k=v]... [--skip-cache]\n"
              << "                           GET an endpoint (cached)\n"
              << "  post PATH JSON           POST a JSON body\n"
              << "  put PATH JSON            PUT a JSON body\n"
              << "  patch PATH JSON          PATCH a JSON body\n"
              << "  delete PATH              DELETE a resource\n"
              << "  status                   Show session and cache state\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  FINLY_BASE_URL           Backend base URL (default: https://api.finly.app)\n"
              << "  FINLY_API_VERSION        API version segment (default: v1)\n"
              << "  FINLY_TIMEOUT            Per-request timeout in seconds\n"
              << "  FINLY_STORE_PATH         Session and cache store file\n";
}

static int print_result(const finly::ApiResult& result) {
    if (result.ok()) {
        if (result.from_cache) {
            std::cerr << "(cached" << (result.stale ? ", stale" : "") << ")\n";
        }
        std::cout << result.data.dump(2) << '\n';
        return 0;
    }
    nlohmann::json err = {
        {"kind", finly::error_kind_name(result.error.kind)},
        {"status", result.error.status_code},
        {"message", result.error.message}
    };
    if (!result.error.code.empty()) err["code"] = result.error.code;
    if (!result.error.details.is_null()) err["details"] = result.error.details;
    if (result.error.session_expired) err["session_expired"] = true;
    std::cerr << "Error: " << err.dump(2) << '\n';
    return 1;
}

static bool parse_body(const char* text, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Invalid JSON body: " << e.what() << '\n';
        return false;
    }
}

static int run_command(finly::ApiClient& client, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "login" && args.size() == 3) {
        int rc = print_result(client.login(args[1], args[2]));
        if (rc == 0) std::cerr << "Logged in.\n";
        return rc;
    }
    if (cmd == "signup" && args.size() == 4) {
        int rc = print_result(client.signup(args[1], args[2], args[3]));
        if (rc == 0 && !client.is_authenticated())
            std::cerr << "Check your email, then run `finly verify " << args[2] << " CODE`.\n";
        return rc;
    }
    if (cmd == "verify" && args.size() == 3) {
        int rc = print_result(client.verify_email(args[1], args[2]));
        if (rc == 0 && client.is_authenticated()) std::cerr << "Logged in.\n";
        return rc;
    }
    if (cmd == "logout" && args.size() == 1) {
        client.logout();
        std::cout << "Logged out.\n";
        return 0;
    }
    if (cmd == "status" && args.size() == 1) {
        std::cout << "Backend: " << client.config().api_url("") << "\n"
                  << "Authenticated: " << (client.is_authenticated() ? "yes" : "no") << "\n"
                  << "Cached responses: " << client.cache().size() << "\n";
        auto user = client.cached_user();
        if (user && user->is_object()) {
            std::cout << "User: " << user->value("email", std::string("?")) << "\n";
        }
        return 0;
    }
    if (cmd == "get" && args.size() >= 2) {
        finly::RequestOptions options;
        for (size_t i = 2; i < args.size(); i++) {
            if (args[i] == "--skip-cache") {
                options.skip_cache = true;
            } else if (args[i] == "-p" && i + 1 < args.size()) {
                const std::string& kv = args[++i];
                auto eq = kv.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "Expected k=v after -p, got: " << kv << "\n";
                    return 1;
                }
                options.params.emplace_back(finly::trim(kv.substr(0, eq)), kv.substr(eq + 1));
            } else {
                std::cerr << "Unknown option: " << args[i] << "\n";
                return 1;
            }
        }
        int rc = print_result(client.get(args[1], options));
        client.wait_idle();
        return rc;
    }
    if ((cmd == "post" || cmd == "put" || cmd == "patch") && args.size() == 3) {
        nlohmann::json body;
        if (!parse_body(args[2].c_str(), body)) return 1;
        if (cmd == "post") return print_result(client.post(args[1], body));
        if (cmd == "put") return print_result(client.put(args[1], body));
        return print_result(client.patch(args[1], body));
    }
    if (cmd == "delete" && args.size() == 2) {
        return print_result(client.del(args[1]));
    }

    std::cerr << "Unknown or malformed command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage();
        return argc < 2 ? 1 : 0;
    }
    std::vector<std::string> args(argv + 1, argv + argc);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Initialize
    finly::http_init();
    finly::http_set_abort_flag(&g_shutdown);
    auto config = finly::Config::load();

    int rc = 1;
    {
        finly::PlatformHttpClient http_client;
        finly::ApiClient client(config, http_client);

        auto on_expired = finly::subscribe_scoped<finly::SessionExpiredEvent>(client.events(),
            [](const finly::SessionExpiredEvent& ev) {
                std::cerr << "Session expired (" << ev.reason << "). Run `finly login`.\n";
            });

        rc = run_command(client, args);
    }

    finly::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
