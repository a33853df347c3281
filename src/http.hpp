#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace finly {

// Call once at startup: creates the shared TLS context (Linux) or
// initialises libcurl (elsewhere).
void http_init();

// Call once at shutdown, after the last request has returned.
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 30;
};

// status_code == 0 means no response was received (DNS, connect, TLS,
// timeout or abort).
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;   // why no response arrived, when status_code == 0
};

inline HttpResponse transport_failure(std::string reason) {
    HttpResponse r;
    r.error = std::move(reason);
    return r;
}

// Returns the value of the named header (case-sensitive), or "" if absent.
inline std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Everything else: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// Perform one request. Never throws; failures come back as
// status_code == 0 with `error` set.
HttpResponse http_request(const HttpRequest& request);

} // namespace finly
