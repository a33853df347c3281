// Non-Linux transport backed by libcurl.
#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace finly {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

// Polled by curl about once a second; non-zero aborts the transfer.
static int abort_check(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return g_abort_flag && g_abort_flag->load(std::memory_order_relaxed) ? 1 : 0;
}

static size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// ── RAII easy handle ──────────────────────────────────────────

class CurlTransfer {
public:
    CurlTransfer() : curl_(curl_easy_init()) {}
    ~CurlTransfer() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    explicit operator bool() const { return curl_ != nullptr; }

    void prepare(const HttpRequest& request, std::string& body_out) {
        bool has_agent = false;
        for (const auto& h : request.headers) {
            if (h.first == "User-Agent") has_agent = true;
            headers_ = curl_slist_append(headers_, (h.first + ": " + h.second).c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, request.timeout_seconds > 0
                                                     ? request.timeout_seconds : 30L);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_);
        if (!has_agent) curl_easy_setopt(curl_, CURLOPT_USERAGENT, "finly-client");
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, collect_body);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body_out);
        if (g_abort_flag) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_check);
        }

        if (request.method == "GET") {
            curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
            return;
        }
        if (request.method == "HEAD") {
            curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
            return;
        }
        if (request.method == "POST") {
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        } else {
            curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (!request.body.empty() || request.method == "POST") {
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
        }
    }

    // Empty string on success, otherwise the failure reason.
    std::string perform() {
        CURLcode rc = curl_easy_perform(curl_);
        if (rc == CURLE_OK) return "";
        if (rc == CURLE_ABORTED_BY_CALLBACK) return "aborted";
        return error_[0] ? std::string(error_) : std::string(curl_easy_strerror(rc));
    }

    long status() const {
        long code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
    char error_[CURL_ERROR_SIZE] = {0};
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    return http_request(request);
}

HttpResponse http_request(const HttpRequest& request) {
    CurlTransfer transfer;
    if (!transfer) return transport_failure("curl unavailable");

    HttpResponse response;
    transfer.prepare(request, response.body);
    std::string failure = transfer.perform();
    if (!failure.empty()) return transport_failure(failure);
    response.status_code = transfer.status();
    return response;
}

} // namespace finly
