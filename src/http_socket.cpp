// Linux transport: HTTP/1.1 over POSIX sockets + OpenSSL, one request per
// connection. Same public surface as the libcurl build in http.cpp.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>

namespace finly {

namespace {

const std::atomic<bool>* g_abort_flag = nullptr;

std::mutex g_tls_mutex;
SSL_CTX* g_tls_ctx = nullptr;

// Shared by every connection. Created on first use so callers that never
// ran http_init() still get TLS.
SSL_CTX* tls_context() {
    std::lock_guard<std::mutex> lock(g_tls_mutex);
    if (!g_tls_ctx) {
        g_tls_ctx = SSL_CTX_new(TLS_client_method());
        if (g_tls_ctx) {
            SSL_CTX_set_verify(g_tls_ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(g_tls_ctx);
            SSL_CTX_set_min_proto_version(g_tls_ctx, TLS1_2_VERSION);
        }
    }
    return g_tls_ctx;
}

bool abort_requested() {
    return g_abort_flag && g_abort_flag->load(std::memory_order_relaxed);
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return s;
}

// ── Endpoint ───────────────────────────────────────────────────

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // origin-form: path plus query, always starts with '/'
};

std::optional<Endpoint> parse_endpoint(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    Endpoint ep;
    std::string scheme = lower(url.substr(0, scheme_end));
    if (scheme == "https") ep.tls = true;
    else if (scheme != "http") return std::nullopt;

    size_t authority_start = scheme_end + 3;
    size_t target_start = url.find_first_of("/?", authority_start);
    std::string authority = url.substr(authority_start, target_start == std::string::npos
                                                            ? std::string::npos
                                                            : target_start - authority_start);
    if (target_start == std::string::npos) {
        ep.target = "/";
    } else {
        ep.target = url.substr(target_start);
        if (ep.target[0] == '?') ep.target.insert(0, "/");
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }
    if (ep.host.size() > 2 && ep.host.front() == '[' && ep.host.back() == ']')
        ep.host = ep.host.substr(1, ep.host.size() - 2);
    if (ep.host.empty() || ep.port.empty()) return std::nullopt;
    return ep;
}

// ── Socket (TCP + optional TLS, RAII) ──────────────────────────

class Socket {
public:
    using Clock = std::chrono::steady_clock;

    explicit Socket(long timeout_secs)
        : timeout_secs_(timeout_secs > 0 ? timeout_secs : 30),
          deadline_(Clock::now() + std::chrono::seconds(timeout_secs_)) {}

    ~Socket() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (fd_ >= 0) ::close(fd_);
    }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Connect (and handshake for https). False on failure; see error().
    bool open(const Endpoint& ep) {
        if (!connect_tcp(ep)) return false;
        if (ep.tls && !start_tls(ep)) return false;
        // 1-second slices so the abort flag and deadline are polled while blocked.
        set_io_timeout(1);
        return true;
    }

    // >0 bytes read, 0 on orderly EOF, -1 on error, abort or deadline.
    ssize_t read_some(char* buf, size_t len) {
        for (;;) {
            if (!still_allowed()) return -1;
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(std::min<size_t>(len, INT_MAX)));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                // Peers that close without close_notify are treated as EOF.
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
                error_ = "TLS read failed";
                return -1;
            }
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            error_ = std::string("recv failed: ") + std::strerror(errno);
            return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (!still_allowed()) return false;
            if (ssl_) {
                int n = SSL_write(ssl_, p, static_cast<int>(std::min<size_t>(left, INT_MAX)));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, n);
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    error_ = "TLS write failed";
                    return false;
                }
                p += n;
                left -= static_cast<size_t>(n);
            } else {
                ssize_t n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    error_ = std::string("send failed: ") + std::strerror(errno);
                    return false;
                }
                p += n;
                left -= static_cast<size_t>(n);
            }
        }
        return true;
    }

    const std::string& error() const { return error_; }

private:
    bool still_allowed() {
        if (abort_requested()) {
            error_ = "aborted";
            return false;
        }
        if (Clock::now() >= deadline_) {
            error_ = "timed out after " + std::to_string(timeout_secs_) + "s";
            return false;
        }
        return true;
    }

    bool connect_tcp(const Endpoint& ep) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res);
        if (gai != 0) {
            error_ = "cannot resolve " + ep.host + ": " + gai_strerror(gai);
            return false;
        }

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai)) {
                fd_ = fd;
            } else {
                ::close(fd);
            }
        }
        freeaddrinfo(res);

        if (fd_ < 0) {
            error_ = "cannot connect to " + ep.host + ":" + ep.port;
            return false;
        }
        return true;
    }

    // Non-blocking connect so the request timeout also bounds the handshake.
    bool connect_with_timeout(int fd, const struct addrinfo* ai) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0) {
            if (errno != EINPROGRESS) return false;
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd, &wset);
            struct timeval tv{timeout_secs_, 0};
            if (select(fd + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0 || err != 0)
                return false;
        }
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    bool start_tls(const Endpoint& ep) {
        SSL_CTX* ctx = tls_context();
        if (!ctx) {
            error_ = "TLS unavailable";
            return false;
        }
        set_io_timeout(timeout_secs_);
        ssl_ = SSL_new(ctx);
        if (!ssl_) {
            error_ = "TLS unavailable";
            return false;
        }
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, ep.host.c_str()); // SNI
        SSL_set1_host(ssl_, ep.host.c_str());             // certificate must name the host
        if (SSL_connect(ssl_) != 1) {
            unsigned long code = ERR_get_error();
            char reason[256] = {0};
            if (code) ERR_error_string_n(code, reason, sizeof(reason));
            error_ = "TLS handshake with " + ep.host + " failed";
            if (reason[0]) error_ += std::string(": ") + reason;
            return false;
        }
        return true;
    }

    void set_io_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int fd_ = -1;
    SSL* ssl_ = nullptr;
    long timeout_secs_;
    Clock::time_point deadline_;
    std::string error_;
};

// ── Request serialization ──────────────────────────────────────

std::string serialize_request(const HttpRequest& request, const Endpoint& ep) {
    std::string out;
    out.reserve(512 + request.body.size());
    out += request.method + " " + ep.target + " HTTP/1.1\r\n";
    out += "Host: " + ep.host;
    if (ep.port != (ep.tls ? "443" : "80")) out += ":" + ep.port;
    out += "\r\n";

    bool has_agent = false;
    for (const auto& h : request.headers) {
        std::string name = lower(h.first);
        if (name == "content-length" || name == "connection" || name == "host") continue;
        if (name == "user-agent") has_agent = true;
        out += h.first + ": " + h.second + "\r\n";
    }
    if (!has_agent) out += "User-Agent: finly-client\r\n";
    if (!request.body.empty() || (request.method != "GET" && request.method != "HEAD"))
        out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += request.body;
    return out;
}

// ── Response parsing ───────────────────────────────────────────

// Buffered reader over a Socket. Every method returns false when the
// connection fails or ends early; the socket carries the reason.
class ResponseReader {
public:
    explicit ResponseReader(Socket& sock) : sock_(sock) {}

    // Status line and the headers the body framing depends on.
    bool read_head(long& status, bool& chunked, std::optional<size_t>& length) {
        std::string line;
        if (!read_line(line)) return false;
        // "HTTP/1.1 200 OK"
        size_t sp = line.find(' ');
        if (line.compare(0, 5, "HTTP/") != 0 || sp == std::string::npos ||
            line.size() < sp + 4) {
            malformed_ = true;
            return false;
        }
        status = std::strtol(line.substr(sp + 1, 3).c_str(), nullptr, 10);
        if (status < 100 || status > 599) {
            malformed_ = true;
            return false;
        }

        chunked = false;
        length.reset();
        for (;;) {
            if (!read_line(line)) return false;
            if (line.empty()) return true;
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(line.substr(0, colon));
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                chunked = lower(value).find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                char* end = nullptr;
                unsigned long long n = std::strtoull(value.c_str(), &end, 10);
                if (end != value.c_str()) length = static_cast<size_t>(n);
            }
        }
    }

    bool read_body(bool chunked, const std::optional<size_t>& length, std::string& body) {
        if (chunked) {
            for (;;) {
                std::string size_line;
                if (!read_line(size_line)) return false;
                // Hex size, optionally followed by ";extensions".
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) return true; // trailers are ignored
                std::string crlf;
                if (!take(chunk, body) || !take(2, crlf)) return false;
            }
        }
        if (length) return take(*length, body);
        return drain(body);
    }

    bool malformed() const { return malformed_; }

private:
    bool fill() {
        char chunk[4096];
        ssize_t n = sock_.read_some(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buf_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    bool read_line(std::string& line) {
        for (;;) {
            size_t nl = buf_.find('\n');
            if (nl != std::string::npos) {
                line.assign(buf_, 0, nl);
                buf_.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            if (!fill()) return false;
        }
    }

    bool take(size_t n, std::string& out) {
        while (buf_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buf_, 0, n);
        buf_.erase(0, n);
        return true;
    }

    // Body delimited by connection close.
    bool drain(std::string& out) {
        char chunk[4096];
        for (;;) {
            out += buf_;
            buf_.clear();
            ssize_t n = sock_.read_some(chunk, sizeof(chunk));
            if (n == 0) return true;
            if (n < 0) return false;
            buf_.append(chunk, static_cast<size_t>(n));
        }
    }

    Socket& sock_;
    std::string buf_;
    bool malformed_ = false;
};

// HEAD, 1xx, 204 and 304 never carry a body.
bool expects_body(const std::string& method, long status) {
    if (method == "HEAD") return false;
    return !(status < 200 || status == 204 || status == 304);
}

std::string reason_or(const Socket& sock, const char* fallback) {
    return sock.error().empty() ? fallback : sock.error();
}

} // namespace

void http_init() {
    tls_context();
}

void http_cleanup() {
    std::lock_guard<std::mutex> lock(g_tls_mutex);
    if (g_tls_ctx) {
        SSL_CTX_free(g_tls_ctx);
        g_tls_ctx = nullptr;
    }
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

HttpResponse SocketHttpClient::send(const HttpRequest& request) {
    return http_request(request);
}

HttpResponse http_request(const HttpRequest& request) {
    auto ep = parse_endpoint(request.url);
    if (!ep) return transport_failure("invalid URL: " + request.url);

    Socket sock(request.timeout_seconds);
    if (!sock.open(*ep)) return transport_failure(reason_or(sock, "connect failed"));
    if (!sock.write_all(serialize_request(request, *ep)))
        return transport_failure(reason_or(sock, "send failed"));

    ResponseReader reader(sock);
    long status = 0;
    bool chunked = false;
    std::optional<size_t> length;
    if (!reader.read_head(status, chunked, length)) {
        if (reader.malformed()) return transport_failure("malformed response from " + ep->host);
        return transport_failure(reason_or(sock, "connection closed before response"));
    }

    HttpResponse resp;
    if (expects_body(request.method, status) &&
        !reader.read_body(chunked, length, resp.body)) {
        return transport_failure(reason_or(sock, "response body truncated"));
    }
    resp.status_code = status;
    return resp;
}

} // namespace finly

#endif // __linux__
