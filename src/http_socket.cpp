// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace ollie {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty())
        throw std::runtime_error("invalid URL: " + url);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

using Clock = std::chrono::steady_clock;

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;
    std::string error;

    explicit Connection(long timeout_secs)
        : deadline(Clock::now() + std::chrono::seconds(timeout_secs)) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "could not resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        // Connect timeout is capped separately; the deadline covers the rest.
        long connect_secs = std::min(timeout_secs, 30L);
        int last_errno = 0;
        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour the timeout.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{connect_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "could not connect to " + url.host + ":" + url.port +
                    ": " + std::strerror(last_errno);
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag and deadline checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(connect_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS context setup failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS session setup failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                error = std::string("TLS handshake failed: ") + buf;
                return false;
            }
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error
    // (error is set). EAGAIN (1-second slice expiry) loops back so the
    // abort flag and the request deadline get checked.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed)) {
                error = "transfer aborted";
                return -1;
            }
            if (Clock::now() >= deadline) {
                error = "operation timed out";
                return -1;
            }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_SYSCALL && n == 0)
                    return 0; // peer closed without close_notify
                error = "TLS read failed";
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    continue;
                error = std::string("connection error: ") + std::strerror(errno);
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (Clock::now() >= deadline) {
                error = "operation timed out";
                return false;
            }
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed";
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue;
                    error = std::string("failed to send request: ") + std::strerror(errno);
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length && (!body.empty() || method == "POST"))
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or error before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers; skips interim 1xx responses.
static bool parse_response_headers(Connection& conn, std::string& leftover,
                                    ResponseHead& head) {
    for (;;) {
        head = ResponseHead{};
        std::string status_line;
        if (!read_line(conn, leftover, status_line)) {
            if (conn.error.empty()) conn.error = "connection closed before response";
            return false;
        }

        // "HTTP/1.1 200 OK" → extract the three-digit code
        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos || status_line.rfind("HTTP/", 0) != 0) {
            conn.error = "malformed status line: " + status_line;
            return false;
        }
        try { head.status = std::stol(status_line.substr(sp1 + 1, 3)); }
        catch (const std::exception&) {
            conn.error = "malformed status line: " + status_line;
            return false;
        }

        std::string line;
        while (true) {
            if (!read_line(conn, leftover, line)) {
                if (conn.error.empty()) conn.error = "connection closed in headers";
                return false;
            }
            if (line.empty()) break; // blank line → end of headers

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
                value.erase(0, 1);

            for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
            for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

            if (name == "transfer-encoding") {
                head.is_chunked = (value.find("chunked") != std::string::npos);
            } else if (name == "content-length") {
                try {
                    head.content_length = std::stoul(value);
                    head.has_length = true;
                } catch (const std::exception&) {}
            }
        }
        if (head.status >= 200 || head.status < 100) return true;
    }
}

// Body sink shared by buffered and streamed reads.
// Returns false to abort.
using BodySink = std::function<bool(const char* data, size_t len)>;

enum class BodyResult { Complete, Aborted, Failed };

// Read exactly n bytes into sink, consuming leftover first.
static BodyResult pump_exactly(Connection& conn, std::string& leftover,
                                size_t n, const BodySink& sink) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            if (!sink(leftover.data(), take)) return BodyResult::Aborted;
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got < 0) return BodyResult::Failed;
        if (got == 0) {
            conn.error = "connection closed before end of response body";
            return BodyResult::Failed;
        }
        if (!sink(buf, static_cast<size_t>(got))) return BodyResult::Aborted;
        n -= static_cast<size_t>(got);
    }
    return BodyResult::Complete;
}

// Deliver the body to sink; dechunks if needed. Handles chunked,
// content-length and read-to-close framing.
static BodyResult pump_body(Connection& conn, std::string& leftover,
                             const ResponseHead& head, const BodySink& sink) {
    if (head.is_chunked) {
        BodySink discard = [](const char*, size_t) { return true; };
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line)) {
                if (conn.error.empty())
                    conn.error = "connection closed before end of chunked body";
                return BodyResult::Failed;
            }
            if (size_line.empty()) continue;
            size_t chunk_size = 0;
            if (!parse_chunk_size(size_line, chunk_size)) {
                conn.error = "malformed chunk size";
                return BodyResult::Failed;
            }
            if (chunk_size == 0) return BodyResult::Complete;

            BodyResult r = pump_exactly(conn, leftover, chunk_size, sink);
            if (r != BodyResult::Complete) return r;
            r = pump_exactly(conn, leftover, 2, discard); // trailing \r\n
            if (r != BodyResult::Complete) return r;
        }
    }
    if (head.has_length)
        return pump_exactly(conn, leftover, head.content_length, sink);

    if (!leftover.empty()) {
        if (!sink(leftover.data(), leftover.size())) return BodyResult::Aborted;
        leftover.clear();
    }
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return BodyResult::Complete;
        if (n < 0) return BodyResult::Failed;
        if (!sink(buf, static_cast<size_t>(n))) return BodyResult::Aborted;
    }
}

// ── Core request executor ──────────────────────────────────────

// Sends the request and reads the response head. On failure resp.error is
// set and false returned.
static bool open_request(Connection& conn, const std::string& method,
                         const std::string& url_str, const std::string& body,
                         const std::vector<Header>& headers, long timeout_secs,
                         std::string& leftover, ResponseHead& head,
                         HttpResponse& resp) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return false;
    }

    if (!conn.connect(url, timeout_secs)) {
        resp.error = conn.error;
        return false;
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.error;
        return false;
    }

    if (!parse_response_headers(conn, leftover, head)) {
        resp.error = conn.error;
        return false;
    }
    resp.status_code = head.status;
    return true;
}

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs) {
    Connection conn(timeout_secs);
    std::string leftover;
    ResponseHead head;
    HttpResponse resp;
    if (!open_request(conn, method, url_str, body, headers, timeout_secs,
                      leftover, head, resp))
        return resp;

    BodySink append = [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    };
    if (pump_body(conn, leftover, head, append) == BodyResult::Failed)
        resp.error = conn.error;
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::del(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_delete(url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse http_delete(const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds) {
    return do_request("DELETE", url, body, headers, timeout_seconds);
}

// Default base-class implementation delegates to http_stream_post_raw.
HttpResponse HttpClient::stream_post_raw(const std::string& url,
                                          const std::string& body,
                                          const std::vector<Header>& headers,
                                          RawChunkCallback callback,
                                          long timeout_seconds) {
    return http_stream_post_raw(url, body, headers, std::move(callback), timeout_seconds);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   RawChunkCallback callback,
                                   long timeout_seconds) {
    Connection conn(timeout_seconds);
    std::string leftover;
    ResponseHead head;
    HttpResponse resp;
    if (!open_request(conn, "POST", url, body, headers, timeout_seconds,
                      leftover, head, resp))
        return resp;

    BodySink sink;
    if (is_success(resp)) {
        sink = [&callback](const char* data, size_t len) { return callback(data, len); };
    } else {
        sink = [&resp](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        };
    }

    switch (pump_body(conn, leftover, head, sink)) {
        case BodyResult::Complete: break;
        case BodyResult::Aborted:  resp.error = "transfer aborted"; break;
        case BodyResult::Failed:   resp.error = conn.error; break;
    }
    return resp;
}

} // namespace ollie

#endif // __linux__
