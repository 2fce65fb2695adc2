#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace ollie {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Routes 2xx bodies to the caller's callback and buffers anything else.
struct RawStreamContext {
    CURL* curl;
    RawChunkCallback* callback;
    std::string* error_body;
    bool aborted = false;
};

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        ctx->error_body->append(ptr, total);
        return total;
    }

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;
    char errbuf[CURL_ERROR_SIZE] = {};

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_ERRORBUFFER, req.errbuf);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    apply_abort_hook(req.curl);
}

static void set_body(CURL* curl, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
}

static std::string describe_error(const CurlRequest& req, CURLcode res) {
    if (req.errbuf[0] != '\0') return req.errbuf;
    return curl_easy_strerror(res);
}

// Perform and fill status + error. Status is kept when the transfer fails
// after headers arrived.
static void perform(CurlRequest& req, HttpResponse& response) {
    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK)
        response.error = describe_error(req, res);
}

static HttpResponse buffered_request(const char* method,
                                     const std::string& url,
                                     const std::string* body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    CurlRequest req;
    HttpResponse response;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_request(req, url, headers, timeout_seconds);
    if (body) set_body(req.curl, *body);
    curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req, response);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::del(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_delete(url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return buffered_request("GET", url, nullptr, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return buffered_request("POST", url, &body, headers, timeout_seconds);
}

HttpResponse http_delete(const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds) {
    return buffered_request("DELETE", url, &body, headers, timeout_seconds);
}

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
    CurlRequest req;
    HttpResponse response;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    set_body(req.curl, body);
    RawStreamContext ctx{req.curl, &callback, &response.body};
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);
    perform(req, response);
    if (ctx.aborted) response.error = "transfer aborted";
    return response;
}

} // namespace ollie
