#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace ollie {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code == 0 means no HTTP response was obtained; error says why.
// A transport failure after the status line keeps status_code and sets error.
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;
};

inline bool is_success(const HttpResponse& r) {
    return r.status_code >= 200 && r.status_code < 300;
}

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    // DELETE with an optional request body.
    virtual HttpResponse del(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 60) = 0;

    // POST whose 2xx response body is handed to callback as it arrives
    // (dechunked); the returned body is empty. Non-2xx bodies are buffered
    // into the returned body and the callback is never called.
    // timeout_seconds bounds the whole transfer, not each read.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse del(const std::string& url,
                     const std::string& body,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 60) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse del(const std::string& url,
                     const std::string& body,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 60) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

HttpResponse http_delete(const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 60);

// HTTP POST with raw-chunk streaming (no line parsing; caller frames)
HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  RawChunkCallback callback,
                                  long timeout_seconds = 300);

} // namespace ollie
