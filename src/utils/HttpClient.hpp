// modeld - HTTP Client
// HTTP client over cpr/libcurl: JSON calls, streamed feeds, ranged downloads

#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <functional>
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace modeld::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    bool aborted{false};        // a callback asked to stop the transfer
    bool rangeIgnored{false};   // resume requested but the server sent the whole body
    double elapsed{0.0};

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isPartialContent() const { return statusCode == 206; }
    bool isNotFound() const { return statusCode == 404; }
    bool isUnauthorized() const { return statusCode == 401 || statusCode == 403; }

    /**
     * Case-insensitive header lookup
     */
    std::string header(const std::string& name) const;

    /**
     * One-line summary for error messages: "HTTP 404" or the transport error
     */
    std::string describe() const;
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{-1};         // -1 = client default, 0 = no overall timeout
    int connectTimeoutSeconds{-1};  // -1 = client default
    std::string userAgent;

    HttpOptions& withBearer(const std::string& token) {
        if (!token.empty()) {
            headers["Authorization"] = "Bearer " + token;
        }
        return *this;
    }
};

/**
 * Receives each newline-terminated line of a streamed body.
 * Return false to abort the stream.
 */
using LineCallback = std::function<bool(const std::string& line)>;

/**
 * Receives the number of bytes written since the previous call, or 0 on
 * an idle tick (libcurl calls back about once a second while stalled).
 * Return false to abort the transfer.
 */
using ChunkCallback = std::function<bool(int64_t deltaBytes)>;

/**
 * Polled while a stream is idle. Return true to abort.
 */
using StopPredicate = std::function<bool()>;

/**
 * @brief Synchronous HTTP client
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Default options are merged under per-call options
    void setDefaultOptions(const HttpOptions& options);

    HttpResponse get(const std::string& url, const HttpOptions& options = {});
    HttpResponse head(const std::string& url, const HttpOptions& options = {});
    HttpResponse putJson(const std::string& url, const std::string& json,
                         const HttpOptions& options = {});

    /**
     * GET a long-lived response and hand it over line by line.
     * Returns when the server closes the stream, the callback aborts, or
     * shouldStop returns true. Exceptions thrown by the callbacks are
     * rethrown after the transfer has been torn down.
     */
    HttpResponse streamLines(const std::string& url, const LineCallback& onLine,
                             const StopPredicate& shouldStop,
                             const HttpOptions& options = {});

    /**
     * Download url into destination. When offset > 0 a
     * "Range: bytes=<offset>-" header is sent and the body is appended;
     * if the server answers 200 instead of 206 the file is truncated and
     * rewritten from the start (rangeIgnored is set) and onChunk receives
     * -offset for the discarded bytes. Bodies of non-2xx
     * responses are never written. Exceptions thrown by onChunk abort the
     * transfer and are rethrown.
     */
    HttpResponse downloadToFile(const std::string& url, const std::string& destination,
                                int64_t offset, const ChunkCallback& onChunk,
                                const HttpOptions& options = {});

    // URL utilities
    static std::string urlEncode(const std::string& str);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    HttpOptions mergeOptions(const HttpOptions& options) const;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static std::mutex s_mutex;
    static bool s_initialized;
};

} // namespace modeld::utils
