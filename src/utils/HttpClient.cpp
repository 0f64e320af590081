/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 * Streaming and downloads go through cpr::Session so the write, header and
 * progress callbacks can be combined on one request.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>
#include <exception>
#include <fstream>
#include <stdexcept>

namespace modeld::utils {

namespace {

constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr const char* DEFAULT_USER_AGENT = "modeld/1.0";

cpr::Header toCprHeaders(const HttpOptions& options) {
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    return headers;
}

void configureSession(cpr::Session& session, const std::string& url, const HttpOptions& options) {
    session.SetUrl(cpr::Url{url});
    session.SetHeader(toCprHeaders(options));
    session.SetUserAgent(cpr::UserAgent{options.userAgent});
    session.SetConnectTimeout(cpr::ConnectTimeout{options.connectTimeoutSeconds * 1000});
    session.SetTimeout(cpr::Timeout{options.timeoutSeconds * 1000});
}

void copyResponse(const cpr::Response& response, HttpResponse& result) {
    result.statusCode = static_cast<int>(response.status_code);
    result.elapsed = response.elapsed;
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message;
    }
    for (const auto& [key, value] : response.header) {
        result.headers[key] = value;
    }
}

/**
 * Tracks the status line and headers of the most recent response on a
 * connection; redirects produce several header blocks.
 */
struct HeaderState {
    int status{0};
    std::map<std::string, std::string> headers;

    void consume(std::string_view raw) {
        std::string line = StringUtils::trim(std::string(raw));
        if (line.empty()) return;
        if (StringUtils::startsWith(line, "HTTP/")) {
            headers.clear();
            auto parts = StringUtils::split(line, ' ');
            status = parts.size() > 1 ? static_cast<int>(StringUtils::parseLong(parts[1], 0)) : 0;
            return;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) return;
        headers[StringUtils::trim(line.substr(0, colon))] = StringUtils::trim(line.substr(colon + 1));
    }
};

} // namespace

// -- CurlGlobalInit --

std::mutex CurlGlobalInit::s_mutex;
bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

void CurlGlobalInit::cleanup() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- HttpResponse --

std::string HttpResponse::header(const std::string& name) const {
    auto wanted = StringUtils::toLower(name);
    for (const auto& [key, value] : headers) {
        if (StringUtils::toLower(key) == wanted) return value;
    }
    return "";
}

std::string HttpResponse::describe() const {
    if (!error.empty()) return error;
    if (statusCode == 0) return "no response";
    return "HTTP " + std::to_string(statusCode);
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions defaultOptions;
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    m_impl->defaultOptions = options;
}

HttpOptions HttpClient::mergeOptions(const HttpOptions& options) const {
    const auto& defaults = m_impl->defaultOptions;
    HttpOptions merged;

    merged.headers = defaults.headers;
    for (const auto& [key, value] : options.headers) merged.headers[key] = value;

    merged.userAgent = !options.userAgent.empty() ? options.userAgent : defaults.userAgent;
    if (merged.userAgent.empty()) merged.userAgent = DEFAULT_USER_AGENT;

    merged.timeoutSeconds = options.timeoutSeconds >= 0 ? options.timeoutSeconds : defaults.timeoutSeconds;
    if (merged.timeoutSeconds < 0) merged.timeoutSeconds = DEFAULT_TIMEOUT_SECONDS;

    merged.connectTimeoutSeconds = options.connectTimeoutSeconds >= 0
        ? options.connectTimeoutSeconds : defaults.connectTimeoutSeconds;
    if (merged.connectTimeoutSeconds < 0) merged.connectTimeoutSeconds = DEFAULT_CONNECT_TIMEOUT_SECONDS;

    return merged;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    HttpResponse result;
    try {
        auto opts = mergeOptions(options);
        cpr::Session session;
        configureSession(session, url, opts);
        cpr::Response response = session.Get();
        copyResponse(response, result);
        result.body = std::move(response.text);
    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }
    return result;
}

HttpResponse HttpClient::head(const std::string& url, const HttpOptions& options) {
    HttpResponse result;
    try {
        auto opts = mergeOptions(options);
        cpr::Session session;
        configureSession(session, url, opts);
        cpr::Response response = session.Head();
        copyResponse(response, result);
    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }
    return result;
}

HttpResponse HttpClient::putJson(const std::string& url, const std::string& json, const HttpOptions& options) {
    HttpResponse result;
    try {
        HttpOptions withType = options;
        withType.headers["Content-Type"] = "application/json";
        auto opts = mergeOptions(withType);
        cpr::Session session;
        configureSession(session, url, opts);
        session.SetBody(cpr::Body{json});
        cpr::Response response = session.Put();
        copyResponse(response, result);
        result.body = std::move(response.text);
    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }
    return result;
}

HttpResponse HttpClient::streamLines(const std::string& url, const LineCallback& onLine,
                                     const StopPredicate& shouldStop, const HttpOptions& options) {
    HttpResponse result;
    std::exception_ptr failure;
    HeaderState headerState;
    std::string pending;

    auto opts = mergeOptions(options);
    cpr::Session session;
    configureSession(session, url, opts);

    session.SetHeaderCallback(cpr::HeaderCallback{[&](std::string_view header, intptr_t) -> bool {
        headerState.consume(header);
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
        // Error bodies are collected whole for the caller
        if (headerState.status < 200 || headerState.status >= 300) {
            result.body.append(data.data(), data.size());
            return true;
        }
        pending.append(data.data(), data.size());
        try {
            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) continue;
                if (!onLine(line)) {
                    result.aborted = true;
                    return false;
                }
            }
        } catch (...) {
            failure = std::current_exception();
            return false;
        }
        return true;
    }});

    session.SetProgressCallback(cpr::ProgressCallback{[&](cpr::cpr_off_t, cpr::cpr_off_t,
                                                          cpr::cpr_off_t, cpr::cpr_off_t,
                                                          intptr_t) -> bool {
        if (failure || result.aborted) return false;
        if (shouldStop && shouldStop()) {
            result.aborted = true;
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Get();
    if (failure) std::rethrow_exception(failure);

    copyResponse(response, result);
    result.statusCode = headerState.status != 0 ? headerState.status : result.statusCode;
    result.headers = headerState.headers;
    if (result.aborted) result.error.clear();

    // A final line without a trailing newline
    if (!result.aborted && result.isSuccess()) {
        std::string line = StringUtils::trim(pending);
        if (!line.empty()) onLine(line);
    }
    return result;
}

HttpResponse HttpClient::downloadToFile(const std::string& url, const std::string& destination,
                                        int64_t offset, const ChunkCallback& onChunk,
                                        const HttpOptions& options) {
    HttpResponse result;
    std::exception_ptr failure;
    HeaderState headerState;
    bool bodyStarted = false;

    HttpOptions rangeOptions = options;
    if (offset > 0) {
        rangeOptions.headers["Range"] = "bytes=" + std::to_string(offset) + "-";
    }
    auto opts = mergeOptions(rangeOptions);

    auto mode = std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc);
    std::ofstream file(destination, mode);
    if (!file.is_open()) {
        result.error = "cannot open " + destination + " for writing";
        return result;
    }

    cpr::Session session;
    configureSession(session, url, opts);

    session.SetHeaderCallback(cpr::HeaderCallback{[&](std::string_view header, intptr_t) -> bool {
        headerState.consume(header);
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
        if (headerState.status < 200 || headerState.status >= 300) {
            result.body.append(data.data(), data.size());
            return true;
        }
        if (!bodyStarted) {
            bodyStarted = true;
            if (offset > 0 && headerState.status == 200) {
                // Server ignored the range; start the file over
                result.rangeIgnored = true;
                file.close();
                file.open(destination, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    failure = std::make_exception_ptr(
                        std::runtime_error("cannot reopen " + destination + " for writing"));
                    return false;
                }
                try {
                    if (onChunk && !onChunk(-offset)) {
                        result.aborted = true;
                        return false;
                    }
                } catch (...) {
                    failure = std::current_exception();
                    return false;
                }
            }
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file.good()) {
            failure = std::make_exception_ptr(std::runtime_error("write to " + destination + " failed"));
            return false;
        }
        try {
            if (onChunk && !onChunk(static_cast<int64_t>(data.size()))) {
                result.aborted = true;
                return false;
            }
        } catch (...) {
            failure = std::current_exception();
            return false;
        }
        return true;
    }});

    session.SetProgressCallback(cpr::ProgressCallback{[&](cpr::cpr_off_t, cpr::cpr_off_t,
                                                          cpr::cpr_off_t, cpr::cpr_off_t,
                                                          intptr_t) -> bool {
        if (failure || result.aborted) return false;
        try {
            if (onChunk && !onChunk(0)) {
                result.aborted = true;
                return false;
            }
        } catch (...) {
            failure = std::current_exception();
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Get();
    file.close();
    if (failure) std::rethrow_exception(failure);

    copyResponse(response, result);
    result.statusCode = headerState.status != 0 ? headerState.status : result.statusCode;
    result.headers = headerState.headers;
    if (result.aborted) result.error.clear();
    return result;
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result(output ? output : str.c_str());
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace modeld::utils
