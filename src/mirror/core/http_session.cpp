// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/http_session.hpp>
#include <mirror/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <string>

namespace mirror::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// State shared with the libcurl callbacks for one transfer
struct StreamContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const HeadersHandler* on_headers{nullptr};
    const BodyHandler* on_body{nullptr};
    bool headers_delivered{false};
    bool http_error{false};
    bool aborted_by_handler{false};
};

std::uint64_t parse_u64(const std::string& text) noexcept {
    if (text.empty()) return 0;
    char* end = nullptr;
    unsigned long long val = std::strtoull(text.c_str(), &end, 10);
    return (end == text.c_str()) ? 0 : static_cast<std::uint64_t>(val);
}

std::string header_value(const HttpResponse& response, const std::string& name) {
    auto it = response.headers.find(name);
    return it != response.headers.end() ? it->second : std::string{};
}

// Header callback; a new status line (redirect hop) starts a fresh header set
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    ctx->response.headers[lower_name] = std::string(value);
    return total;
}

// Fill the response from the received headers and hand it to the caller.
// Returns false when the transfer must stop.
bool deliver_headers(StreamContext& ctx) {
    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);

    auto& response = ctx.response;
    response.status_code = static_cast<std::int32_t>(http_code);
    response.content_length = parse_u64(header_value(response, "content-length"));
    response.content_range = header_value(response, "content-range");
    response.last_modified = header_value(response, "last-modified");
    response.content_type = header_value(response, "content-type");
    response.accepts_ranges = header_value(response, "accept-ranges").find("bytes") != std::string::npos;

    if (http_code >= 400) {
        // A 416 carries "Content-Range: bytes */<total>", which the caller
        // needs to tell a finished file from a stale offset
        if (http_code == 416 && ctx.on_headers && *ctx.on_headers) {
            (*ctx.on_headers)(response);
        }
        ctx.http_error = true;
        return false;
    }

    ctx.headers_delivered = true;
    if (ctx.on_headers && *ctx.on_headers && !(*ctx.on_headers)(response)) {
        ctx.aborted_by_handler = true;
        return false;
    }
    return true;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    std::size_t bytes = size * nmemb;
    if (!ctx) return 0;

    if (!ctx->headers_delivered && !deliver_headers(*ctx)) {
        return 0;  // Aborts with CURLE_WRITE_ERROR
    }

    if (ctx->on_body && *ctx->on_body && !(*ctx->on_body)(ptr, bytes)) {
        ctx->aborted_by_handler = true;
        return 0;
    }
    return bytes;
}

std::error_code curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:       return make_error_code(SyncErrc::timeout);
        case CURLE_COULDNT_CONNECT:          return make_error_code(SyncErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:    return make_error_code(SyncErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION: return make_error_code(SyncErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:              return make_error_code(SyncErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:     return make_error_code(SyncErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:      return make_error_code(SyncErrc::cancelled);
        default:                             return make_error_code(SyncErrc::network_error);
    }
}

void configure(CURL* curl, const std::string& url, const Credentials& credentials) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    if (!credentials.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl, CURLOPT_USERNAME, credentials.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, credentials.password.c_str());
    }

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Separate connect and read timeouts; a stalled body counts as a read timeout
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(READ_TIMEOUT_SEC));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Signals are handled by the application
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(Credentials credentials)
    : credentials_(std::move(credentials)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::stream(const HttpRequest& request,
                    const HeadersHandler& on_headers,
                    const BodyHandler& on_body) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(SyncErrc::network_error));
    }

    StreamContext ctx;
    ctx.curl = curl.ptr;
    ctx.on_headers = &on_headers;
    ctx.on_body = &on_body;

    configure(curl.ptr, request.url, credentials_);

    std::string range;
    if (request.ranged()) {
        range = std::to_string(request.range_start) + "-";
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.http_error) {
        return std::unexpected(http_status_error(ctx.response.status_code));
    }
    if (ctx.aborted_by_handler) {
        return std::unexpected(make_error_code(SyncErrc::cancelled));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result));
    }

    // Empty bodies never reach the write callback
    if (!ctx.headers_delivered && !deliver_headers(ctx)) {
        if (ctx.http_error) {
            return std::unexpected(http_status_error(ctx.response.status_code));
        }
        return std::unexpected(make_error_code(SyncErrc::cancelled));
    }

    return ctx.response;
}

std::expected<std::string, std::error_code>
HttpSession::fetch_text(const std::string& url) noexcept {
    std::string body;
    HeadersHandler on_headers = [](const HttpResponse&) { return true; };
    BodyHandler on_body = [&body](const char* data, std::size_t size) {
        body.append(data, size);
        return true;
    };

    auto response = stream(HttpRequest{url, 0}, on_headers, on_body);
    if (!response) {
        return std::unexpected(response.error());
    }
    return body;
}

//=============================================================================
// Helpers
//=============================================================================

std::uint64_t parse_content_range_total(std::string_view content_range) noexcept {
    auto slash = content_range.rfind('/');
    if (slash == std::string_view::npos) return 0;

    std::uint64_t total = 0;
    bool any = false;
    for (char c : content_range.substr(slash + 1)) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        total = total * 10 + static_cast<std::uint64_t>(c - '0');
        any = true;
    }
    return any ? total : 0;
}

std::error_code http_status_error(long status) noexcept {
    if (status == 401 || status == 403) return make_error_code(SyncErrc::permission_denied);
    if (status == 404 || status == 410) return make_error_code(SyncErrc::not_found);
    if (status == 416) return make_error_code(SyncErrc::invalid_range);
    if (status == 408) return make_error_code(SyncErrc::timeout);
    if (status == 429 || status >= 500) return make_error_code(SyncErrc::server_error);
    return make_error_code(SyncErrc::http_error);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace mirror::core
