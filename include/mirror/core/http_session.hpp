// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mirror::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-case names
    std::uint64_t content_length{0};
    std::string content_range;
    std::string last_modified;
    std::string content_type;
    bool accepts_ranges{false};

    [[nodiscard]] bool is_partial_content() const noexcept { return status_code == 206; }
};

struct HttpRequest {
    std::string url;
    std::uint64_t range_start{0};   // Sends "Range: bytes=<start>-" when > 0

    [[nodiscard]] bool ranged() const noexcept { return range_start > 0; }
};

struct Credentials {
    std::string username;
    std::string password;
};

// Called once the final status line and headers are known; false aborts
using HeadersHandler = std::function<bool(const HttpResponse&)>;

// Called for each piece of the body as it arrives; false aborts
using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

// Transport used by the lister and the fetcher
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Streaming GET. HTTP errors (>= 400) are returned without calling the
    // handlers, except 416 whose headers still reach on_headers before
    // SyncErrc::invalid_range is returned. A handler returning false yields
    // SyncErrc::cancelled.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    stream(const HttpRequest& request,
           const HeadersHandler& on_headers,
           const BodyHandler& on_body) noexcept = 0;

    // Buffered GET of a small text resource (listing pages, connection test)
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    fetch_text(const std::string& url) noexcept = 0;
};

// libcurl transport with basic authentication
class HttpSession final : public HttpTransport {
public:
    explicit HttpSession(Credentials credentials);
    ~HttpSession() override = default;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    stream(const HttpRequest& request,
           const HeadersHandler& on_headers,
           const BodyHandler& on_body) noexcept override;

    [[nodiscard]] std::expected<std::string, std::error_code>
    fetch_text(const std::string& url) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    Credentials credentials_;
};

// Total size from "bytes 1000-50000/50001"; 0 when absent or "*"
[[nodiscard]] std::uint64_t parse_content_range_total(std::string_view content_range) noexcept;

// Map an HTTP status (>= 400) to an error code
[[nodiscard]] std::error_code http_status_error(long status) noexcept;

} // namespace mirror::core
