// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/cancellation.hpp>
#include <mirror/core/config.hpp>
#include <mirror/core/http_session.hpp>
#include <mirror/core/remote_file.hpp>
#include <mirror/core/url.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

namespace mirror::core {

// Source of the remote inventory
class DirectoryLister {
public:
    virtual ~DirectoryLister() = default;

    // Remote files whose names end with extension (all when empty)
    [[nodiscard]] virtual std::expected<RemoteListing, std::error_code>
    list(std::string_view extension, const CancellationToken& token) = 0;
};

// Apache "Index of" page reader
class ApacheIndexLister final : public DirectoryLister {
public:
    ApacheIndexLister(HttpTransport& transport,
                      Url listing_url,
                      std::uint32_t max_retries = DEFAULT_MAX_RETRIES,
                      std::chrono::milliseconds retry_delay = DEFAULT_RETRY_DELAY);

    [[nodiscard]] std::expected<RemoteListing, std::error_code>
    list(std::string_view extension, const CancellationToken& token) override;

    [[nodiscard]] const Url& listing_url() const noexcept { return listing_url_; }

    // Parse an index page. Rows need at least four cells: icon, link,
    // last modified, size. Directory and sort links are skipped.
    [[nodiscard]] static std::expected<RemoteListing, std::error_code>
    parse_listing(std::string_view html, const Url& base, std::string_view extension);

    // "176M" -> 184549376; K/M/G/T are powers of 1024, "-" is 0
    [[nodiscard]] static std::uint64_t parse_size(std::string_view text);

private:
    HttpTransport& transport_;
    Url listing_url_;
    std::uint32_t max_retries_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace mirror::core
