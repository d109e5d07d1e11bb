// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace mirror::core {

class Url {
public:
    // Only http and https are accepted
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path component, percent-decoded
    [[nodiscard]] std::string filename() const;

    // Directory form of this URL: path always ends with '/', no query
    [[nodiscard]] Url directory() const;

    // Resolve an href from a listing page against this URL
    [[nodiscard]] std::string resolve(std::string_view href) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_{"/"};
    std::string query_;
};

// "%20" -> " ", malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace mirror::core
