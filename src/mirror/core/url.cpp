// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace mirror::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }

    auto rest_start = scheme_end + 3;

    // Authority ends at the first of: /, ?, # or end
    auto host_end = url_str.find_first_of("/?#", rest_start);
    if (host_end == std::string_view::npos) {
        host_end = url_str.length();
    }

    // Skip user:pass@ if present - credentials are passed separately
    auto authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(SyncErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon_pos = authority.rfind(':');
        if (colon_pos != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon_pos));
            url.port_ = std::string(authority.substr(colon_pos + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }
    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(make_error_code(SyncErrc::invalid_url));
    }

    auto fragment_start = url_str.find('#', host_end);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }
    auto query_start = url_str.find('?', host_end);
    if (query_start == std::string_view::npos || query_start > fragment_start) {
        query_start = fragment_start;
    }

    if (host_end < query_start && url_str[host_end] == '/') {
        url.path_ = std::string(url_str.substr(host_end, query_start - host_end));
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return percent_decode(path_);
    }
    return percent_decode(std::string_view(path_).substr(last_slash + 1));
}

Url Url::directory() const {
    Url dir = *this;
    dir.query_.clear();
    if (dir.path_.empty() || dir.path_.back() != '/') {
        dir.path_ += '/';
    }
    return dir;
}

std::string Url::resolve(std::string_view href) const {
    if (href.starts_with("http://") || href.starts_with("https://")) {
        return std::string(href);
    }
    if (href.starts_with("//")) {
        return scheme_ + ":" + std::string(href);
    }
    if (href.starts_with("/")) {
        return base() + std::string(href);
    }

    // Relative to the directory holding the current path
    std::string dir_path = path_;
    auto last_slash = dir_path.rfind('/');
    dir_path = (last_slash == std::string::npos) ? "/" : dir_path.substr(0, last_slash + 1);

    return base() + dir_path + std::string(href);
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace mirror::core
