// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace mirror::core {

enum class SyncErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    connection_lost,
    server_error,
    not_found,
    permission_denied,
    invalid_range,
    http_error,
    range_unsupported,
    truncated_transfer,
    invalid_url,
    invalid_filter,
    invalid_config,
    listing_malformed,
    credentials_missing,
    connection_failed,
    cancelled,
};

namespace detail {

struct SyncErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "mirror::sync";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<SyncErrc>(ev)) {
            case SyncErrc::success:              return "Success";
            case SyncErrc::network_error:        return "Network error";
            case SyncErrc::timeout:              return "Operation timed out";
            case SyncErrc::refused:              return "Connection refused";
            case SyncErrc::dns_error:            return "DNS resolution failed";
            case SyncErrc::ssl_error:            return "SSL/TLS error";
            case SyncErrc::connection_lost:      return "Connection lost";
            case SyncErrc::server_error:         return "Server error (5xx)";
            case SyncErrc::not_found:            return "Resource not found (404)";
            case SyncErrc::permission_denied:    return "Authentication failed (401/403)";
            case SyncErrc::invalid_range:        return "Requested range not satisfiable (416)";
            case SyncErrc::http_error:           return "HTTP client error (4xx)";
            case SyncErrc::range_unsupported:    return "Server does not honor range requests";
            case SyncErrc::truncated_transfer:   return "Transfer ended before the expected size";
            case SyncErrc::invalid_url:          return "Invalid URL";
            case SyncErrc::invalid_filter:       return "Invalid filter pattern";
            case SyncErrc::invalid_config:       return "Invalid configuration";
            case SyncErrc::listing_malformed:    return "Directory listing could not be parsed";
            case SyncErrc::credentials_missing:  return "Server credentials are incomplete";
            case SyncErrc::connection_failed:    return "Could not connect to server";
            case SyncErrc::cancelled:            return "Cancelled";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::SyncErrcCategory& sync_errc_category() noexcept {
    static detail::SyncErrcCategory category;
    return category;
}

inline std::error_code make_error_code(SyncErrc e) noexcept {
    return {static_cast<int>(e), sync_errc_category()};
}

// Errors worth another attempt after a delay
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != sync_errc_category()) return false;
    switch (static_cast<SyncErrc>(ec.value())) {
        case SyncErrc::network_error:
        case SyncErrc::timeout:
        case SyncErrc::refused:
        case SyncErrc::dns_error:
        case SyncErrc::ssl_error:
        case SyncErrc::connection_lost:
        case SyncErrc::server_error:
            return true;
        default:
            return false;
    }
}

} // namespace mirror::core

namespace std {

template<>
struct is_error_code_enum<mirror::core::SyncErrc> : true_type {};

} // namespace std
