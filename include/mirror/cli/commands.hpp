// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/cancellation.hpp>
#include <mirror/core/config.hpp>
#include <mirror/core/http_session.hpp>
#include <mirror/core/sync_types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mirror::cli {

// Process exit codes
enum class ExitCode : int {
    success = 0,
    failure = 1,     // Failed, declined or invalid setup
    cancelled = 2    // Interrupted by the operator
};

// Command line arguments
struct CliArgs {
    std::string config_path{core::DEFAULT_CONFIG_PATH};
    std::string extension;

    // Persisted to the config file
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> local_dir;
    std::optional<std::string> download_dir;

    // This run only
    std::optional<std::string> filter;
    bool enable_filter{false};
    bool disable_filter{false};

    bool verbose{false};
    bool no_color{false};
    bool version{false};
    bool help{false};

    std::vector<std::string> errors;   // Unknown options, missing values
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Apply overrides to config. Returns true if a persisted field changed.
bool apply_overrides(const CliArgs& args, core::SyncConfig& config);

// Map a sync outcome to a process exit code
[[nodiscard]] ExitCode exit_code_for(const core::SyncResult& result) noexcept;

// Authenticated GET of the server URL
[[nodiscard]] std::error_code test_connection(core::HttpTransport& transport, const std::string& url) noexcept;

// Full run: configuration, connection test, sync
[[nodiscard]] ExitCode run(const CliArgs& args, const core::CancellationToken& token) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace mirror::cli
