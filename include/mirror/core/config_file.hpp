// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/config.hpp>
#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace mirror::core {

// JSON configuration file:
//
//   {
//     "server":   {"url": "...", "username": "...", "password": "..."},
//     "local":    {"local_dir": "current_files", "download_dir": "new_downloads"},
//     "download": {"max_retries": 3, "retry_delay": 5, "chunk_size": 8192,
//                  "progress_update_interval": 1.0},
//     "filter":   {"enabled": false, "pattern": ".*", "case_sensitive": false}
//   }
//
// Durations are in seconds. Missing sections and keys take their defaults.
class ConfigFile {
public:
    explicit ConfigFile(std::filesystem::path path = DEFAULT_CONFIG_PATH);

    [[nodiscard]] bool exists() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // INI file of the same stem, which this format does not read
    [[nodiscard]] std::filesystem::path ini_path() const;
    [[nodiscard]] bool has_unread_ini() const;

    [[nodiscard]] std::expected<SyncConfig, std::error_code> load() const noexcept;
    [[nodiscard]] std::error_code save(const SyncConfig& config) const noexcept;

    // Text form, used by load/save and tests
    [[nodiscard]] static std::expected<SyncConfig, std::error_code> parse(std::string_view text) noexcept;
    [[nodiscard]] static std::string serialize(const SyncConfig& config);

private:
    std::filesystem::path path_;
};

} // namespace mirror::core
