// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string>

namespace mirror::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t READ_TIMEOUT_SEC = 30;          // No bytes for this long aborts the transfer
constexpr std::uint32_t CONNECTION_TEST_TIMEOUT_SEC = 10;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr std::chrono::seconds DEFAULT_RETRY_DELAY{5};
constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;
constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{1000};

constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{100};

constexpr const char* DEFAULT_CONFIG_PATH = "sync_config.json";
constexpr const char* DEFAULT_LOCAL_DIR = "current_files";
constexpr const char* DEFAULT_DOWNLOAD_DIR = "new_downloads";
constexpr const char* DEFAULT_FILTER_PATTERN = ".*";
constexpr const char* LOG_FILE_NAME = "sync_log.txt";

// Flat run configuration, as loaded from the config file plus CLI overrides
struct SyncConfig {
    // [server]
    std::string server_url;
    std::string username;
    std::string password;

    // [local]
    std::string local_dir{DEFAULT_LOCAL_DIR};
    std::string download_dir{DEFAULT_DOWNLOAD_DIR};

    // [download]
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds retry_delay{DEFAULT_RETRY_DELAY};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::chrono::milliseconds progress_interval{DEFAULT_PROGRESS_INTERVAL};

    // [filter] - disabled means nothing is downloaded
    bool filter_enabled{false};
    std::string filter_pattern{DEFAULT_FILTER_PATTERN};
    bool filter_case_sensitive{false};

    [[nodiscard]] bool has_credentials() const noexcept;
};

} // namespace mirror::core
