// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/config_file.hpp>
#include <mirror/core/error.hpp>
#include <mirror/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace mirror::core {

namespace {

using nlohmann::json;

bool blank(const std::string& text) noexcept {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// Value of section.key, or fallback when absent or null
template<typename T>
T value_or(const json& root, const char* section, const char* key, T fallback) {
    if (!root.contains(section) || !root[section].is_object()) return fallback;
    const auto& sec = root[section];
    if (!sec.contains(key) || sec[key].is_null()) return fallback;
    return sec[key].get<T>();
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

double ms_to_seconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

} // namespace

bool SyncConfig::has_credentials() const noexcept {
    return !blank(server_url) && !blank(username) && !blank(password);
}

//=============================================================================
// ConfigFile
//=============================================================================

ConfigFile::ConfigFile(std::filesystem::path path)
    : path_(std::move(path)) {}

bool ConfigFile::exists() const noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

std::filesystem::path ConfigFile::ini_path() const {
    auto ini = path_;
    return ini.replace_extension(".ini");
}

bool ConfigFile::has_unread_ini() const {
    if (exists() || path_.extension() == ".ini") return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(ini_path(), ec);
}

std::expected<SyncConfig, std::error_code> ConfigFile::load() const noexcept {
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        auto config = parse(buffer.str());
        if (!config) {
            spdlog::error("Invalid configuration file {}", path_.string());
        }
        return config;
    } catch (const std::exception& e) {
        spdlog::error("Cannot read configuration file {}: {}", path_.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code ConfigFile::save(const SyncConfig& config) const noexcept {
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        std::ofstream file(path_, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::open_failed);
        }

        file << serialize(config) << '\n';
        file.flush();
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }

        spdlog::info("Configuration saved to {}", path_.string());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Cannot write configuration file {}: {}", path_.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<SyncConfig, std::error_code> ConfigFile::parse(std::string_view text) noexcept {
    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            return std::unexpected(make_error_code(SyncErrc::invalid_config));
        }

        SyncConfig config;

        config.server_url = value_or<std::string>(root, "server", "url", config.server_url);
        config.username = value_or<std::string>(root, "server", "username", config.username);
        config.password = value_or<std::string>(root, "server", "password", config.password);

        config.local_dir = value_or<std::string>(root, "local", "local_dir", config.local_dir);
        config.download_dir = value_or<std::string>(root, "local", "download_dir", config.download_dir);

        config.max_retries = value_or<std::uint32_t>(root, "download", "max_retries", config.max_retries);
        config.retry_delay = seconds_to_ms(
            value_or<double>(root, "download", "retry_delay", ms_to_seconds(config.retry_delay)));
        config.chunk_size = value_or<std::size_t>(root, "download", "chunk_size", config.chunk_size);
        config.progress_interval = seconds_to_ms(
            value_or<double>(root, "download", "progress_update_interval", ms_to_seconds(config.progress_interval)));

        config.filter_enabled = value_or<bool>(root, "filter", "enabled", config.filter_enabled);
        config.filter_pattern = value_or<std::string>(root, "filter", "pattern", config.filter_pattern);
        config.filter_case_sensitive = value_or<bool>(root, "filter", "case_sensitive", config.filter_case_sensitive);

        if (config.max_retries == 0 || config.chunk_size == 0 ||
            config.retry_delay.count() < 0 || config.progress_interval.count() < 0) {
            return std::unexpected(make_error_code(SyncErrc::invalid_config));
        }

        return config;
    } catch (const json::exception& e) {
        spdlog::debug("Configuration parse error: {}", e.what());
        return std::unexpected(make_error_code(SyncErrc::invalid_config));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(SyncErrc::invalid_config));
    }
}

std::string ConfigFile::serialize(const SyncConfig& config) {
    json root;
    root["server"] = {
        {"url", config.server_url},
        {"username", config.username},
        {"password", config.password}
    };
    root["local"] = {
        {"local_dir", config.local_dir},
        {"download_dir", config.download_dir}
    };
    root["download"] = {
        {"max_retries", config.max_retries},
        {"retry_delay", ms_to_seconds(config.retry_delay)},
        {"chunk_size", config.chunk_size},
        {"progress_update_interval", ms_to_seconds(config.progress_interval)}
    };
    root["filter"] = {
        {"enabled", config.filter_enabled},
        {"pattern", config.filter_pattern},
        {"case_sensitive", config.filter_case_sensitive}
    };
    return root.dump(4);
}

} // namespace mirror::core
