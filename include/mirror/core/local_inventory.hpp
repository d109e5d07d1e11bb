// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace mirror::core {

// Snapshot of the local mirror: names across both directories plus the
// on-disk sizes of files in the download directory.
struct LocalInventory {
    std::set<std::string> names;
    std::map<std::string, std::uint64_t> download_sizes;

    [[nodiscard]] bool contains(const std::string& name) const noexcept {
        return names.find(name) != names.end();
    }

    // Size in the download directory, nullopt if the file is not there
    [[nodiscard]] std::optional<std::uint64_t> download_size(const std::string& name) const noexcept {
        auto it = download_sizes.find(name);
        if (it == download_sizes.end()) return std::nullopt;
        return it->second;
    }

    // Scan both directories (created if missing). Only regular files whose
    // names end with extension are recorded.
    [[nodiscard]] static std::expected<LocalInventory, std::error_code>
    scan(const std::filesystem::path& local_dir,
         const std::filesystem::path& download_dir,
         std::string_view extension) noexcept;
};

} // namespace mirror::core
