// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/local_inventory.hpp>
#include <mirror/core/name_filter.hpp>
#include <spdlog/spdlog.h>

namespace mirror::core {

namespace fs = std::filesystem;

namespace {

// Visit regular files of dir, creating it first
template<typename Visitor>
std::error_code walk(const fs::path& dir, std::string_view extension, Visitor&& visit) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return ec;

    fs::directory_iterator it(dir, ec);
    if (ec) return ec;

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return ec;

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;

        auto name = it->path().filename().string();
        if (!has_extension(name, extension)) continue;
        visit(name, *it);
    }
    return ec;
}

} // namespace

std::expected<LocalInventory, std::error_code>
LocalInventory::scan(const fs::path& local_dir,
                     const fs::path& download_dir,
                     std::string_view extension) noexcept {
    try {
        LocalInventory inventory;

        auto ec = walk(local_dir, extension, [&](const std::string& name, const fs::directory_entry&) {
            inventory.names.insert(name);
        });
        if (ec) {
            spdlog::error("Cannot scan {}: {}", local_dir.string(), ec.message());
            return std::unexpected(ec);
        }

        ec = walk(download_dir, extension, [&](const std::string& name, const fs::directory_entry& entry) {
            inventory.names.insert(name);
            std::error_code size_ec;
            auto size = entry.file_size(size_ec);
            inventory.download_sizes[name] = size_ec ? 0 : static_cast<std::uint64_t>(size);
        });
        if (ec) {
            spdlog::error("Cannot scan {}: {}", download_dir.string(), ec.message());
            return std::unexpected(ec);
        }

        spdlog::debug("Local inventory: {} files ({} in {})",
                      inventory.names.size(), inventory.download_sizes.size(), download_dir.string());
        return inventory;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace mirror::core
