// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace mirror::disk {

enum class OpenMode : std::uint8_t {
    truncate, // Start a fresh file
    append    // Continue an existing partial file
};

// Sequential writer for one download target.
// The handle is owned exclusively and closed on destruction.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    // Open file, creating parent directories as needed
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, OpenMode mode) noexcept;

    // Append data at the current end of file
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
};

// Size of a file on disk, 0 when it does not exist.
// The on-disk length is the resume checkpoint for a partial download.
[[nodiscard]] std::uint64_t size_on_disk(const std::filesystem::path& path) noexcept;

} // namespace mirror::disk
