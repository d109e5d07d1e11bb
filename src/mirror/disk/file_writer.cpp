// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/disk/file_writer.hpp>
#include <cerrno>

namespace mirror::disk {

namespace {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:  return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:   return make_error_code(DiskErrc::access_denied);
        case ENAMETOOLONG:
        case EISDIR:  return make_error_code(DiskErrc::invalid_path);
        default:      return make_error_code(fallback);
    }
}

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

std::error_code FileWriter::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    close();

    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error_code(DiskErrc::invalid_path);
        }
    }

    const char* flags = (mode == OpenMode::append) ? "ab" : "wb";
    std::FILE* f = std::fopen(path.c_str(), flags);
    if (!f) {
        return from_errno(errno, DiskErrc::open_failed);
    }

    file_.reset(f);
    path_ = path;
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    std::size_t written = std::fwrite(data, 1, size, file_.get());
    bytes_written_ += written;
    if (written != size) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (file_) {
        std::fflush(file_.get());
        file_.reset();
    }
}

std::uint64_t size_on_disk(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

} // namespace mirror::disk
