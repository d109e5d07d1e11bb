// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mirror::core {

// One entry of the remote directory listing
struct RemoteFileDescriptor {
    std::string name;
    std::string url;
    std::uint64_t size{0};
    std::string last_modified;
};

// A file in the download directory shorter than its remote counterpart
struct PartialDownloadRecord {
    std::string name;
    std::uint64_t local_size{0};
    std::uint64_t remote_size{0};
    double percent_complete{0.0};
};

struct DownloadPlanEntry {
    RemoteFileDescriptor descriptor;
    std::uint64_t resume_from_byte{0};   // 0 = fresh download

    [[nodiscard]] bool is_resume() const noexcept { return resume_from_byte > 0; }

    [[nodiscard]] std::uint64_t remaining_bytes() const noexcept {
        return descriptor.size > resume_from_byte ? descriptor.size - resume_from_byte : 0;
    }
};

using RemoteListing = std::vector<RemoteFileDescriptor>;

} // namespace mirror::core
