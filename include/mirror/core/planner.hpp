// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/local_inventory.hpp>
#include <mirror/core/name_filter.hpp>
#include <mirror/core/remote_file.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mirror::core {

struct PlanResult {
    std::vector<DownloadPlanEntry> entries;       // Remote order
    std::vector<std::string> filtered_out;        // Candidates the filter refused
    std::vector<PartialDownloadRecord> partials;  // Every partial seen, kept or not

    // Advisory total: sum of remaining bytes over entries
    [[nodiscard]] std::uint64_t estimated_bytes() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
};

// Reconcile the remote listing against the local mirror.
//
// A remote file is a candidate when its name is absent from both local
// directories, or when the download directory holds a shorter copy, in
// which case it resumes from that copy's length. Candidates are then
// passed through the name filter. Remote names without the extension are
// ignored.
[[nodiscard]] PlanResult plan(const RemoteListing& remote,
                              const LocalInventory& local,
                              std::string_view extension,
                              const NameFilter& filter);

} // namespace mirror::core
