// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/planner.hpp>
#include <spdlog/spdlog.h>

namespace mirror::core {

std::uint64_t PlanResult::estimated_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& entry : entries) {
        total += entry.remaining_bytes();
    }
    return total;
}

PlanResult plan(const RemoteListing& remote,
                const LocalInventory& local,
                std::string_view extension,
                const NameFilter& filter) {
    PlanResult result;
    std::vector<DownloadPlanEntry> candidates;

    for (const auto& file : remote) {
        if (!has_extension(file.name, extension)) continue;

        std::uint64_t resume_from = 0;
        auto partial_size = local.download_size(file.name);
        bool partial = partial_size && *partial_size < file.size;

        if (partial) {
            resume_from = *partial_size;
            result.partials.push_back(PartialDownloadRecord{
                file.name,
                *partial_size,
                file.size,
                file.size > 0 ? static_cast<double>(*partial_size) * 100.0 / static_cast<double>(file.size) : 0.0
            });
        } else if (local.contains(file.name)) {
            continue;  // Already mirrored
        }

        candidates.push_back(DownloadPlanEntry{file, resume_from});
    }

    for (auto& candidate : candidates) {
        if (filter.accepts(candidate.descriptor.name)) {
            result.entries.push_back(std::move(candidate));
        } else {
            result.filtered_out.push_back(candidate.descriptor.name);
        }
    }

    spdlog::debug("Plan: {} candidates, {} kept, {} filtered out, {} partial",
                  candidates.size(), result.entries.size(),
                  result.filtered_out.size(), result.partials.size());
    return result;
}

} // namespace mirror::core
