// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>

namespace mirror::core {

// Outcome of one file transfer
enum class TransferStatus : std::uint8_t {
    success,
    failed,
    cancelled
};

// Outcome of a whole sync run
enum class SyncStatus : std::uint8_t {
    success,    // Every planned file transferred (possibly none)
    failed,     // Listing failed or at least one file failed
    cancelled,  // Operator interrupt
    declined    // Operator answered no at the download confirmation
};

// Run state machine: idle -> listing -> planning -> awaiting_confirmation
// -> transferring -> summarizing -> done. cancelled is reachable from any
// state but done.
enum class RunState : std::uint8_t {
    idle,
    listing,
    planning,
    awaiting_confirmation,
    transferring,
    summarizing,
    done,
    cancelled
};

// Aggregate result of one sync() call
struct SyncResult {
    std::vector<std::string> downloaded;
    std::vector<std::string> failed;
    std::vector<std::string> filtered_out;
    std::uint64_t total_bytes_moved{0};
    std::chrono::system_clock::time_point started_at{};
    SyncStatus status{SyncStatus::success};

    [[nodiscard]] bool ok() const noexcept { return status == SyncStatus::success; }
};

[[nodiscard]] const char* to_string(TransferStatus status) noexcept;
[[nodiscard]] const char* to_string(SyncStatus status) noexcept;
[[nodiscard]] const char* to_string(RunState state) noexcept;

} // namespace mirror::core
