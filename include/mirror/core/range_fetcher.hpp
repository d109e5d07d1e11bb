// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/cancellation.hpp>
#include <mirror/core/config.hpp>
#include <mirror/core/http_session.hpp>
#include <mirror/core/progress_tracker.hpp>
#include <mirror/core/remote_file.hpp>
#include <mirror/core/sync_types.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <system_error>

namespace mirror::core {

struct FetchOptions {
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};      // Total attempts, at least one is made
    std::chrono::milliseconds retry_delay{DEFAULT_RETRY_DELAY};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
};

struct FetchResult {
    TransferStatus status{TransferStatus::failed};
    std::uint64_t bytes_written{0};   // Across all attempts of this call
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return status == TransferStatus::success; }
};

// Resumable, retried download of one remote file to one local path.
//
// The local file's length is the only checkpoint: a resume appends to it,
// a retry re-reads it. A resume the server does not answer with 206 (416
// included) restarts from byte 0 once; after that restart retries begin at
// byte 0 too. Cancellation never truncates or deletes the file.
class RangeFetcher {
public:
    RangeFetcher(HttpTransport& transport, ProgressTracker& tracker, FetchOptions options);

    [[nodiscard]] FetchResult fetch(const RemoteFileDescriptor& descriptor,
                                    const std::filesystem::path& local_path,
                                    std::uint64_t resume_from_byte,
                                    const CancellationToken& token);

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    // Per-attempt observations from the transfer callbacks
    struct Attempt {
        std::uint64_t expected_total{0};   // 0 = unknown, verification skipped
        std::uint64_t unsatisfiable_total{0};   // Remote size reported by a 416
        bool range_ignored{false};
        std::error_code disk_error;
    };

    [[nodiscard]] std::error_code run_attempt(const RemoteFileDescriptor& descriptor,
                                              const std::filesystem::path& local_path,
                                              std::uint64_t start,
                                              const CancellationToken& token,
                                              Attempt& attempt,
                                              std::uint64_t& bytes_written);

    HttpTransport& transport_;
    ProgressTracker& tracker_;
    FetchOptions options_;
};

} // namespace mirror::core
