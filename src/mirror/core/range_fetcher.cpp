// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/range_fetcher.hpp>
#include <mirror/core/size_format.hpp>
#include <mirror/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace mirror::core {

namespace {

FetchResult make_result(TransferStatus status, std::uint64_t bytes, std::error_code ec = {}) {
    return FetchResult{status, bytes, ec};
}

} // namespace

RangeFetcher::RangeFetcher(HttpTransport& transport, ProgressTracker& tracker, FetchOptions options)
    : transport_(transport)
    , tracker_(tracker)
    , options_(options) {
    options_.max_retries = std::max<std::uint32_t>(options_.max_retries, 1);
    options_.chunk_size = std::max<std::size_t>(options_.chunk_size, 1);
}

//=============================================================================
// Retry loop
//=============================================================================

FetchResult RangeFetcher::fetch(const RemoteFileDescriptor& descriptor,
                                const std::filesystem::path& local_path,
                                std::uint64_t resume_from_byte,
                                const CancellationToken& token) {
    std::uint64_t start = resume_from_byte;
    std::uint64_t bytes_written = 0;
    bool range_fallback_used = false;
    std::uint32_t attempt_no = 1;

    while (attempt_no <= options_.max_retries) {
        if (token.cancelled()) {
            spdlog::warn("Termination requested before download attempt for {}", descriptor.name);
            tracker_.finish(false);
            return make_result(TransferStatus::cancelled, bytes_written,
                               make_error_code(SyncErrc::cancelled));
        }

        // Checkpoint already covers the file; nothing left to request
        if (start > 0 && descriptor.size > 0 && start >= descriptor.size) {
            spdlog::info("{} already complete on disk ({})", descriptor.name, format_size(start));
            tracker_.finish(true);
            return make_result(TransferStatus::success, bytes_written);
        }

        if (start > 0) {
            spdlog::info("Resuming download of {} from byte {}", descriptor.name, start);
        }

        Attempt attempt;
        auto ec = run_attempt(descriptor, local_path, start, token, attempt, bytes_written);

        if (!ec) {
            auto final_size = disk::size_on_disk(local_path);
            if (attempt.expected_total > 0 && final_size < attempt.expected_total) {
                spdlog::warn("Downloaded file size ({}) is less than expected ({}) for {}",
                             final_size, attempt.expected_total, descriptor.name);
                tracker_.finish(false);
                return make_result(TransferStatus::failed, bytes_written,
                                   make_error_code(SyncErrc::truncated_transfer));
            }
            tracker_.finish(true);
            return make_result(TransferStatus::success, bytes_written);
        }

        // 416 on a resume: either the file is already whole (the listing
        // size was rounded) or the offset is stale
        if (start > 0 && ec == SyncErrc::invalid_range) {
            auto on_disk = disk::size_on_disk(local_path);
            if (attempt.unsatisfiable_total > 0 && on_disk == attempt.unsatisfiable_total) {
                spdlog::info("{} already complete on disk ({}), server reports the same size",
                             descriptor.name, format_size(on_disk));
                tracker_.finish(true);
                return make_result(TransferStatus::success, bytes_written);
            }
            spdlog::warn("Server rejected range from byte {} for {} (remote size {})",
                         start, descriptor.name, attempt.unsatisfiable_total);
            attempt.range_ignored = true;
        }

        if (attempt.range_ignored) {
            if (range_fallback_used) {
                spdlog::error("Server ignored the range request again for {}", descriptor.name);
                tracker_.finish(false);
                return make_result(TransferStatus::failed, bytes_written,
                                   make_error_code(SyncErrc::range_unsupported));
            }
            spdlog::warn("Server doesn't support range requests, starting {} from the beginning",
                         descriptor.name);
            range_fallback_used = true;
            start = 0;
            continue;
        }

        if (attempt.disk_error) {
            spdlog::error("Cannot write {}: {}", local_path.string(), attempt.disk_error.message());
            tracker_.finish(false);
            return make_result(TransferStatus::failed, bytes_written, attempt.disk_error);
        }

        if (token.cancelled() || ec == SyncErrc::cancelled) {
            spdlog::warn("Download of {} interrupted at {}", descriptor.name,
                         format_size(disk::size_on_disk(local_path)));
            tracker_.finish(false);
            return make_result(TransferStatus::cancelled, bytes_written,
                               make_error_code(SyncErrc::cancelled));
        }

        if (!is_transient(ec)) {
            spdlog::error("Download of {} failed: {}", descriptor.name, ec.message());
            tracker_.finish(false);
            return make_result(TransferStatus::failed, bytes_written, ec);
        }

        if (attempt_no == options_.max_retries) {
            spdlog::error("Download of {} failed after {} attempts: {}",
                          descriptor.name, options_.max_retries, ec.message());
            tracker_.finish(false);
            return make_result(TransferStatus::failed, bytes_written, ec);
        }

        // A server that ignored the range once gets full requests from now on
        start = range_fallback_used ? 0 : disk::size_on_disk(local_path);
        spdlog::warn("Download error (attempt {}/{}) for {}: {}",
                     attempt_no, options_.max_retries, descriptor.name, ec.message());
        spdlog::info("Retrying in {} ms from byte {}...", options_.retry_delay.count(), start);

        if (!token.sleep_for(options_.retry_delay)) {
            tracker_.finish(false);
            return make_result(TransferStatus::cancelled, bytes_written,
                               make_error_code(SyncErrc::cancelled));
        }
        ++attempt_no;
    }

    // max_retries is at least one, so the loop always returns
    return make_result(TransferStatus::failed, bytes_written, make_error_code(SyncErrc::network_error));
}

//=============================================================================
// Single attempt
//=============================================================================

std::error_code RangeFetcher::run_attempt(const RemoteFileDescriptor& descriptor,
                                          const std::filesystem::path& local_path,
                                          std::uint64_t start,
                                          const CancellationToken& token,
                                          Attempt& attempt,
                                          std::uint64_t& bytes_written) {
    disk::FileWriter writer;
    std::vector<char> buffer;
    buffer.reserve(options_.chunk_size);
    std::uint64_t current = start;

    // Write the buffered chunk and report it
    auto commit = [&]() -> bool {
        if (buffer.empty()) return true;
        if (auto ec = writer.write(buffer.data(), buffer.size())) {
            attempt.disk_error = ec;
            return false;
        }
        current += buffer.size();
        bytes_written += buffer.size();
        buffer.clear();
        tracker_.on_progress(current, attempt.expected_total, descriptor.name);
        return true;
    };

    HeadersHandler on_headers = [&](const HttpResponse& response) {
        if (response.status_code == 416) {
            attempt.unsatisfiable_total = parse_content_range_total(response.content_range);
            return false;
        }
        if (start > 0 && !response.is_partial_content()) {
            attempt.range_ignored = true;
            return false;
        }

        if (response.is_partial_content()) {
            attempt.expected_total = parse_content_range_total(response.content_range);
        } else if (response.headers.count("content-length") != 0) {
            attempt.expected_total = response.content_length + start;
        }

        auto mode = start > 0 ? disk::OpenMode::append : disk::OpenMode::truncate;
        if (auto ec = writer.open(local_path, mode)) {
            attempt.disk_error = ec;
            return false;
        }

        tracker_.start();
        return true;
    };

    BodyHandler on_body = [&](const char* data, std::size_t size) {
        while (size > 0) {
            auto take = std::min(options_.chunk_size - buffer.size(), size);
            buffer.insert(buffer.end(), data, data + take);
            data += take;
            size -= take;

            if (buffer.size() == options_.chunk_size) {
                if (!commit()) return false;
                if (token.cancelled()) return false;
            }
        }
        return true;
    };

    auto response = transport_.stream(HttpRequest{descriptor.url, start}, on_headers, on_body);

    // Whatever arrived is kept on every exit path
    if (writer.is_open()) {
        if (!attempt.disk_error) {
            commit();
        }
        if (auto ec = writer.flush(); ec && !attempt.disk_error) {
            attempt.disk_error = ec;
        }
        writer.close();
    }

    if (attempt.disk_error) {
        return attempt.disk_error;
    }
    if (!response) {
        return response.error();
    }
    return {};
}

} // namespace mirror::core
