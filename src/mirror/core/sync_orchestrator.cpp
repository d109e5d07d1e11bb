// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/sync_orchestrator.hpp>
#include <mirror/core/local_inventory.hpp>
#include <mirror/core/size_format.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>
#include <utility>

namespace mirror::core {

namespace {

constexpr const char* MATCH_ALL_PATTERN = ".*";

} // namespace

SyncOrchestrator::SyncOrchestrator(SyncConfig config,
                                   DirectoryLister& lister,
                                   RangeFetcher& fetcher,
                                   Presenter& presenter,
                                   ConfirmFn confirm,
                                   CancellationToken token)
    : config_(std::move(config))
    , lister_(lister)
    , fetcher_(fetcher)
    , presenter_(presenter)
    , confirm_(std::move(confirm))
    , token_(std::move(token)) {}

SyncResult SyncOrchestrator::sync(std::string_view extension) {
    SyncResult result;
    result.started_at = std::chrono::system_clock::now();
    state_ = RunState::idle;

    bool filter_enabled = config_.filter_enabled;
    std::string pattern = config_.filter_pattern;
    summary_since_ = std::chrono::steady_clock::now();
    run_filter_enabled_ = false;
    run_pattern_ = pattern;

    if (!filter_enabled) {
        presenter_.notice(Severity::warning,
            "File filtering is disabled! No files will be downloaded unless you enable filtering.");
        presenter_.notice(Severity::info, "Enable filtering with --enable-filter or --filter options.");

        if (!confirm_ || !confirm_("Do you want to enable filtering with pattern '.*' (all files)?")) {
            if (token_.cancelled()) return cancel(result);
            spdlog::info("Filtering remains disabled. No files will be downloaded.");
            return finish(result, SyncStatus::success);
        }
        filter_enabled = true;
        pattern = MATCH_ALL_PATTERN;
        presenter_.notice(Severity::success, "Filtering enabled with pattern '.*' to download all files");
    }

    //=========================================================================
    // Listing
    //=========================================================================

    state_ = RunState::listing;
    spdlog::info("Connecting to {}...", config_.server_url);
    auto listing = lister_.list(extension, token_);

    if (token_.cancelled()) {
        spdlog::warn("Termination requested after server files listing");
        return cancel(result);
    }
    if (!listing) {
        spdlog::error("Failed to get file list from server: {}", listing.error().message());
        presenter_.notice(Severity::error, "Failed to get file list from server: " + listing.error().message());
        return finish(result, SyncStatus::failed);
    }
    if (listing->empty()) {
        spdlog::error("Failed to get file list from server: no files listed");
        presenter_.notice(Severity::error, "No files found on server");
        return finish(result, SyncStatus::failed);
    }
    spdlog::info("Found {} files on server", listing->size());

    //=========================================================================
    // Planning
    //=========================================================================

    state_ = RunState::planning;
    auto inventory = LocalInventory::scan(config_.local_dir, config_.download_dir, extension);
    if (!inventory) {
        presenter_.notice(Severity::error, "Cannot read local directories: " + inventory.error().message());
        return finish(result, SyncStatus::failed);
    }

    auto filter = build_filter(filter_enabled, pattern);
    run_filter_enabled_ = filter.is_active();
    run_pattern_ = pattern;
    auto plan_result = plan(*listing, *inventory, extension, filter);
    result.filtered_out = plan_result.filtered_out;

    if (filter.is_active()) {
        if (!plan_result.filtered_out.empty()) {
            spdlog::info("Filtered out {} files using pattern: '{}'", plan_result.filtered_out.size(), pattern);
        }
        spdlog::info("Matched {} files with pattern: '{}'", plan_result.entries.size(), pattern);
    }

    if (token_.cancelled()) {
        spdlog::warn("Termination requested after determining files to download");
        return cancel(result);
    }

    if (plan_result.empty()) {
        if (filter.is_active()) {
            presenter_.notice(Severity::success,
                "All matching files are up to date or none match the filter pattern!");
        } else {
            presenter_.notice(Severity::warning, "Filtering is disabled. No files will be downloaded.");
        }
        return finish(result, SyncStatus::success);
    }

    PlanSummary summary;
    summary.file_count = plan_result.entries.size();
    summary.filtered_count = plan_result.filtered_out.size();
    summary.partials = plan_result.partials;
    summary.total_bytes = plan_result.estimated_bytes();
    summary.download_dir = config_.download_dir;
    presenter_.plan_summary(summary);

    //=========================================================================
    // Confirmation
    //=========================================================================

    if (token_.cancelled()) {
        spdlog::warn("Termination requested after showing download summary");
        return cancel(result);
    }

    state_ = RunState::awaiting_confirmation;
    bool accepted = confirm_ && confirm_("Continue with download?");
    if (token_.cancelled()) {
        return cancel(result);
    }
    if (!accepted) {
        spdlog::info("Download cancelled by user");
        return finish(result, SyncStatus::declined);
    }

    //=========================================================================
    // Transfer
    //=========================================================================

    state_ = RunState::transferring;
    summary_since_ = std::chrono::steady_clock::now();
    transfer(plan_result, result);

    state_ = RunState::summarizing;
    bool cancelled = token_.cancelled();
    result.status = cancelled ? SyncStatus::cancelled
                  : result.failed.empty() ? SyncStatus::success
                  : SyncStatus::failed;

    emit_summary(result);

    spdlog::info("Sync finished: {} downloaded, {} failed, {} moved ({})",
                 result.downloaded.size(), result.failed.size(),
                 format_size(result.total_bytes_moved), to_string(result.status));

    state_ = cancelled ? RunState::cancelled : RunState::done;
    return result;
}

NameFilter SyncOrchestrator::build_filter(bool enabled, const std::string& pattern) {
    if (!enabled) {
        spdlog::warn("Filtering is disabled. No files will be downloaded.");
        return NameFilter::disabled();
    }

    auto filter = NameFilter::compile(pattern, config_.filter_case_sensitive);
    if (filter.state() == NameFilter::State::rejected) {
        spdlog::error("Invalid regex pattern '{}': {}", pattern, filter.error_message());
        presenter_.notice(Severity::warning,
            "Invalid regex pattern '" + pattern + "': " + filter.error_message());
        presenter_.notice(Severity::warning, "Regex filtering disabled due to invalid pattern");
    }
    return filter;
}

void SyncOrchestrator::transfer(const PlanResult& plan_result, SyncResult& result) {
    const auto count = plan_result.entries.size();

    for (std::size_t i = 0; i < count; ++i) {
        if (token_.cancelled()) {
            spdlog::warn("Termination requested, stopping before remaining {} files", count - i);
            break;
        }

        const auto& entry = plan_result.entries[i];
        const auto& name = entry.descriptor.name;

        presenter_.file_started(FileStartEvent{
            i + 1, count, name, entry.descriptor.size, entry.resume_from_byte
        });
        spdlog::info("[{}/{}] Downloading {} ({})", i + 1, count, name, format_size(entry.descriptor.size));

        auto local_path = std::filesystem::path(config_.download_dir) / name;
        auto fetched = fetcher_.fetch(entry.descriptor, local_path, entry.resume_from_byte, token_);

        result.total_bytes_moved += fetched.bytes_written;
        presenter_.file_finished(FileEndEvent{name, fetched.status, fetched.bytes_written, fetched.error});

        if (fetched.ok()) {
            result.downloaded.push_back(name);
            continue;
        }

        result.failed.push_back(name);
        if (fetched.status == TransferStatus::cancelled) {
            spdlog::warn("Transfer of {} cancelled", name);
            break;
        }
        spdlog::error("Failed to download {}: {}", name, fetched.error.message());
    }
}

void SyncOrchestrator::emit_summary(const SyncResult& result) {
    RunSummary run_summary;
    run_summary.result = &result;
    run_summary.elapsed = std::chrono::steady_clock::now() - summary_since_;
    run_summary.filter_enabled = run_filter_enabled_;
    run_summary.filter_pattern = run_pattern_;
    run_summary.filter_case_sensitive = config_.filter_case_sensitive;
    run_summary.download_dir = config_.download_dir;
    presenter_.run_summary(run_summary);
}

// Interrupt outside the transfer loop: nothing is in flight, only the summary is left
SyncResult SyncOrchestrator::cancel(SyncResult& result) {
    result.status = SyncStatus::cancelled;
    state_ = RunState::summarizing;
    emit_summary(result);
    state_ = RunState::cancelled;
    return result;
}

SyncResult SyncOrchestrator::finish(SyncResult& result, SyncStatus status) {
    result.status = status;
    state_ = RunState::done;
    return result;
}

} // namespace mirror::core
