// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/remote_file.hpp>
#include <mirror/core/sync_types.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mirror::core {

struct ProgressEvent {
    std::string label;
    std::uint64_t current_bytes{0};
    std::uint64_t total_bytes{0};
    double percent{0.0};
    double speed_bps{0.0};
    std::optional<std::chrono::seconds> eta;   // nullopt = indeterminate
};

struct FileStartEvent {
    std::size_t index{0};   // 1-based
    std::size_t count{0};
    std::string name;
    std::uint64_t size{0};
    std::uint64_t resume_from_byte{0};
};

struct FileEndEvent {
    std::string name;
    TransferStatus status{TransferStatus::failed};
    std::uint64_t bytes_written{0};
    std::error_code error;
};

struct PlanSummary {
    std::size_t file_count{0};
    std::size_t filtered_count{0};
    std::vector<PartialDownloadRecord> partials;
    std::uint64_t total_bytes{0};
    std::string download_dir;
};

struct RunSummary {
    const SyncResult* result{nullptr};
    std::chrono::duration<double> elapsed{0.0};
    bool filter_enabled{false};
    std::string filter_pattern;
    bool filter_case_sensitive{false};
    std::string download_dir;
};

enum class Severity : std::uint8_t { info, success, warning, error };

// Receives structured events from the sync engine and renders them.
// The engine never formats terminal output itself.
class Presenter {
public:
    virtual ~Presenter() = default;

    virtual void notice(Severity severity, std::string_view message) = 0;
    virtual void progress(const ProgressEvent& event) = 0;
    virtual void file_started(const FileStartEvent& event) = 0;
    virtual void file_finished(const FileEndEvent& event) = 0;
    virtual void plan_summary(const PlanSummary& summary) = 0;
    virtual void run_summary(const RunSummary& summary) = 0;
};

// Discards everything
class NullPresenter final : public Presenter {
public:
    void notice(Severity, std::string_view) override {}
    void progress(const ProgressEvent&) override {}
    void file_started(const FileStartEvent&) override {}
    void file_finished(const FileEndEvent&) override {}
    void plan_summary(const PlanSummary&) override {}
    void run_summary(const RunSummary&) override {}
};

} // namespace mirror::core
