// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/progress_tracker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace mirror::core {

ProgressTracker::ProgressTracker(Presenter& presenter,
                                 std::chrono::milliseconds interval,
                                 Clock clock)
    : presenter_(presenter)
    , interval_(interval)
    , clock_(std::move(clock)) {
    start();
}

void ProgressTracker::start() {
    start_time_ = clock_();
    last_emit_ = start_time_;
}

void ProgressTracker::on_progress(std::uint64_t current, std::uint64_t total, std::string_view label) {
    auto now = clock_();
    if (now - last_emit_ < interval_) return;
    last_emit_ = now;

    ProgressEvent event;
    event.label = std::string(label);
    event.current_bytes = current;
    event.total_bytes = total;

    if (total > 0) {
        event.percent = std::min(100.0, static_cast<double>(current) * 100.0 / static_cast<double>(total));
    }

    std::chrono::duration<double> elapsed = now - start_time_;
    if (elapsed.count() > 0.0) {
        event.speed_bps = static_cast<double>(current) / elapsed.count();
    }

    if (event.speed_bps > 0.0 && total >= current) {
        auto remaining = static_cast<double>(total - current);
        event.eta = std::chrono::seconds(static_cast<std::int64_t>(remaining / event.speed_bps));
    }

    try {
        presenter_.progress(event);
        ++events_emitted_;
    } catch (const std::exception& e) {
        spdlog::warn("Progress display failed: {}", e.what());
    }
}

void ProgressTracker::finish(bool success) {
    try {
        if (success) {
            presenter_.notice(Severity::success, "Download completed successfully");
        } else {
            presenter_.notice(Severity::warning, "Download interrupted");
        }
    } catch (const std::exception& e) {
        spdlog::warn("Progress display failed: {}", e.what());
    }
}

} // namespace mirror::core
