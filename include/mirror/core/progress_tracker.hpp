// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/presenter.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace mirror::core {

// Rate-limited progress reporting for one transfer.
// Purely observational: a failing presenter never disturbs the transfer.
class ProgressTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ProgressTracker(Presenter& presenter,
                             std::chrono::milliseconds interval = std::chrono::milliseconds{1000},
                             Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Reset the start and last-emission time
    void start();

    // Emit a ProgressEvent if at least the interval passed since the last one
    void on_progress(std::uint64_t current, std::uint64_t total, std::string_view label);

    // Completion notice
    void finish(bool success);

    [[nodiscard]] std::uint64_t events_emitted() const noexcept { return events_emitted_; }

private:
    Presenter& presenter_;
    std::chrono::milliseconds interval_;
    Clock clock_;
    std::chrono::steady_clock::time_point start_time_{};
    std::chrono::steady_clock::time_point last_emit_{};
    std::uint64_t events_emitted_{0};
};

} // namespace mirror::core
