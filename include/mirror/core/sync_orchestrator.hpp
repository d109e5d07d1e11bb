// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/cancellation.hpp>
#include <mirror/core/config.hpp>
#include <mirror/core/directory_lister.hpp>
#include <mirror/core/planner.hpp>
#include <mirror/core/presenter.hpp>
#include <mirror/core/range_fetcher.hpp>
#include <mirror/core/sync_types.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace mirror::core {

// Yes/no question put to the operator
using ConfirmFn = std::function<bool(std::string_view question)>;

// Drives one mirror run: list, plan, confirm, transfer, summarize.
// Files are transferred strictly one after another.
class SyncOrchestrator {
public:
    SyncOrchestrator(SyncConfig config,
                     DirectoryLister& lister,
                     RangeFetcher& fetcher,
                     Presenter& presenter,
                     ConfirmFn confirm,
                     CancellationToken token);

    // Run once. Results of a previous call are discarded.
    [[nodiscard]] SyncResult sync(std::string_view extension = {});

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] NameFilter build_filter(bool enabled, const std::string& pattern);
    void transfer(const PlanResult& plan, SyncResult& result);
    void emit_summary(const SyncResult& result);
    SyncResult cancel(SyncResult& result);
    SyncResult finish(SyncResult& result, SyncStatus status);

    SyncConfig config_;
    DirectoryLister& lister_;
    RangeFetcher& fetcher_;
    Presenter& presenter_;
    ConfirmFn confirm_;
    CancellationToken token_;
    RunState state_{RunState::idle};

    // Per-run summary inputs
    std::chrono::steady_clock::time_point summary_since_{};
    bool run_filter_enabled_{false};
    std::string run_pattern_;
};

} // namespace mirror::core
