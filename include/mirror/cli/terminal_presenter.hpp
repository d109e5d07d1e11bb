// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/cli/palette.hpp>
#include <mirror/core/presenter.hpp>
#include <iosfwd>
#include <string>

namespace mirror::cli {

// Renders sync events on a terminal: a single redrawn progress line plus
// colored notices and summaries.
class TerminalPresenter final : public core::Presenter {
public:
    TerminalPresenter(std::ostream& out, Palette palette);

    void notice(core::Severity severity, std::string_view message) override;
    void progress(const core::ProgressEvent& event) override;
    void file_started(const core::FileStartEvent& event) override;
    void file_finished(const core::FileEndEvent& event) override;
    void plan_summary(const core::PlanSummary& summary) override;
    void run_summary(const core::RunSummary& summary) override;

    // Filtered names listed in the run summary before "...and N more"
    static constexpr std::size_t MAX_LISTED_FILTERED = 10;

private:
    // Finish a pending progress line before printing anything else
    void end_progress_line();

    [[nodiscard]] std::string render_bar(double percent) const;

    std::ostream& out_;
    Palette palette_;
    bool progress_active_{false};
};

} // namespace mirror::cli
