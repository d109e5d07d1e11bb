// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/terminal_presenter.hpp>
#include <mirror/core/size_format.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace mirror::cli {

using namespace mirror::core;

namespace {

constexpr int BAR_WIDTH = 30;
constexpr std::size_t SEPARATOR_WIDTH = 80;

std::string percent_text(double percent) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << percent << "%";
    return ss.str();
}

std::string absolute(const std::string& dir) {
    std::error_code ec;
    auto path = std::filesystem::absolute(dir, ec);
    return ec ? dir : path.string();
}

} // namespace

TerminalPresenter::TerminalPresenter(std::ostream& out, Palette palette)
    : out_(out)
    , palette_(palette) {}

void TerminalPresenter::end_progress_line() {
    if (progress_active_) {
        out_ << '\n';
        progress_active_ = false;
    }
}

//=============================================================================
// Notices
//=============================================================================

void TerminalPresenter::notice(Severity severity, std::string_view message) {
    end_progress_line();

    std::string_view color;
    switch (severity) {
        case Severity::info:    color = {}; break;
        case Severity::success: color = palette_.green(); break;
        case Severity::warning: color = palette_.yellow(); break;
        case Severity::error:   color = palette_.red(); break;
    }

    if (color.empty()) {
        out_ << message << '\n';
    } else {
        out_ << color << message << palette_.reset() << '\n';
    }
    out_ << std::flush;
}

//=============================================================================
// Progress line
//=============================================================================

void TerminalPresenter::progress(const ProgressEvent& event) {
    if (event.total_bytes == 0) return;

    double percent = std::clamp(event.percent, 0.0, 100.0);
    auto color = palette_.for_percent(percent);

    std::string line = "\r";
    line += color;
    line += render_bar(percent);
    line += " ";
    line += percent_text(percent);
    line += palette_.reset();
    line += " ";
    line += palette_.paint(palette_.cyan(), event.label);
    line += ": ";
    line += format_size(event.current_bytes);
    line += "/";
    line += format_size(event.total_bytes);

    if (event.speed_bps > 0.0) {
        line += " ";
        line += format_speed(event.speed_bps);
    }

    line += " ETA: ";
    line += event.eta ? format_eta(*event.eta) : std::string("N/A");

    // Clear rest of line
    line += std::string(10, ' ');

    out_ << line << std::flush;
    progress_active_ = true;
}

std::string TerminalPresenter::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (empty > 0) {
        bar += '>';
        bar.append(static_cast<std::size_t>(empty - 1), ' ');
    }
    bar += "]";
    return bar;
}

//=============================================================================
// Per-file events
//=============================================================================

void TerminalPresenter::file_started(const FileStartEvent& event) {
    end_progress_line();

    out_ << palette_.bold() << "File " << event.index << " of " << event.count
         << palette_.reset() << ": ";

    if (event.resume_from_byte > 0 && event.size > 0) {
        double percent = static_cast<double>(event.resume_from_byte) * 100.0 / static_cast<double>(event.size);
        auto remaining = event.size > event.resume_from_byte ? event.size - event.resume_from_byte : 0;
        out_ << "Resuming " << palette_.paint(palette_.cyan(), event.name)
             << " (" << palette_.paint(palette_.for_percent(percent), percent_text(percent))
             << " complete, " << format_size(remaining) << " remaining)\n";
    } else {
        out_ << "Downloading " << palette_.paint(palette_.cyan(), event.name)
             << " (" << format_size(event.size) << ")\n";
    }
    out_ << std::flush;
}

void TerminalPresenter::file_finished(const FileEndEvent& event) {
    end_progress_line();

    switch (event.status) {
        case TransferStatus::success:
            break;  // The tracker already announced completion
        case TransferStatus::cancelled:
            out_ << palette_.paint(palette_.yellow(), "Interrupted: ") << event.name << '\n';
            break;
        case TransferStatus::failed:
            out_ << palette_.paint(palette_.red(), "Failed: ") << event.name;
            if (event.error) {
                out_ << " (" << event.error.message() << ")";
            }
            out_ << '\n';
            break;
    }
    out_ << std::flush;
}

//=============================================================================
// Summaries
//=============================================================================

void TerminalPresenter::plan_summary(const PlanSummary& summary) {
    end_progress_line();

    out_ << "Need to download " << summary.file_count << " files\n";

    if (summary.filtered_count > 0) {
        out_ << "Excluded " << summary.filtered_count << " files by regex filter\n";
    }

    if (!summary.partials.empty()) {
        out_ << "Including " << summary.partials.size() << " partially downloaded files:\n";
        for (const auto& partial : summary.partials) {
            out_ << "  " << palette_.paint(palette_.cyan(), partial.name) << ": "
                 << palette_.paint(palette_.for_percent(partial.percent_complete),
                                   percent_text(partial.percent_complete))
                 << " complete (" << format_size(partial.local_size)
                 << " of " << format_size(partial.remote_size) << ")\n";
        }
    }

    out_ << "Total remaining download size: " << format_size(summary.total_bytes) << '\n';
    out_ << "Files will be downloaded to: "
         << palette_.paint(palette_.bold(), absolute(summary.download_dir)) << '\n';
    out_ << "Press " << palette_.bold() << palette_.yellow() << "Ctrl+C" << palette_.reset()
         << " at any time to gracefully terminate\n" << std::flush;
}

void TerminalPresenter::run_summary(const RunSummary& summary) {
    end_progress_line();
    if (!summary.result) return;

    const auto& result = *summary.result;
    const auto separator = palette_.paint(palette_.blue(), std::string(SEPARATOR_WIDTH, '-'));
    const bool cancelled = result.status == SyncStatus::cancelled;

    out_ << '\n' << separator << '\n';

    if (cancelled) {
        out_ << palette_.bold() << palette_.paint(palette_.yellow(), "DOWNLOAD OPERATION TERMINATED BY USER");
    } else if (!result.failed.empty()) {
        out_ << palette_.bold() << palette_.paint(palette_.red(), "DOWNLOAD OPERATION COMPLETED WITH ERRORS");
    } else {
        out_ << palette_.bold() << palette_.paint(palette_.green(), "DOWNLOAD OPERATION COMPLETED SUCCESSFULLY");
    }
    out_ << "\n\n";

    if (!result.downloaded.empty()) {
        out_ << palette_.green() << "Successfully downloaded files (" << result.downloaded.size() << "):"
             << palette_.reset() << '\n';
        for (const auto& name : result.downloaded) {
            out_ << "  " << palette_.paint(palette_.cyan(), name) << '\n';
        }
    }

    if (!result.failed.empty()) {
        out_ << '\n' << palette_.red() << "Failed or incomplete files (" << result.failed.size() << "):"
             << palette_.reset() << '\n';
        for (const auto& name : result.failed) {
            out_ << "  " << palette_.paint(palette_.cyan(), name) << '\n';
        }
    }

    if (!result.filtered_out.empty()) {
        out_ << '\n' << palette_.yellow() << "Filtered out files (" << result.filtered_out.size() << "):"
             << palette_.reset() << '\n';
        auto shown = std::min(result.filtered_out.size(), MAX_LISTED_FILTERED);
        for (std::size_t i = 0; i < shown; ++i) {
            out_ << "  " << palette_.paint(palette_.cyan(), result.filtered_out[i]) << '\n';
        }
        if (result.filtered_out.size() > shown) {
            out_ << "  " << palette_.yellow() << "...and " << (result.filtered_out.size() - shown)
                 << " more" << palette_.reset() << '\n';
        }
    }

    out_ << '\n' << palette_.paint(palette_.bold(), "Statistics:") << '\n';
    out_ << "  Total downloaded: " << palette_.paint(palette_.bold(), format_size(result.total_bytes_moved)) << '\n';
    out_ << "  Time elapsed: " << palette_.paint(palette_.bold(), format_elapsed(summary.elapsed)) << '\n';

    if (summary.elapsed.count() > 0.0 && result.total_bytes_moved > 0) {
        double speed = static_cast<double>(result.total_bytes_moved) / summary.elapsed.count();
        out_ << "  Average download speed: " << palette_.paint(palette_.bold(), format_speed(speed)) << '\n';
    }

    out_ << "  Files are available in: " << palette_.paint(palette_.bold(), absolute(summary.download_dir)) << '\n';

    if (summary.filter_enabled) {
        out_ << "  Filter: " << palette_.paint(palette_.bold(), summary.filter_pattern)
             << (summary.filter_case_sensitive ? " (case-sensitive)" : " (case-insensitive)") << '\n';
    } else {
        out_ << "  Filter: " << palette_.paint(palette_.red(), "Disabled") << '\n';
    }

    if (cancelled && !result.failed.empty()) {
        out_ << '\n' << palette_.paint(palette_.yellow(),
            "To resume downloading incomplete files, run the program again.") << '\n';
        out_ << palette_.paint(palette_.yellow(),
            "The program will automatically pick up where it left off.") << '\n';
    }

    out_ << separator << '\n' << std::flush;
}

} // namespace mirror::cli
