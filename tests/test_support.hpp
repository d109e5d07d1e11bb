// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/http_session.hpp>
#include <mirror/core/presenter.hpp>
#include <algorithm>
#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace mirror::test {

namespace fs = std::filesystem;

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("mirror_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Deterministic payload of the given size
inline std::string make_content(std::size_t size, char seed = 'a') {
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>(seed + static_cast<char>(i % 23));
    }
    return content;
}

// In-memory HTTP server
class FakeTransport final : public core::HttpTransport {
public:
    // Connection dropped after `after_bytes` body bytes of the next stream() call
    struct Fault {
        std::size_t after_bytes{0};
        std::error_code error;
    };

    std::map<std::string, std::string> files;    // url -> content
    std::map<std::string, std::string> pages;    // url -> listing HTML
    std::deque<Fault> faults;                    // Consumed one per accepted stream() call
    std::deque<std::error_code> page_errors;     // Consumed one per fetch_text() call
    std::size_t ignore_range_times{0};           // Reply 200 to this many ranged requests
    std::size_t truncate_by{0};                  // Send this many bytes less than declared
    std::size_t piece_size{100};                 // Body delivery granularity
    std::function<void(std::size_t delivered)> on_piece;

    std::vector<core::HttpRequest> requests;
    std::vector<std::string> text_requests;

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    stream(const core::HttpRequest& request,
           const core::HeadersHandler& on_headers,
           const core::BodyHandler& on_body) noexcept override {
        requests.push_back(request);

        auto it = files.find(request.url);
        if (it == files.end()) {
            return std::unexpected(make_error_code(core::SyncErrc::not_found));
        }
        const auto& content = it->second;

        core::HttpResponse response;
        std::string payload;
        std::uint64_t start = request.range_start;

        if (request.ranged() && ignore_range_times > 0) {
            --ignore_range_times;
            start = 0;
        }

        if (start > 0) {
            if (start >= content.size()) {
                response.status_code = 416;
                response.content_range = "bytes */" + std::to_string(content.size());
                response.headers["content-range"] = response.content_range;
                if (on_headers) on_headers(response);
                return std::unexpected(make_error_code(core::SyncErrc::invalid_range));
            }
            payload = content.substr(start);
            response.status_code = 206;
            response.content_range = "bytes " + std::to_string(start) + "-" +
                                     std::to_string(content.size() - 1) + "/" +
                                     std::to_string(content.size());
            response.headers["content-range"] = response.content_range;
        } else {
            payload = content;
            response.status_code = 200;
        }

        response.content_length = payload.size();
        response.headers["content-length"] = std::to_string(payload.size());
        response.accepts_ranges = true;

        payload.resize(payload.size() - std::min(truncate_by, payload.size()));

        if (on_headers && !on_headers(response)) {
            return std::unexpected(make_error_code(core::SyncErrc::cancelled));
        }

        std::error_code fault;
        if (!faults.empty()) {
            payload.resize(std::min(faults.front().after_bytes, payload.size()));
            fault = faults.front().error;
            faults.pop_front();
        }

        std::size_t delivered = 0;
        while (delivered < payload.size()) {
            auto size = std::min(piece_size, payload.size() - delivered);
            if (on_body && !on_body(payload.data() + delivered, size)) {
                return std::unexpected(make_error_code(core::SyncErrc::cancelled));
            }
            delivered += size;
            if (on_piece) on_piece(delivered);
        }

        if (fault) {
            return std::unexpected(fault);
        }
        return response;
    }

    [[nodiscard]] std::expected<std::string, std::error_code>
    fetch_text(const std::string& url) noexcept override {
        text_requests.push_back(url);

        if (!page_errors.empty()) {
            auto ec = page_errors.front();
            page_errors.pop_front();
            return std::unexpected(ec);
        }

        auto it = pages.find(url);
        if (it == pages.end()) {
            return std::unexpected(make_error_code(core::SyncErrc::not_found));
        }
        return it->second;
    }
};

// Captures every event
class RecordingPresenter final : public core::Presenter {
public:
    struct Notice {
        core::Severity severity;
        std::string message;
    };

    std::vector<Notice> notices;
    std::vector<core::ProgressEvent> progress_events;
    std::vector<core::FileStartEvent> starts;
    std::vector<core::FileEndEvent> ends;
    std::vector<core::PlanSummary> plans;
    std::size_t run_summaries{0};

    void notice(core::Severity severity, std::string_view message) override {
        notices.push_back(Notice{severity, std::string(message)});
    }
    void progress(const core::ProgressEvent& event) override { progress_events.push_back(event); }
    void file_started(const core::FileStartEvent& event) override { starts.push_back(event); }
    void file_finished(const core::FileEndEvent& event) override { ends.push_back(event); }
    void plan_summary(const core::PlanSummary& summary) override { plans.push_back(summary); }
    void run_summary(const core::RunSummary&) override { ++run_summaries; }

    [[nodiscard]] bool has_notice(core::Severity severity) const {
        return std::any_of(notices.begin(), notices.end(),
                           [severity](const Notice& n) { return n.severity == severity; });
    }
};

// Apache 2.4 style index page for (name, size text) rows
inline std::string apache_index(const std::vector<std::pair<std::string, std::string>>& rows) {
    std::string html =
        "<!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 3.2 Final//EN\">\n"
        "<html>\n <head>\n  <title>Index of /data</title>\n </head>\n <body>\n"
        "<h1>Index of /data</h1>\n  <table>\n"
        "   <tr><th valign=\"top\"><img src=\"/icons/blank.gif\" alt=\"[ICO]\"></th>"
        "<th><a href=\"?C=N;O=D\">Name</a></th><th><a href=\"?C=M;O=A\">Last modified</a></th>"
        "<th><a href=\"?C=S;O=A\">Size</a></th><th><a href=\"?C=D;O=A\">Description</a></th></tr>\n"
        "   <tr><th colspan=\"5\"><hr></th></tr>\n"
        "<tr><td valign=\"top\"><img src=\"/icons/back.gif\" alt=\"[PARENTDIR]\"></td>"
        "<td><a href=\"/\">Parent Directory</a></td><td>&nbsp;</td><td align=\"right\">  - </td><td>&nbsp;</td></tr>\n";

    for (const auto& [name, size] : rows) {
        html += "<tr><td valign=\"top\"><img src=\"/icons/unknown.gif\" alt=\"[   ]\"></td>"
                "<td><a href=\"" + name + "\">" + name + "</a></td>"
                "<td align=\"right\">2024-03-01 10:15  </td>"
                "<td align=\"right\">" + size + "</td><td>&nbsp;</td></tr>\n";
    }

    html += "   <tr><th colspan=\"5\"><hr></th></tr>\n</table>\n</body></html>\n";
    return html;
}

} // namespace mirror::test
