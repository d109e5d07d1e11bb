// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/directory_lister.hpp>
#include <mirror/core/name_filter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace mirror::core {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Inner text of an element: tags removed, common entities decoded, trimmed
std::string cell_text(std::string_view html) {
    std::string text;
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') in_tag = true;
        else if (c == '>') in_tag = false;
        else if (!in_tag) text += c;
    }

    static const std::pair<std::string_view, std::string_view> ENTITIES[] = {
        {"&nbsp;", " "}, {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}
    };
    for (const auto& [entity, replacement] : ENTITIES) {
        std::size_t pos = 0;
        while ((pos = text.find(entity, pos)) != std::string::npos) {
            text.replace(pos, entity.size(), replacement);
            pos += replacement.size();
        }
    }

    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Contents of each <tag ...>...</tag> in [begin, end) of html.
// lower is the lower-cased copy of html used for matching.
std::vector<std::string_view> elements(std::string_view html, std::string_view lower,
                                       std::string_view tag,
                                       std::size_t begin, std::size_t end) {
    std::vector<std::string_view> out;
    std::string open = "<" + std::string(tag);
    std::string close = "</" + std::string(tag) + ">";

    std::size_t pos = begin;
    while (pos < end) {
        auto start = lower.find(open, pos);
        if (start == std::string_view::npos || start >= end) break;

        // Reject prefixes such as <tbody> when looking for <t...>
        auto after = start + open.size();
        if (after < lower.size() && std::isalnum(static_cast<unsigned char>(lower[after]))) {
            pos = after;
            continue;
        }

        auto content = lower.find('>', after);
        if (content == std::string_view::npos || content >= end) break;
        ++content;

        auto next_open = lower.find(open, content);
        auto stop = lower.find(close, content);
        if (stop == std::string_view::npos || stop > end) stop = end;
        // Unclosed element: ends where the next one starts
        if (next_open != std::string_view::npos && next_open < stop) stop = next_open;

        out.push_back(html.substr(content, stop - content));
        pos = stop;
    }
    return out;
}

std::string extract_href(std::string_view cell) {
    static const std::regex href_regex(R"(<a\s[^>]*href\s*=\s*["']([^"']*)["'])", std::regex::icase);
    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(cell.begin(), cell.end(), match, href_regex)) {
        return match[1].str();
    }
    return {};
}

std::string href_name(std::string_view href) {
    auto cut = href.find_first_of("?#");
    if (cut != std::string_view::npos) href = href.substr(0, cut);
    auto slash = href.rfind('/');
    if (slash != std::string_view::npos) href = href.substr(slash + 1);
    return percent_decode(href);
}

} // namespace

//=============================================================================
// ApacheIndexLister
//=============================================================================

ApacheIndexLister::ApacheIndexLister(HttpTransport& transport,
                                     Url listing_url,
                                     std::uint32_t max_retries,
                                     std::chrono::milliseconds retry_delay)
    : transport_(transport)
    , listing_url_(listing_url.directory())
    , max_retries_(std::max<std::uint32_t>(max_retries, 1))
    , retry_delay_(retry_delay) {}

std::expected<RemoteListing, std::error_code>
ApacheIndexLister::list(std::string_view extension, const CancellationToken& token) {
    auto url = listing_url_.full();

    for (std::uint32_t attempt = 1; attempt <= max_retries_; ++attempt) {
        if (token.cancelled()) {
            spdlog::warn("Termination requested during server connection");
            return std::unexpected(make_error_code(SyncErrc::cancelled));
        }

        spdlog::debug("Fetching listing {} (attempt {}/{})", url, attempt, max_retries_);
        auto page = transport_.fetch_text(url);
        if (page) {
            return parse_listing(*page, listing_url_, extension);
        }

        auto ec = page.error();
        if (token.cancelled()) {
            return std::unexpected(make_error_code(SyncErrc::cancelled));
        }
        if (!is_transient(ec)) {
            spdlog::error("Error fetching listing {}: {}", url, ec.message());
            return std::unexpected(ec);
        }
        if (attempt == max_retries_) {
            spdlog::error("Error connecting to server after {} attempts: {}", attempt, ec.message());
            break;
        }

        spdlog::warn("Error connecting to server (attempt {}/{}): {}", attempt, max_retries_, ec.message());
        spdlog::info("Retrying in {} ms...", retry_delay_.count());
        if (!token.sleep_for(retry_delay_)) {
            return std::unexpected(make_error_code(SyncErrc::cancelled));
        }
    }

    return std::unexpected(make_error_code(SyncErrc::connection_failed));
}

std::expected<RemoteListing, std::error_code>
ApacheIndexLister::parse_listing(std::string_view html, const Url& base, std::string_view extension) {
    std::string lower = to_lower(html);

    auto table_start = lower.find("<table");
    if (table_start == std::string::npos) {
        spdlog::error("Could not find the file listing table in the HTML");
        return std::unexpected(make_error_code(SyncErrc::listing_malformed));
    }
    auto table_end = lower.find("</table>", table_start);
    if (table_end == std::string::npos) table_end = lower.size();

    RemoteListing files;
    for (auto row : elements(html, lower, "tr", table_start, table_end)) {
        auto row_offset = static_cast<std::size_t>(row.data() - html.data());
        auto cells = elements(html, lower, "td", row_offset, row_offset + row.size());
        if (cells.size() < 4) continue;

        auto href = extract_href(cells[1]);
        if (href.empty() || href.front() == '?' || href.back() == '/') continue;

        auto name = href_name(href);
        if (name.empty() || name == "." || name == "..") continue;
        if (!has_extension(name, extension)) continue;

        files.push_back(RemoteFileDescriptor{
            name,
            base.resolve(href),
            parse_size(cell_text(cells[3])),
            cell_text(cells[2])
        });
    }

    spdlog::debug("Parsed {} files from listing", files.size());
    return files;
}

std::uint64_t ApacheIndexLister::parse_size(std::string_view text) {
    static const std::regex size_regex(R"(^(\d+(?:\.\d+)?)\s*([KMGT])?)", std::regex::icase);

    std::string trimmed = cell_text(text);
    if (trimmed.empty() || trimmed == "-") return 0;

    std::smatch match;
    if (!std::regex_search(trimmed, match, size_regex)) return 0;

    double value = std::stod(match[1].str());
    if (match[2].matched) {
        switch (std::toupper(static_cast<unsigned char>(match[2].str().front()))) {
            case 'T': value *= 1024.0; [[fallthrough]];
            case 'G': value *= 1024.0; [[fallthrough]];
            case 'M': value *= 1024.0; [[fallthrough]];
            case 'K': value *= 1024.0; break;
            default: break;
        }
    }
    return static_cast<std::uint64_t>(value);
}

} // namespace mirror::core
