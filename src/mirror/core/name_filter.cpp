// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/name_filter.hpp>
#include <cctype>

namespace mirror::core {

NameFilter NameFilter::compile(std::string_view pattern, bool case_sensitive) {
    NameFilter filter;
    filter.pattern_ = std::string(pattern);
    filter.case_sensitive_ = case_sensitive;

    auto flags = std::regex::ECMAScript;
    if (!case_sensitive) {
        flags |= std::regex::icase;
    }

    try {
        filter.regex_ = std::regex(filter.pattern_, flags);
        filter.state_ = State::active;
    } catch (const std::regex_error& e) {
        filter.state_ = State::rejected;
        filter.error_message_ = e.what();
    }
    return filter;
}

bool NameFilter::accepts(std::string_view name) const {
    if (state_ != State::active) return false;
    return std::regex_search(name.begin(), name.end(), regex_);
}

bool has_extension(std::string_view name, std::string_view extension) noexcept {
    if (extension.empty()) return true;
    if (name.size() < extension.size()) return false;

    auto tail = name.substr(name.size() - extension.size());
    for (std::size_t i = 0; i < tail.size(); ++i) {
        auto a = std::tolower(static_cast<unsigned char>(tail[i]));
        auto b = std::tolower(static_cast<unsigned char>(extension[i]));
        if (a != b) return false;
    }
    return true;
}

} // namespace mirror::core
