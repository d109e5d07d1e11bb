// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>

namespace mirror::core {

// Regex allow-list over file names.
// Only an active filter accepts anything; disabled and rejected filters
// refuse every name so nothing transfers without an explicit opt-in.
class NameFilter {
public:
    enum class State : std::uint8_t {
        disabled,   // No pattern configured
        active,     // Compiled pattern
        rejected    // Pattern failed to compile
    };

    NameFilter() = default;

    [[nodiscard]] static NameFilter disabled() noexcept { return NameFilter{}; }

    // Compile an ECMAScript pattern. Never throws; a bad pattern yields
    // a rejected filter carrying the compiler's message.
    [[nodiscard]] static NameFilter compile(std::string_view pattern, bool case_sensitive);

    // Search (not full match) the pattern in name
    [[nodiscard]] bool accepts(std::string_view name) const;

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool is_active() const noexcept { return state_ == State::active; }
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] bool case_sensitive() const noexcept { return case_sensitive_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

private:
    State state_{State::disabled};
    std::string pattern_;
    bool case_sensitive_{false};
    std::regex regex_;
    std::string error_message_;
};

// Case-insensitive suffix check; an empty extension matches everything
[[nodiscard]] bool has_extension(std::string_view name, std::string_view extension) noexcept;

} // namespace mirror::core
