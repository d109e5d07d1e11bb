// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <string_view>

namespace mirror::cli {

// ANSI color codes, or empty strings when color is off
class Palette {
public:
    explicit Palette(bool enabled = true) noexcept : enabled_(enabled) {}

    // Color only when stdout is a terminal, NO_COLOR is unset and no_color is false
    [[nodiscard]] static Palette detect(bool no_color) noexcept;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

    [[nodiscard]] std::string_view reset() const noexcept { return code("\033[0m"); }
    [[nodiscard]] std::string_view bold() const noexcept { return code("\033[1m"); }
    [[nodiscard]] std::string_view red() const noexcept { return code("\033[91m"); }
    [[nodiscard]] std::string_view green() const noexcept { return code("\033[92m"); }
    [[nodiscard]] std::string_view yellow() const noexcept { return code("\033[93m"); }
    [[nodiscard]] std::string_view blue() const noexcept { return code("\033[94m"); }
    [[nodiscard]] std::string_view cyan() const noexcept { return code("\033[96m"); }
    [[nodiscard]] std::string_view bg_yellow() const noexcept { return code("\033[43m"); }

    // Red below 30%, yellow below 60%, green above
    [[nodiscard]] std::string_view for_percent(double percent) const noexcept {
        if (percent < 30.0) return red();
        if (percent < 60.0) return yellow();
        return green();
    }

    // color + text + reset
    [[nodiscard]] std::string paint(std::string_view color, std::string_view text) const;

private:
    [[nodiscard]] std::string_view code(std::string_view sequence) const noexcept {
        return enabled_ ? sequence : std::string_view{};
    }

    bool enabled_;
};

} // namespace mirror::cli
