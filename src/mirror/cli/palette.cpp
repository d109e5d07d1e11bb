// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/palette.hpp>
#include <cstdlib>
#include <unistd.h>

namespace mirror::cli {

Palette Palette::detect(bool no_color) noexcept {
    if (no_color) return Palette{false};
    if (std::getenv("NO_COLOR") != nullptr) return Palette{false};
    return Palette{::isatty(STDOUT_FILENO) != 0};
}

std::string Palette::paint(std::string_view color, std::string_view text) const {
    std::string out;
    out.reserve(color.size() + text.size() + 4);
    out += color;
    out += text;
    out += reset();
    return out;
}

} // namespace mirror::cli
