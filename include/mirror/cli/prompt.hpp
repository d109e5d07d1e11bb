// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/cli/palette.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

namespace mirror::cli {

// Line-oriented questions to the operator
class Prompter {
public:
    // hide_secrets turns terminal echo off for ask_secret (stdin must be a tty)
    Prompter(std::istream& in, std::ostream& out, Palette palette, bool hide_secrets = false);

    // "y" or "yes" (any case) is true; anything else, or end of input, is false
    [[nodiscard]] bool confirm(std::string_view question);

    // Trimmed answer, default_value when empty
    [[nodiscard]] std::string ask(std::string_view question, std::string_view default_value = {});

    // Answer read without echo; not trimmed
    [[nodiscard]] std::string ask_secret(std::string_view question);

    // Line of text to the operator
    void say(std::string_view text);

    [[nodiscard]] const Palette& palette() const noexcept { return palette_; }

    // True once input is exhausted or interrupted
    [[nodiscard]] bool closed() const noexcept;

private:
    [[nodiscard]] std::string read_line();

    std::istream& in_;
    std::ostream& out_;
    Palette palette_;
    bool hide_secrets_;
};

} // namespace mirror::cli
