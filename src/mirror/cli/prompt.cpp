// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/prompt.hpp>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <termios.h>
#include <unistd.h>

namespace mirror::cli {

namespace {

std::string trim(std::string text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

// Terminal echo off for the guard's lifetime
class EchoGuard {
public:
    explicit EchoGuard(bool active) noexcept {
        if (!active || ::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
        termios silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restore_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }

    ~EchoGuard() {
        if (restore_) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    [[nodiscard]] bool active() const noexcept { return restore_; }

private:
    termios saved_{};
    bool restore_{false};
};

} // namespace

Prompter::Prompter(std::istream& in, std::ostream& out, Palette palette, bool hide_secrets)
    : in_(in)
    , out_(out)
    , palette_(palette)
    , hide_secrets_(hide_secrets) {}

bool Prompter::confirm(std::string_view question) {
    out_ << palette_.bold() << question << " (y/n): " << palette_.reset() << std::flush;
    auto answer = trim(read_line());
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

std::string Prompter::ask(std::string_view question, std::string_view default_value) {
    out_ << palette_.bold() << question;
    if (!default_value.empty()) {
        out_ << " [default: " << default_value << "]";
    }
    out_ << ": " << palette_.reset() << std::flush;

    auto answer = trim(read_line());
    return answer.empty() ? std::string(default_value) : answer;
}

std::string Prompter::ask_secret(std::string_view question) {
    out_ << palette_.bold() << question << ": " << palette_.reset() << std::flush;

    std::string answer;
    {
        EchoGuard guard(hide_secrets_);
        answer = read_line();
        if (guard.active()) {
            out_ << '\n';
        }
    }
    return answer;
}

void Prompter::say(std::string_view text) {
    out_ << text << '\n' << std::flush;
}

bool Prompter::closed() const noexcept {
    return !in_.good();
}

std::string Prompter::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return {};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace mirror::cli
