// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/setup.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace mirror::cli {

namespace {

bool blank(const std::string& text) noexcept {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string heading(const Palette& palette, std::string_view text) {
    std::string out;
    out += palette.bold();
    out += palette.blue();
    out += text;
    out += palette.reset();
    return out;
}

// Create dir and return its absolute form for display
std::string ensure_directory(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Cannot create directory {}: {}", dir, ec.message());
    }
    auto path = std::filesystem::absolute(dir, ec);
    return ec ? dir : path.string();
}

void prompt_directories(core::SyncConfig& config, Prompter& prompter) {
    const auto& palette = prompter.palette();
    prompter.say(heading(palette, "Directory Configuration:"));

    config.local_dir = prompter.ask("Enter the path for existing files directory", config.local_dir);
    auto local = ensure_directory(config.local_dir);

    prompter.say("\nThe download directory is where new files will be stored.");
    config.download_dir = prompter.ask("Enter the path for download directory", config.download_dir);
    auto download = ensure_directory(config.download_dir);

    prompter.say(palette.paint(palette.green(), "Local directory: " + local));
    prompter.say(palette.paint(palette.green(), "Download directory: " + download));
}

void prompt_server(core::SyncConfig& config, Prompter& prompter) {
    prompter.say("\n" + heading(prompter.palette(), "Server Configuration:"));
    prompter.say("Please enter the credentials for the server.");

    if (auto url = prompter.ask("Enter server URL (e.g., http://example.com/files/)"); !url.empty()) {
        config.server_url = url;
    }
    if (auto username = prompter.ask("Enter username"); !username.empty()) {
        config.username = username;
    }
    if (auto password = prompter.ask_secret("Enter password (input will be hidden)"); !password.empty()) {
        config.password = password;
    }
}

void prompt_filter(core::SyncConfig& config, Prompter& prompter) {
    const auto& palette = prompter.palette();
    prompter.say("\n" + heading(palette, "File Filter Configuration:"));
    prompter.say(palette.paint(palette.yellow(), "IMPORTANT: If filtering is disabled, no files will be downloaded."));
    prompter.say("The filter uses regular expressions to match file names.");

    config.filter_enabled = prompter.confirm("Enable file filtering? [default: n]");
    if (!config.filter_enabled) {
        prompter.say(palette.paint(palette.yellow(),
            "Filter disabled. You must enable the filter with a pattern to download files."));
        prompter.say(palette.paint(palette.yellow(),
            "You can enable filtering later using command-line arguments or editing the config file."));
        return;
    }

    prompter.say("\nFilter pattern examples:");
    prompter.say("  .*\\.laz         - All .laz files");
    prompter.say("  G2-W08-2-.*     - Files starting with 'G2-W08-2-'");
    prompter.say("  .*-(108|109)-5  - Files containing -108-5 or -109-5");

    config.filter_pattern = prompter.ask("Enter filter pattern", config.filter_pattern);
    config.filter_case_sensitive = prompter.confirm("Case sensitive pattern? [default: n]");

    std::string sensitivity = config.filter_case_sensitive ? "case-sensitive" : "case-insensitive";
    prompter.say(palette.paint(palette.green(),
        "Filter enabled with " + sensitivity + " pattern: '" + config.filter_pattern + "'"));
}

} // namespace

core::SyncConfig run_first_time_setup(Prompter& prompter) {
    core::SyncConfig config;
    const auto& palette = prompter.palette();

    prompter.say("\n" + heading(palette, "=== Mirror - Initial Configuration ==="));
    prompter.say(palette.paint(palette.cyan(), "Let's set up your configuration file.") + "\n");

    prompt_directories(config, prompter);
    prompt_server(config, prompter);
    prompt_filter(config, prompter);

    return config;
}

bool prompt_missing_credentials(core::SyncConfig& config, Prompter& prompter) {
    const auto& palette = prompter.palette();
    bool asked = false;

    if (blank(config.server_url)) {
        prompter.say("\n" + palette.paint(palette.yellow(), "Server URL is not configured."));
        config.server_url = prompter.ask("Enter server URL (e.g., http://example.com/files/)");
        asked = true;
    }
    if (blank(config.username)) {
        prompter.say("\n" + palette.paint(palette.yellow(), "Server username is not configured."));
        config.username = prompter.ask("Enter username");
        asked = true;
    }
    if (blank(config.password)) {
        prompter.say("\n" + palette.paint(palette.yellow(), "Server password is not configured."));
        config.password = prompter.ask_secret("Enter password");
        asked = true;
    }

    if (asked) {
        spdlog::info("Server credentials updated");
    }
    return asked;
}

void clear_credentials(core::SyncConfig& config) noexcept {
    config.server_url.clear();
    config.username.clear();
    config.password.clear();
}

} // namespace mirror::cli
