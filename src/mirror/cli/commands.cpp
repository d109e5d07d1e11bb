// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/commands.hpp>
#include <mirror/cli/logging.hpp>
#include <mirror/cli/palette.hpp>
#include <mirror/cli/prompt.hpp>
#include <mirror/cli/setup.hpp>
#include <mirror/cli/terminal_presenter.hpp>
#include <mirror/core/config_file.hpp>
#include <mirror/core/directory_lister.hpp>
#include <mirror/core/progress_tracker.hpp>
#include <mirror/core/range_fetcher.hpp>
#include <mirror/core/sync_orchestrator.hpp>
#include <mirror/core/url.hpp>
#include <mirror/version.hpp>
#include <spdlog/spdlog.h>
#include <expected>
#include <iostream>
#include <utility>
#include <unistd.h>

namespace mirror::cli {

using namespace mirror::core;

namespace {

// libcurl global state for the duration of a run
struct CurlGlobal {
    CurlGlobal() { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void print_banner(const Palette& palette) {
    std::cout << '\n' << palette.bold() << palette.blue() << "=== Mirror ===" << palette.reset() << '\n';
    std::cout << palette.yellow() << "Press Ctrl+C at any time to gracefully terminate"
              << palette.reset() << "\n\n";
}

void print_error(const Palette& palette, std::string_view message) {
    std::cerr << palette.red() << "Error: " << message << palette.reset() << std::endl;
}

// Load the config file, running first-time setup when it does not exist
std::expected<SyncConfig, std::error_code>
load_or_create(const ConfigFile& file, Prompter& prompter) {
    if (!file.exists()) {
        const auto& palette = prompter.palette();
        if (file.has_unread_ini()) {
            spdlog::warn("Ignoring {}: configuration is read from JSON only", file.ini_path().string());
            prompter.say(palette.paint(palette.yellow(),
                "Found " + file.ini_path().string() + ", which is not read. Settings go in " + file.path().string()));
        }
        prompter.say("\n" + palette.paint(palette.yellow(),
            "Configuration file not found. Creating a new one at " + file.path().string()));

        auto config = run_first_time_setup(prompter);
        if (auto ec = file.save(config)) {
            return std::unexpected(ec);
        }
        prompter.say("\n" + palette.paint(palette.green(),
            "Configuration file created at " + file.path().string()));
        return config;
    }
    return file.load();
}

// Connection test with one chance to re-enter credentials
std::error_code connect(SyncConfig& config, const ConfigFile& file, Prompter& prompter) {
    for (int round = 0; round < 2; ++round) {
        auto url = Url::parse(config.server_url);
        std::error_code ec;
        if (!url) {
            ec = url.error();
            spdlog::error("Invalid server URL '{}'", config.server_url);
        } else {
            HttpSession session(Credentials{config.username, config.password});
            spdlog::info("Testing connection to {}...", url->directory().full());
            ec = test_connection(session, url->directory().full());
        }

        if (!ec) return {};

        spdlog::error("Failed to connect to server: {}", ec.message());
        if (round == 1) {
            spdlog::error("Connection test failed again. Exiting.");
            return ec;
        }

        print_error(prompter.palette(), "Connection test failed. Please check your server credentials.");
        if (!prompter.confirm("Do you want to update your server credentials?")) {
            return ec;
        }

        clear_credentials(config);
        prompt_missing_credentials(config, prompter);
        if (auto save_ec = file.save(config)) {
            spdlog::warn("Cannot save configuration: {}", save_ec.message());
        }
    }
    return make_error_code(SyncErrc::connection_failed);
}

void log_filter_status(const SyncConfig& config) {
    if (config.filter_enabled) {
        spdlog::info("Regex filtering enabled with {} pattern: '{}'",
                     config.filter_case_sensitive ? "case-sensitive" : "case-insensitive",
                     config.filter_pattern);
    } else {
        spdlog::warn("Regex filtering is DISABLED. No files will be downloaded unless enabled.");
    }
}

ExitCode run_sync(const CliArgs& args, const CancellationToken& token) {
    const auto palette = Palette::detect(args.no_color);
    init_logging(args.verbose, palette.enabled());
    print_banner(palette);

    CurlGlobal curl;
    ConfigFile file(args.config_path);
    Prompter prompter(std::cin, std::cout, palette, ::isatty(STDIN_FILENO) != 0);

    auto loaded = load_or_create(file, prompter);
    if (!loaded) {
        print_error(palette, "Cannot load configuration " + file.path().string() + ": " + loaded.error().message());
        return ExitCode::failure;
    }
    SyncConfig config = std::move(*loaded);

    bool changed = prompt_missing_credentials(config, prompter);
    changed = apply_overrides(args, config) || changed;
    if (changed) {
        if (auto ec = file.save(config)) {
            spdlog::warn("Cannot save configuration: {}", ec.message());
        }
    }

    if (token.cancelled()) return ExitCode::cancelled;

    if (!config.has_credentials()) {
        spdlog::error("Server credentials are incomplete. Please check your configuration.");
        print_error(palette, make_error_code(SyncErrc::credentials_missing).message());
        return ExitCode::failure;
    }

    if (auto ec = connect(config, file, prompter)) {
        if (token.cancelled()) return ExitCode::cancelled;
        print_error(palette, "Cannot connect to " + config.server_url + ": " + ec.message());
        return ExitCode::failure;
    }

    auto url = Url::parse(config.server_url);
    if (!url) {
        print_error(palette, "Invalid server URL: " + config.server_url);
        return ExitCode::failure;
    }

    log_filter_status(config);

    HttpSession session(Credentials{config.username, config.password});
    TerminalPresenter presenter(std::cout, palette);
    ProgressTracker tracker(presenter, config.progress_interval);
    RangeFetcher fetcher(session, tracker, FetchOptions{config.max_retries, config.retry_delay, config.chunk_size});
    ApacheIndexLister lister(session, *url, config.max_retries, config.retry_delay);

    SyncOrchestrator orchestrator(
        config, lister, fetcher, presenter,
        [&prompter](std::string_view question) { return prompter.confirm(question); },
        token);

    auto result = orchestrator.sync(args.extension);
    if (token.cancelled()) return ExitCode::cancelled;
    return exit_code_for(result);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    // Value of the option at argv[i], or nullopt with an error recorded
    auto value = [&](int& i, const std::string& name) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        args.errors.push_back("Option " + name + " requires a value");
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) args.config_path = *v;
        } else if (arg == "-e" || arg == "--extension") {
            if (auto v = value(i, arg)) args.extension = *v;
        } else if (arg == "-u" || arg == "--url") {
            args.url = value(i, arg);
        } else if (arg == "--username") {
            args.username = value(i, arg);
        } else if (arg == "--password") {
            args.password = value(i, arg);
        } else if (arg == "--local-dir") {
            args.local_dir = value(i, arg);
        } else if (arg == "--download-dir") {
            args.download_dir = value(i, arg);
        } else if (arg == "--filter") {
            args.filter = value(i, arg);
        } else if (arg == "--enable-filter") {
            args.enable_filter = true;
        } else if (arg == "--disable-filter") {
            args.disable_filter = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--no-color") {
            args.no_color = true;
        } else {
            args.errors.push_back("Unknown argument: " + arg);
        }
    }

    return args;
}

bool apply_overrides(const CliArgs& args, SyncConfig& config) {
    bool changed = false;

    if (args.url) {
        config.server_url = *args.url;
        spdlog::info("Updated server URL in config file: {}", *args.url);
        changed = true;
    }
    if (args.username) {
        config.username = *args.username;
        spdlog::info("Updated server username in config file: {}", *args.username);
        changed = true;
    }
    if (args.password) {
        config.password = *args.password;
        spdlog::info("Updated server password in config file");
        changed = true;
    }
    if (args.local_dir) {
        config.local_dir = *args.local_dir;
        spdlog::info("Updated local directory in config file: {}", *args.local_dir);
        changed = true;
    }
    if (args.download_dir) {
        config.download_dir = *args.download_dir;
        spdlog::info("Updated download directory in config file: {}", *args.download_dir);
        changed = true;
    }

    // Filter overrides apply to this run only
    if (args.enable_filter) {
        config.filter_enabled = true;
        spdlog::info("Regex filtering enabled via command-line argument");
    }
    if (args.disable_filter) {
        config.filter_enabled = false;
        spdlog::info("Regex filtering disabled via command-line argument");
    }
    if (args.filter) {
        config.filter_enabled = true;
        config.filter_pattern = *args.filter;
        spdlog::info("Using regex filter pattern from command line: '{}'", *args.filter);
    }

    return changed;
}

ExitCode exit_code_for(const SyncResult& result) noexcept {
    switch (result.status) {
        case SyncStatus::success:   return ExitCode::success;
        case SyncStatus::cancelled: return ExitCode::cancelled;
        case SyncStatus::failed:
        case SyncStatus::declined:  return ExitCode::failure;
    }
    return ExitCode::failure;
}

//=============================================================================
// Commands
//=============================================================================

std::error_code test_connection(HttpTransport& transport, const std::string& url) noexcept {
    auto page = transport.fetch_text(url);
    if (!page) {
        return page.error();
    }
    return {};
}

ExitCode run(const CliArgs& args, const CancellationToken& token) noexcept {
    try {
        return run_sync(args, token);
    } catch (const std::exception& e) {
        spdlog::error("An unexpected error occurred: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return ExitCode::failure;
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Mirror v" << version.to_string() << " - HTTP directory synchronizer\n\n"
              << "Usage: " << program_name << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>       JSON configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -e, --extension <ext>     Only consider files ending with ext (e.g. .laz)\n"
              << "  -u, --url <url>           Override and save the server URL\n"
              << "      --username <name>     Override and save the server username\n"
              << "      --password <pass>     Override and save the server password\n"
              << "      --local-dir <dir>     Override and save the existing files directory\n"
              << "      --download-dir <dir>  Override and save the download directory\n"
              << "      --filter <regex>      Filter pattern for this run (enables filtering)\n"
              << "      --enable-filter       Enable filtering with the configured pattern\n"
              << "      --disable-filter      Disable filtering (nothing is downloaded)\n"
              << "      --verbose             Debug logging\n"
              << "      --no-color            Disable colored output\n"
              << "  -h, --help                Show this help\n"
              << "      --version             Show version\n\n"
              << "Exit codes: 0 success, 1 failure, 2 interrupted\n\n"
              << "Examples:\n"
              << "  " << program_name << " -e .laz --filter 'G2-W08-2-.*'\n"
              << "  " << program_name << " -u https://example.com/files/ --username alice\n";
}

void print_version() noexcept {
    std::cout << "Mirror v" << version.to_string() << '\n'
              << "Built: " << BUILD_DATE << " " << BUILD_TIME << '\n';
}

} // namespace mirror::cli
