// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mirror/cli/commands.hpp>
#include <mirror/cli/logging.hpp>
#include <mirror/cli/palette.hpp>
#include <mirror/cli/prompt.hpp>
#include <mirror/cli/setup.hpp>
#include <mirror/cli/terminal_presenter.hpp>
#include "test_support.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

using namespace mirror::cli;
using namespace mirror::core;
using namespace std::chrono_literals;
using mirror::test::FakeTransport;
using mirror::test::TempDir;

namespace {

// argv built from string literals
CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "mirror");
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(word.data());
    }
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

//=============================================================================
// Arguments
//=============================================================================

TEST_CASE("parse_args", "[cli]") {
    SECTION("Defaults") {
        auto args = parse({});
        CHECK(args.config_path == DEFAULT_CONFIG_PATH);
        CHECK(args.extension.empty());
        CHECK_FALSE(args.url.has_value());
        CHECK_FALSE(args.filter.has_value());
        CHECK(args.errors.empty());
    }

    SECTION("Every option") {
        auto args = parse({"-c", "alt.json", "-e", ".laz", "-u", "https://example.com/data/",
                           "--username", "alice", "--password", "pw",
                           "--local-dir", "have", "--download-dir", "get",
                           "--filter", "^tile_", "--enable-filter", "--verbose", "--no-color"});
        CHECK(args.errors.empty());
        CHECK(args.config_path == "alt.json");
        CHECK(args.extension == ".laz");
        CHECK(args.url == "https://example.com/data/");
        CHECK(args.username == "alice");
        CHECK(args.password == "pw");
        CHECK(args.local_dir == "have");
        CHECK(args.download_dir == "get");
        CHECK(args.filter == "^tile_");
        CHECK(args.enable_filter);
        CHECK_FALSE(args.disable_filter);
        CHECK(args.verbose);
        CHECK(args.no_color);
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"--help", "--bogus"}).help);
        CHECK(parse({"--help", "--bogus"}).errors.empty());
        CHECK(parse({"-h"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("Errors are collected") {
        auto args = parse({"--bogus", "--filter"});
        REQUIRE(args.errors.size() == 2);
        CHECK(args.errors[0] == "Unknown argument: --bogus");
        CHECK(args.errors[1] == "Option --filter requires a value");
        CHECK_FALSE(args.filter.has_value());
    }
}

TEST_CASE("apply_overrides", "[cli]") {
    SyncConfig config;
    config.filter_pattern = "saved";

    SECTION("Server and directory overrides are persisted") {
        auto args = parse({"-u", "https://example.com/data/", "--download-dir", "get"});
        CHECK(apply_overrides(args, config));
        CHECK(config.server_url == "https://example.com/data/");
        CHECK(config.download_dir == "get");
    }

    SECTION("Filter overrides are not persisted") {
        auto args = parse({"--enable-filter"});
        CHECK_FALSE(apply_overrides(args, config));
        CHECK(config.filter_enabled);
        CHECK(config.filter_pattern == "saved");
    }

    SECTION("Pattern enables filtering") {
        auto args = parse({"--disable-filter", "--filter", "^tile_"});
        CHECK_FALSE(apply_overrides(args, config));
        CHECK(config.filter_enabled);
        CHECK(config.filter_pattern == "^tile_");
    }

    SECTION("Disable wins over enable") {
        auto args = parse({"--enable-filter", "--disable-filter"});
        apply_overrides(args, config);
        CHECK_FALSE(config.filter_enabled);
    }
}

TEST_CASE("exit_code_for", "[cli]") {
    SyncResult result;
    CHECK(exit_code_for(result) == ExitCode::success);

    result.status = SyncStatus::failed;
    CHECK(exit_code_for(result) == ExitCode::failure);

    result.status = SyncStatus::declined;
    CHECK(exit_code_for(result) == ExitCode::failure);

    result.status = SyncStatus::cancelled;
    CHECK(exit_code_for(result) == ExitCode::cancelled);
}

TEST_CASE("test_connection", "[cli]") {
    FakeTransport transport;
    transport.pages["https://example.com/data/"] = "<html></html>";

    CHECK_FALSE(test_connection(transport, "https://example.com/data/"));

    transport.page_errors.push_back(make_error_code(SyncErrc::permission_denied));
    CHECK(test_connection(transport, "https://example.com/data/") == SyncErrc::permission_denied);
}

//=============================================================================
// Prompts
//=============================================================================

TEST_CASE("Prompter", "[cli]") {
    std::ostringstream out;

    SECTION("confirm accepts y and yes") {
        std::istringstream in("y\n YES \nno\n\n");
        Prompter prompter(in, out, Palette(false));

        CHECK(prompter.confirm("First?"));
        CHECK(prompter.confirm("Second?"));
        CHECK_FALSE(prompter.confirm("Third?"));
        CHECK_FALSE(prompter.confirm("Fourth?"));
        CHECK(out.str().find("First? (y/n): ") != std::string::npos);
    }

    SECTION("End of input answers no") {
        std::istringstream in("");
        Prompter prompter(in, out, Palette(false));

        CHECK_FALSE(prompter.confirm("Continue?"));
        CHECK(prompter.closed());
    }

    SECTION("ask trims and falls back to the default") {
        std::istringstream in("  value  \n\r\n");
        Prompter prompter(in, out, Palette(false));

        CHECK(prompter.ask("Name", "fallback") == "value");
        CHECK(prompter.ask("Name", "fallback") == "fallback");
        CHECK(out.str().find("Name [default: fallback]: ") != std::string::npos);
    }

    SECTION("ask_secret keeps the answer verbatim") {
        std::istringstream in(" pass word \n");
        Prompter prompter(in, out, Palette(false));

        CHECK(prompter.ask_secret("Password") == " pass word ");
    }
}

TEST_CASE("First-time setup", "[cli]") {
    TempDir dir;
    auto have = (dir / "have").string();
    auto get = (dir / "get").string();
    std::ostringstream out;

    SECTION("Filter enabled") {
        std::istringstream in(have + "\n" + get + "\n"
                              "https://example.com/data/\nalice\npw\n"
                              "y\n^tile_\nn\n");
        Prompter prompter(in, out, Palette(false));

        auto config = run_first_time_setup(prompter);

        CHECK(config.local_dir == have);
        CHECK(config.download_dir == get);
        CHECK(std::filesystem::is_directory(have));
        CHECK(std::filesystem::is_directory(get));
        CHECK(config.server_url == "https://example.com/data/");
        CHECK(config.username == "alice");
        CHECK(config.password == "pw");
        CHECK(config.filter_enabled);
        CHECK(config.filter_pattern == "^tile_");
        CHECK_FALSE(config.filter_case_sensitive);
        CHECK(config.has_credentials());
        CHECK(out.str().find("case-insensitive pattern: '^tile_'") != std::string::npos);
    }

    SECTION("Filter declined") {
        std::istringstream in(have + "\n" + get + "\n"
                              "https://example.com/data/\nalice\npw\n"
                              "n\n");
        Prompter prompter(in, out, Palette(false));

        auto config = run_first_time_setup(prompter);

        CHECK_FALSE(config.filter_enabled);
        CHECK(config.filter_pattern == DEFAULT_FILTER_PATTERN);
        CHECK(out.str().find("no files will be downloaded") != std::string::npos);
    }
}

TEST_CASE("Missing credentials", "[cli]") {
    std::ostringstream out;
    SyncConfig config;
    config.server_url = "https://example.com/data/";

    SECTION("Only blank fields are asked for") {
        std::istringstream in("alice\npw\n");
        Prompter prompter(in, out, Palette(false));

        CHECK(prompt_missing_credentials(config, prompter));
        CHECK(config.server_url == "https://example.com/data/");
        CHECK(config.username == "alice");
        CHECK(config.password == "pw");
        CHECK(out.str().find("Server URL is not configured") == std::string::npos);
    }

    SECTION("Complete credentials ask nothing") {
        config.username = "alice";
        config.password = "pw";
        std::istringstream in("");
        Prompter prompter(in, out, Palette(false));

        CHECK_FALSE(prompt_missing_credentials(config, prompter));
        CHECK(out.str().empty());
    }

    SECTION("Cleared credentials are asked again") {
        config.username = "alice";
        config.password = "pw";
        clear_credentials(config);
        CHECK_FALSE(config.has_credentials());

        std::istringstream in("https://other.example.com/\nbob\nsecret\n");
        Prompter prompter(in, out, Palette(false));

        CHECK(prompt_missing_credentials(config, prompter));
        CHECK(config.server_url == "https://other.example.com/");
        CHECK(config.username == "bob");
        CHECK(config.password == "secret");
    }
}

//=============================================================================
// Terminal output
//=============================================================================

TEST_CASE("Palette", "[cli]") {
    Palette off(false);
    CHECK(off.red().empty());
    CHECK(off.paint(off.green(), "text") == "text");
    CHECK(Palette::detect(true).enabled() == false);

    Palette on(true);
    CHECK(on.paint(on.green(), "ok") == "\033[92mok\033[0m");
    CHECK(on.for_percent(10.0) == on.red());
    CHECK(on.for_percent(45.0) == on.yellow());
    CHECK(on.for_percent(90.0) == on.green());
}

TEST_CASE("TerminalPresenter", "[cli]") {
    std::ostringstream out;
    TerminalPresenter presenter(out, Palette(false));

    SECTION("Progress line") {
        ProgressEvent event;
        event.label = "tile.laz";
        event.current_bytes = 512;
        event.total_bytes = 1024;
        event.percent = 50.0;
        event.speed_bps = 128.0;
        event.eta = 4s;

        presenter.progress(event);

        auto text = out.str();
        CHECK(text.starts_with("\r[===============>"));
        CHECK(text.find("50.0%") != std::string::npos);
        CHECK(text.find("tile.laz: 512 B/1.0 KB") != std::string::npos);
        CHECK(text.find("128 B/s") != std::string::npos);
        CHECK(text.find("ETA: 0m 4s") != std::string::npos);

        // The next notice starts on a fresh line
        presenter.notice(Severity::info, "done");
        CHECK(out.str().ends_with("\ndone\n"));
    }

    SECTION("Unknown total draws nothing") {
        presenter.progress(ProgressEvent{"tile.laz", 10, 0, 0.0, 0.0, std::nullopt});
        CHECK(out.str().empty());
    }

    SECTION("File start lines") {
        presenter.file_started(FileStartEvent{1, 2, "a.laz", 2048, 0});
        presenter.file_started(FileStartEvent{2, 2, "b.laz", 1000, 250});

        auto text = out.str();
        CHECK(text.find("File 1 of 2: Downloading a.laz (2.0 KB)") != std::string::npos);
        CHECK(text.find("File 2 of 2: Resuming b.laz (25.0% complete, 750 B remaining)") != std::string::npos);
    }

    SECTION("Failed file line carries the error") {
        presenter.file_finished(FileEndEvent{"b.laz", TransferStatus::failed, 0,
                                             make_error_code(SyncErrc::not_found)});
        CHECK(out.str() == "Failed: b.laz (Resource not found (404))\n");
    }

    SECTION("Plan summary") {
        PlanSummary summary;
        summary.file_count = 3;
        summary.filtered_count = 2;
        summary.partials.push_back(PartialDownloadRecord{"a.laz", 400, 1000, 40.0});
        summary.total_bytes = 2048;
        summary.download_dir = "/data/get";

        presenter.plan_summary(summary);

        auto text = out.str();
        CHECK(text.find("Need to download 3 files") != std::string::npos);
        CHECK(text.find("Excluded 2 files by regex filter") != std::string::npos);
        CHECK(text.find("Including 1 partially downloaded files:") != std::string::npos);
        CHECK(text.find("a.laz: 40.0% complete (400 B of 1000 B)") != std::string::npos);
        CHECK(text.find("Total remaining download size: 2.0 KB") != std::string::npos);
        CHECK(text.find("Files will be downloaded to: /data/get") != std::string::npos);
    }

    SECTION("Run summary") {
        SyncResult result;
        result.downloaded = {"a.laz"};
        result.total_bytes_moved = 2048;
        for (int i = 0; i < 12; ++i) {
            result.filtered_out.push_back("skip" + std::to_string(i) + ".laz");
        }

        RunSummary summary;
        summary.result = &result;
        summary.elapsed = std::chrono::duration<double>(2.0);
        summary.filter_enabled = true;
        summary.filter_pattern = "^tile_";
        summary.download_dir = "/data/get";

        SECTION("Success") {
            presenter.run_summary(summary);

            auto text = out.str();
            CHECK(text.find("DOWNLOAD OPERATION COMPLETED SUCCESSFULLY") != std::string::npos);
            CHECK(text.find("Successfully downloaded files (1):") != std::string::npos);
            CHECK(text.find("Filtered out files (12):") != std::string::npos);
            CHECK(text.find("skip9.laz") != std::string::npos);
            CHECK(text.find("skip10.laz") == std::string::npos);
            CHECK(text.find("...and 2 more") != std::string::npos);
            CHECK(text.find("Total downloaded: 2.0 KB") != std::string::npos);
            CHECK(text.find("Time elapsed: 0h 0m 2s") != std::string::npos);
            CHECK(text.find("Average download speed: 1.0 KB/s") != std::string::npos);
            CHECK(text.find("Filter: ^tile_ (case-insensitive)") != std::string::npos);
        }

        SECTION("Interrupted") {
            result.status = SyncStatus::cancelled;
            result.failed = {"b.laz"};
            summary.filter_enabled = false;

            presenter.run_summary(summary);

            auto text = out.str();
            CHECK(text.find("DOWNLOAD OPERATION TERMINATED BY USER") != std::string::npos);
            CHECK(text.find("Failed or incomplete files (1):") != std::string::npos);
            CHECK(text.find("Filter: Disabled") != std::string::npos);
            CHECK(text.find("run the program again") != std::string::npos);
        }
    }
}

TEST_CASE("init_logging", "[cli]") {
    TempDir dir;
    auto log_file = dir / "sync_log.txt";

    init_logging(false, false, log_file);
    spdlog::debug("hidden detail");
    spdlog::info("listing fetched");
    spdlog::default_logger()->flush();

    auto text = mirror::test::read_file(log_file);
    CHECK(text.find(" - info - listing fetched") != std::string::npos);
    CHECK(text.find("hidden detail") == std::string::npos);
    CHECK(spdlog::default_logger()->name() == "mirror");
    REQUIRE_FALSE(spdlog::default_logger()->sinks().empty());
    CHECK(spdlog::default_logger()->sinks()[0]->level() == spdlog::level::info);

    // Appends across runs
    init_logging(true, false, log_file);
    spdlog::debug("second run");
    spdlog::default_logger()->flush();

    text = mirror::test::read_file(log_file);
    CHECK(text.find("listing fetched") != std::string::npos);
    CHECK(text.find(" - debug - second run") != std::string::npos);
}
