// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>
#include <vector>

namespace mirror::cli {

namespace {

constexpr const char* CONSOLE_FORMAT = "%^%Y-%m-%d %H:%M:%S - %l - %v%$";
constexpr const char* FILE_FORMAT = "%Y-%m-%d %H:%M:%S.%e - %l - %v";

} // namespace

void init_logging(bool verbose, bool color, const std::filesystem::path& log_file) {
    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
        color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    console_sink->set_level(level);
    console_sink->set_pattern(CONSOLE_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_error;

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), /*truncate=*/false);
        file_sink->set_level(level);
        file_sink->set_pattern(FILE_FORMAT);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("mirror", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("Cannot open log file {}: {}", log_file.string(), file_error);
    }
}

} // namespace mirror::cli
