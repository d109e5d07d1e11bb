// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/core/config.hpp>
#include <filesystem>

namespace mirror::cli {

// Install the default spdlog logger: colored console sink plus an
// appending file sink. Both sinks log at info, or debug when verbose.
void init_logging(bool verbose, bool color,
                  const std::filesystem::path& log_file = core::LOG_FILE_NAME);

} // namespace mirror::cli
