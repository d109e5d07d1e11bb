// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mirror/cli/prompt.hpp>
#include <mirror/core/config.hpp>

namespace mirror::cli {

// Interactive first-run configuration: directories, server, filter.
// Starts from the defaults and creates both directories.
[[nodiscard]] core::SyncConfig run_first_time_setup(Prompter& prompter);

// Ask for every blank server field. Returns true if anything was asked.
bool prompt_missing_credentials(core::SyncConfig& config, Prompter& prompter);

// Blank the server fields so they are asked for again
void clear_credentials(core::SyncConfig& config) noexcept;

} // namespace mirror::cli
