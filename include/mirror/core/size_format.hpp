// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string>

namespace mirror::core {

// "512 B", "1.5 KB", "176.0 MB", "2.3 GB"
[[nodiscard]] std::string format_size(std::uint64_t bytes);

// Fractional byte counts (speeds)
[[nodiscard]] std::string format_size(double bytes);

// "12.3 MB/s"
[[nodiscard]] std::string format_speed(double bytes_per_second);

// "4m 7s"
[[nodiscard]] std::string format_eta(std::chrono::seconds eta);

// "1h 2m 3s"
[[nodiscard]] std::string format_elapsed(std::chrono::duration<double> elapsed);

} // namespace mirror::core
