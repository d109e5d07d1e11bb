// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/core/size_format.hpp>
#include <iomanip>
#include <sstream>

namespace mirror::core {

namespace {

constexpr double KB = 1024.0;
constexpr double MB = 1024.0 * KB;
constexpr double GB = 1024.0 * MB;

std::string one_decimal(double value, const char* unit) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << ' ' << unit;
    return ss.str();
}

} // namespace

std::string format_size(std::uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    return format_size(static_cast<double>(bytes));
}

std::string format_size(double bytes) {
    if (bytes < KB) {
        return std::to_string(static_cast<std::uint64_t>(bytes < 0.0 ? 0.0 : bytes)) + " B";
    } else if (bytes < MB) {
        return one_decimal(bytes / KB, "KB");
    } else if (bytes < GB) {
        return one_decimal(bytes / MB, "MB");
    }
    return one_decimal(bytes / GB, "GB");
}

std::string format_speed(double bytes_per_second) {
    return format_size(bytes_per_second) + "/s";
}

std::string format_eta(std::chrono::seconds eta) {
    auto total = eta.count() < 0 ? 0 : eta.count();
    return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
}

std::string format_elapsed(std::chrono::duration<double> elapsed) {
    auto total = static_cast<std::int64_t>(elapsed.count());
    if (total < 0) total = 0;

    std::int64_t hours = total / 3600;
    std::int64_t minutes = (total % 3600) / 60;
    std::int64_t secs = total % 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(secs) + "s";
}

} // namespace mirror::core
