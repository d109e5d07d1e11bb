// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mirror/core/size_format.hpp>

using namespace mirror::core;
using namespace std::chrono_literals;

TEST_CASE("format_size", "[size_format]") {
    SECTION("Bytes") {
        CHECK(format_size(std::uint64_t{0}) == "0 B");
        CHECK(format_size(std::uint64_t{512}) == "512 B");
        CHECK(format_size(std::uint64_t{1023}) == "1023 B");
    }

    SECTION("Kilobytes") {
        CHECK(format_size(std::uint64_t{1024}) == "1.0 KB");
        CHECK(format_size(std::uint64_t{1536}) == "1.5 KB");
    }

    SECTION("Megabytes and gigabytes") {
        CHECK(format_size(std::uint64_t{176} * 1024 * 1024) == "176.0 MB");
        CHECK(format_size(std::uint64_t{5} * 1024 * 1024 * 1024 / 2) == "2.5 GB");
    }

    SECTION("Fractional bytes") {
        CHECK(format_size(100.7) == "100 B");
        CHECK(format_size(2048.0) == "2.0 KB");
    }
}

TEST_CASE("format_speed", "[size_format]") {
    CHECK(format_speed(1024.0 * 1024.0) == "1.0 MB/s");
    CHECK(format_speed(10.0) == "10 B/s");
}

TEST_CASE("format_eta", "[size_format]") {
    CHECK(format_eta(0s) == "0m 0s");
    CHECK(format_eta(247s) == "4m 7s");
    CHECK(format_eta(3600s) == "60m 0s");
}

TEST_CASE("format_elapsed", "[size_format]") {
    CHECK(format_elapsed(std::chrono::duration<double>(0.4)) == "0h 0m 0s");
    CHECK(format_elapsed(std::chrono::duration<double>(3723.9)) == "1h 2m 3s");
}
