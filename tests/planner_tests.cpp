// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mirror/core/planner.hpp>
#include "test_support.hpp"

using namespace mirror::core;
using mirror::test::TempDir;
using mirror::test::write_file;

namespace {

RemoteFileDescriptor remote(const std::string& name, std::uint64_t size) {
    return RemoteFileDescriptor{name, "http://server/data/" + name, size, "2024-03-01 10:15"};
}

} // namespace

TEST_CASE("LocalInventory::scan", "[planner]") {
    TempDir dir;
    auto local = dir / "current";
    auto downloads = dir / "downloads";

    SECTION("Creates missing directories") {
        auto inventory = LocalInventory::scan(local, downloads, "");
        REQUIRE(inventory.has_value());
        CHECK(inventory->names.empty());
        CHECK(std::filesystem::is_directory(local));
        CHECK(std::filesystem::is_directory(downloads));
    }

    SECTION("Union of names, sizes only from downloads") {
        write_file(local / "a.laz", "aaaa");
        write_file(downloads / "b.laz", std::string(400, 'b'));
        write_file(downloads / "c.txt", "c");

        auto inventory = LocalInventory::scan(local, downloads, ".laz");
        REQUIRE(inventory.has_value());
        CHECK(inventory->contains("a.laz"));
        CHECK(inventory->contains("b.laz"));
        CHECK(!inventory->contains("c.txt"));
        CHECK(!inventory->download_size("a.laz").has_value());
        CHECK(inventory->download_size("b.laz") == std::optional<std::uint64_t>{400});
    }

    SECTION("Subdirectories are not files") {
        std::filesystem::create_directories(downloads / "sub.laz");
        auto inventory = LocalInventory::scan(local, downloads, "");
        REQUIRE(inventory.has_value());
        CHECK(!inventory->contains("sub.laz"));
    }
}

TEST_CASE("plan - candidates and resume points", "[planner]") {
    auto match_all = NameFilter::compile(".*", false);

    SECTION("Absent files are fresh downloads") {
        LocalInventory local;
        auto result = plan({remote("a.laz", 1000), remote("b.laz", 2000)}, local, "", match_all);
        REQUIRE(result.entries.size() == 2);
        CHECK(result.entries[0].descriptor.name == "a.laz");
        CHECK(result.entries[0].resume_from_byte == 0);
        CHECK(!result.entries[0].is_resume());
        CHECK(result.entries[1].descriptor.name == "b.laz");
        CHECK(result.estimated_bytes() == 3000);
    }

    SECTION("Partial file in downloads resumes from its length") {
        LocalInventory local;
        local.names = {"a.laz"};
        local.download_sizes = {{"a.laz", 400}};

        auto result = plan({remote("a.laz", 1000)}, local, "", match_all);
        REQUIRE(result.entries.size() == 1);
        CHECK(result.entries[0].resume_from_byte == 400);
        CHECK(result.entries[0].remaining_bytes() == 600);
        REQUIRE(result.partials.size() == 1);
        CHECK(result.partials[0].local_size == 400);
        CHECK(result.partials[0].remote_size == 1000);
        CHECK(result.partials[0].percent_complete == Catch::Approx(40.0));
    }

    SECTION("Complete or larger local copies are skipped") {
        LocalInventory local;
        local.names = {"a.laz", "b.laz"};
        local.download_sizes = {{"a.laz", 1000}, {"b.laz", 5000}};

        auto result = plan({remote("a.laz", 1000), remote("b.laz", 2000)}, local, "", match_all);
        CHECK(result.empty());
        CHECK(result.partials.empty());
    }

    SECTION("A copy only in the current directory counts as present") {
        LocalInventory local;
        local.names = {"a.laz"};

        auto result = plan({remote("a.laz", 1000)}, local, "", match_all);
        CHECK(result.empty());
    }

    SECTION("Unknown remote size never makes a partial") {
        LocalInventory local;
        local.names = {"a.laz"};
        local.download_sizes = {{"a.laz", 0}};

        auto result = plan({remote("a.laz", 0)}, local, "", match_all);
        CHECK(result.empty());
    }

    SECTION("Extension filter ignores other names entirely") {
        LocalInventory local;
        auto result = plan({remote("a.laz", 10), remote("b.txt", 10)}, local, ".LAZ", match_all);
        REQUIRE(result.entries.size() == 1);
        CHECK(result.entries[0].descriptor.name == "a.laz");
        CHECK(result.filtered_out.empty());
    }
}

TEST_CASE("plan - name filter", "[planner]") {
    LocalInventory local;
    RemoteListing listing{remote("g2-w08-2-001.laz", 10), remote("g3-w08-2-001.laz", 20),
                          remote("G2-W08-2-002.laz", 30)};

    SECTION("Disabled filter rejects every candidate") {
        auto result = plan(listing, local, "", NameFilter::disabled());
        CHECK(result.entries.empty());
        CHECK(result.filtered_out ==
              std::vector<std::string>{"g2-w08-2-001.laz", "g3-w08-2-001.laz", "G2-W08-2-002.laz"});
    }

    SECTION("Rejected pattern rejects every candidate") {
        auto result = plan(listing, local, "", NameFilter::compile("(", false));
        CHECK(result.entries.empty());
        CHECK(result.filtered_out.size() == 3);
    }

    SECTION("Active filter splits candidates in input order") {
        auto result = plan(listing, local, "", NameFilter::compile("G2-W08-2-.*", false));
        REQUIRE(result.entries.size() == 2);
        CHECK(result.entries[0].descriptor.name == "g2-w08-2-001.laz");
        CHECK(result.entries[1].descriptor.name == "G2-W08-2-002.laz");
        CHECK(result.filtered_out == std::vector<std::string>{"g3-w08-2-001.laz"});
        CHECK(result.estimated_bytes() == 40);
    }

    SECTION("Files already present are never reported as filtered") {
        local.names = {"g3-w08-2-001.laz"};
        auto result = plan(listing, local, "", NameFilter::compile("G2-W08-2-.*", false));
        CHECK(result.filtered_out.empty());
    }
}

TEST_CASE("plan - scenario with a partial download on disk", "[planner]") {
    TempDir dir;
    write_file(dir / "downloads/a.laz", std::string(400, 'a'));

    auto inventory = LocalInventory::scan(dir / "current", dir / "downloads", "");
    REQUIRE(inventory.has_value());

    auto result = plan({remote("a.laz", 1000), remote("b.laz", 2000)}, *inventory, "",
                       NameFilter::compile(".*", false));

    REQUIRE(result.entries.size() == 2);
    CHECK(result.entries[0].descriptor.name == "a.laz");
    CHECK(result.entries[0].resume_from_byte == 400);
    CHECK(result.entries[1].descriptor.name == "b.laz");
    CHECK(result.entries[1].resume_from_byte == 0);
    CHECK(result.estimated_bytes() == 2600);
}
