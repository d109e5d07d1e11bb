// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mirror/core/name_filter.hpp>

using namespace mirror::core;

TEST_CASE("NameFilter - disabled refuses everything", "[name_filter]") {
    auto filter = NameFilter::disabled();
    CHECK(filter.state() == NameFilter::State::disabled);
    CHECK(!filter.is_active());
    CHECK(!filter.accepts("anything.laz"));
    CHECK(!filter.accepts(""));
}

TEST_CASE("NameFilter - search semantics", "[name_filter]") {
    SECTION("Case-insensitive prefix pattern") {
        auto filter = NameFilter::compile("G2-W08-2-.*", false);
        REQUIRE(filter.is_active());
        CHECK(filter.accepts("g2-w08-2-001.laz"));
        CHECK(filter.accepts("G2-W08-2-001.laz"));
        CHECK(!filter.accepts("g3-w08-2-001.laz"));
    }

    SECTION("Case-sensitive pattern") {
        auto filter = NameFilter::compile("G2-W08", true);
        REQUIRE(filter.is_active());
        CHECK(filter.accepts("G2-W08-2-001.laz"));
        CHECK(!filter.accepts("g2-w08-2-001.laz"));
    }

    SECTION("Pattern matches anywhere in the name") {
        auto filter = NameFilter::compile(".*-(108|109)-5", false);
        REQUIRE(filter.is_active());
        CHECK(filter.accepts("tile-108-5.laz"));
        CHECK(filter.accepts("x-109-5-y.laz"));
        CHECK(!filter.accepts("tile-110-5.laz"));

        auto substring = NameFilter::compile("laz", false);
        CHECK(substring.accepts("tile.LAZ"));
    }

    SECTION("Match-all") {
        auto filter = NameFilter::compile(".*", false);
        CHECK(filter.accepts("a.laz"));
        CHECK(filter.accepts(""));
    }
}

TEST_CASE("NameFilter - invalid pattern is rejected, not thrown", "[name_filter]") {
    NameFilter filter;
    REQUIRE_NOTHROW(filter = NameFilter::compile("([unclosed", false));
    CHECK(filter.state() == NameFilter::State::rejected);
    CHECK(!filter.error_message().empty());
    CHECK(!filter.accepts("anything"));
    CHECK(filter.pattern() == "([unclosed");
}

TEST_CASE("has_extension", "[name_filter]") {
    CHECK(has_extension("tile.laz", ".laz"));
    CHECK(has_extension("TILE.LAZ", ".laz"));
    CHECK(has_extension("tile.laz", ""));
    CHECK(!has_extension("tile.las", ".laz"));
    CHECK(!has_extension("laz", ".laz"));
}
