// tests/test_map_text.cpp
//
// Text map loading: '1' = blocked land, everything else = walkable water.

#include <doctest/doctest.h>

#include "hexnav/grid/MapText.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hexnav_map_text_test {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("hexnav_map_text_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

} // namespace hexnav_map_text_test

using namespace hexnav;
using namespace hexnav::grid;

TEST_CASE("MapText/ParsesRowsAndClassifiesCells") {
    auto map = ParseMapText("0100\n0010\n0000\n");
    REQUIRE(map.has_value());
    CHECK(map->width == 4);
    CHECK(map->height == 3);
    CHECK(map->IsValid());
    CHECK(map->IsBlocked(1, 0));
    CHECK(map->IsBlocked(2, 1));
    CHECK_FALSE(map->IsBlocked(0, 0));
    CHECK_FALSE(map->IsBlocked(3, 2));
}

TEST_CASE("MapText/CrLfAndBlankLinesAreIgnored") {
    auto map = ParseMapText("\r\n01\r\n\r\n10\r\n\n");
    REQUIRE(map.has_value());
    CHECK(map->width == 2);
    CHECK(map->height == 2);
    CHECK(map->IsBlocked(1, 0));
    CHECK(map->IsBlocked(0, 1));
}

TEST_CASE("MapText/UnknownCharactersAreWater") {
    auto map = ParseMapText("x1~\n");
    REQUIRE(map.has_value());
    CHECK_FALSE(map->IsBlocked(0, 0));
    CHECK(map->IsBlocked(1, 0));
    CHECK_FALSE(map->IsBlocked(2, 0));
}

TEST_CASE("MapText/RaggedRowsUseFirstRowWidth") {
    auto map = ParseMapText("111\n1\n11111\n");
    REQUIRE(map.has_value());
    CHECK(map->width == 3);
    CHECK(map->height == 3);
    CHECK(map->IsValid());
    // Short row: missing cells are water.
    CHECK(map->IsBlocked(0, 1));
    CHECK_FALSE(map->IsBlocked(1, 1));
    CHECK_FALSE(map->IsBlocked(2, 1));
    // Long row: extra cells dropped.
    CHECK(map->IsBlocked(2, 2));
}

TEST_CASE("MapText/EmptyInputIsRejected") {
    CHECK_FALSE(ParseMapText("").has_value());
    CHECK_FALSE(ParseMapText("\n\r\n").has_value());
}

TEST_CASE("MapText/PopulateIndexUsesOffsetToAxial") {
    auto map = ParseMapText("000\n010\n000\n");
    REQUIRE(map.has_value());

    TileIndex index;
    CHECK(PopulateIndex(index, *map, 2.0f) == 9u);
    CHECK(index.Width() == 3);
    CHECK(index.Height() == 3);
    CHECK(index.HexSize() == doctest::Approx(2.0f));

    // Cell (1,1) -> axial (1,1); cell (0,2) -> axial (-1,2).
    CHECK_FALSE(index.IsWalkable({1, 1}));
    CHECK(index.HasTile({1, 1}));
    CHECK(index.IsWalkable({-1, 2}));
    CHECK(index.IsWalkable({1, 2}));
    CHECK_FALSE(index.HasTile({2, 2}));
}

TEST_CASE("MapText/LoadMapFile") {
    const fs::path dir = hexnav_map_text_test::make_unique_temp_dir();
    const fs::path file = dir / "map.txt";
    {
        std::ofstream f(file, std::ios::binary);
        f << "0000\n0110\n";
    }

    auto map = LoadMapFile(file);
    REQUIRE(map.has_value());
    CHECK(map->width == 4);
    CHECK(map->height == 2);
    CHECK(map->IsBlocked(2, 1));

    CHECK_FALSE(LoadMapFile(dir / "does_not_exist.txt").has_value());

    std::error_code dec;
    fs::remove_all(dir, dec);
}
