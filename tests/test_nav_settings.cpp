// tests/test_nav_settings.cpp
//
// Regression/robustness tests for core/NavSettings.
//
// Goals:
//   - Saving creates the directory + writes settings.json
//   - Loading round-trips values
//   - Corrupt or out-of-range values do not throw and do not clobber good values

#include <doctest/doctest.h>

#include "hexnav/core/NavSettings.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hexnav_nav_settings_test {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("hexnav_nav_settings_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_file(const fs::path& p, const std::string& text)
{
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace hexnav_nav_settings_test

using namespace hexnav;
using namespace hexnav_nav_settings_test;

TEST_CASE("core::SaveNavSettings creates settings.json and core::LoadNavSettings round-trips values")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";
    const fs::path file = dir / "settings.json";

    core::NavSettings s;
    s.hexSize = 2.5f;
    s.strategy = "bfs";
    s.asyncPathfinding = false;
    s.workerThreads = 3;
    s.logLevel = "debug";
    s.logFile = "logs/hexnav.log";

    CHECK(core::SaveNavSettings(s, file));
    CHECK(fs::exists(file));

    core::NavSettings loaded;
    CHECK(core::LoadNavSettings(loaded, file));
    CHECK(loaded.hexSize == doctest::Approx(2.5f));
    CHECK(loaded.strategy == "bfs");
    CHECK(loaded.asyncPathfinding == false);
    CHECK(loaded.workerThreads == 3u);
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.logFile == "logs/hexnav.log");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadNavSettings returns false for missing file (first run)")
{
    const fs::path dir = make_unique_temp_dir() / "missing";

    core::NavSettings s; // defaults
    CHECK_FALSE(core::LoadNavSettings(s, dir / "settings.json"));
    CHECK(s.hexSize == doctest::Approx(1.0f));
    CHECK(s.strategy == "astar");
    CHECK(s.asyncPathfinding == true);
    CHECK(s.workerThreads == 1u);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadNavSettings rejects non-JSON without touching values")
{
    const fs::path dir = make_unique_temp_dir() / "garbage";
    const fs::path file = dir / "settings.json";
    write_file(file, "hexSize=2.0\n{ not json");

    core::NavSettings s;
    s.hexSize = 4.0f;
    CHECK_FALSE(core::LoadNavSettings(s, file));
    CHECK(s.hexSize == doctest::Approx(4.0f));

    write_file(file, "[1, 2, 3]");
    CHECK_FALSE(core::LoadNavSettings(s, file));

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadNavSettings ignores wrongly typed values (does not clobber existing settings)")
{
    const fs::path dir = make_unique_temp_dir() / "wrong_types";
    const fs::path file = dir / "settings.json";
    write_file(file, R"({
        "version": 1,
        "grid": { "hexSize": "big" },
        "pathfinding": { "strategy": "dijkstra", "async": "yes", "workerThreads": 2 },
        "logging": { "level": 3 }
    })");

    core::NavSettings s;
    s.hexSize = 1.5f;
    s.strategy = "bfs";
    s.asyncPathfinding = false;
    s.logLevel = "warn";

    CHECK(core::LoadNavSettings(s, file));
    CHECK(s.hexSize == doctest::Approx(1.5f));  // unchanged (not a number)
    CHECK(s.strategy == "bfs");                  // unchanged (unknown strategy)
    CHECK(s.asyncPathfinding == false);          // unchanged (not a bool)
    CHECK(s.workerThreads == 2u);                // updated
    CHECK(s.logLevel == "warn");                 // unchanged (not a string)

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadNavSettings clamps out-of-range values")
{
    const fs::path dir = make_unique_temp_dir() / "clamp";
    const fs::path file = dir / "settings.json";

    write_file(file, R"({ "grid": { "hexSize": -3 }, "pathfinding": { "workerThreads": 0 } })");
    core::NavSettings s;
    CHECK(core::LoadNavSettings(s, file));
    CHECK(s.hexSize == doctest::Approx(core::kMinHexSize));
    CHECK(s.workerThreads == core::kMinWorkerThreads);

    write_file(file, R"({ "grid": { "hexSize": 1e9 }, "pathfinding": { "workerThreads": 512 } })");
    CHECK(core::LoadNavSettings(s, file));
    CHECK(s.hexSize == doctest::Approx(core::kMaxHexSize));
    CHECK(s.workerThreads == core::kMaxWorkerThreads);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::MakeStrategy selects by name and falls back to A*")
{
    CHECK(core::MakeStrategy("astar")->Name() == "A* Pathfinding");
    CHECK(core::MakeStrategy("bfs")->Name() == "Breadth-First Search");
    CHECK(core::MakeStrategy("teleport")->Name() == "A* Pathfinding");
}

TEST_CASE("core::MakeCoordinatorOptions maps pathfinding settings")
{
    core::NavSettings s;
    s.asyncPathfinding = false;
    s.workerThreads = 99;

    const auto opt = core::MakeCoordinatorOptions(s);
    CHECK(opt.offload == false);
    CHECK(opt.worker_threads == core::kMaxWorkerThreads);
}
