// hexpath: load a text map, search one path, print it.
//
//   hexpath <map.txt> <q0> <r0> <q1> <r1> [--settings file.json]
//
// Exit code: 0 path found, 1 no path, 2 bad arguments or input.

#include "hexnav/core/Log.hpp"
#include "hexnav/core/NavSettings.hpp"
#include "hexnav/grid/MapText.hpp"
#include "hexnav/grid/TileIndex.hpp"
#include "hexnav/pathfinding/jobs/FrameDispatcher.hpp"
#include "hexnav/pathfinding/jobs/PathCoordinator.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <future>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

using namespace hexnav;

static void usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s <map.txt> <q0> <r0> <q1> <r1> [--settings file.json]\n", argv0);
}

// Whole argument must be a base-10 int32; out-of-range values are rejected.
static bool parse_int(const char* s, int32_t& out) {
    const char* end = s + std::strlen(s);
    auto [ptr, ec] = std::from_chars(s, end, out);
    return ec == std::errc() && ptr == end && ptr != s;
}

int main(int argc, char** argv) {
    if (argc != 6 && argc != 8) {
        usage(argv[0]);
        return 2;
    }

    int32_t q0 = 0, r0 = 0, q1 = 0, r1 = 0;
    if (!parse_int(argv[2], q0) || !parse_int(argv[3], r0) ||
        !parse_int(argv[4], q1) || !parse_int(argv[5], r1)) {
        usage(argv[0]);
        return 2;
    }

    core::NavSettings settings;
    if (argc == 8) {
        if (std::string_view(argv[6]) != "--settings") {
            usage(argv[0]);
            return 2;
        }
        if (!core::LoadNavSettings(settings, argv[7]))
            std::fprintf(stderr, "warning: could not read %s, using defaults\n", argv[7]);
    }

    logsys::LogOptions logOpt;
    logOpt.level = logsys::ParseLevel(settings.logLevel);
    logOpt.file = settings.logFile;
    logsys::Init(logOpt);

    auto map = grid::LoadMapFile(argv[1]);
    if (!map) {
        std::fprintf(stderr, "error: cannot load map %s\n", argv[1]);
        logsys::Shutdown();
        return 2;
    }

    grid::TileIndex index;
    grid::PopulateIndex(index, *map, settings.hexSize);

    pathjobs::FrameDispatcher dispatcher;
    pf::PathResult result;
    {
        pathjobs::PathCoordinator coordinator(&index, dispatcher,
                                              core::MakeCoordinatorOptions(settings),
                                              core::MakeStrategy(settings.strategy));

        auto future = coordinator.FindPathAsync(HexCoord(q0, r0), HexCoord(q1, r1));

        // Stand-in for a frame loop.
        while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            if (dispatcher.Drain() == 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        result = future.get();
    }

    int code = 0;
    if (result.succeeded()) {
        for (const HexCoord& c : result.path->points)
            std::printf("%d %d\n", c.q(), c.r());
        std::printf("# %zu steps, %zu nodes expanded\n", result.path->steps(), result.expanded);
    } else {
        std::printf("no path: %s%s%s\n", pf::StatusName(result.status),
                    result.error.empty() ? "" : " - ", result.error.c_str());
        code = (result.status == pf::PathStatus::InvalidConfig) ? 2 : 1;
    }

    logsys::Shutdown();
    return code;
}
