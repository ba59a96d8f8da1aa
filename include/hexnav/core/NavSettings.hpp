#pragma once
#include "hexnav/pathfinding/IPathStrategy.hpp"
#include "hexnav/pathfinding/jobs/PathCoordinator.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace hexnav::core {

inline constexpr float kMinHexSize = 0.01f;
inline constexpr float kMaxHexSize = 1000.0f;

inline constexpr unsigned kMinWorkerThreads = 1;
inline constexpr unsigned kMaxWorkerThreads = 16;

// Persisted as settings.json:
//
//   { "version": 1,
//     "grid":        { "hexSize": 1.0 },
//     "pathfinding": { "strategy": "astar", "async": true, "workerThreads": 1 },
//     "logging":     { "level": "info", "file": "" } }
struct NavSettings
{
    float hexSize = 1.0f;

    // "astar" or "bfs".
    std::string strategy = "astar";

    // Run searches on the worker executor instead of the frame thread.
    bool asyncPathfinding = true;
    unsigned workerThreads = 1;

    std::string logLevel = "info";
    std::string logFile; // empty = console only
};

// Best-effort: missing keys keep their current values, bad values fall back to defaults,
// out-of-range values are clamped. Returns false if the file is missing or not JSON.
bool LoadNavSettings(NavSettings& settings, const std::filesystem::path& file);
bool SaveNavSettings(const NavSettings& settings, const std::filesystem::path& file);

// Unknown names fall back to A* (logged).
std::shared_ptr<pf::IPathStrategy> MakeStrategy(std::string_view name);

pathjobs::PathCoordinator::Options MakeCoordinatorOptions(const NavSettings& settings) noexcept;

} // namespace hexnav::core
