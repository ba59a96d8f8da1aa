#include "hexnav/core/NavSettings.hpp"
#include "hexnav/core/Log.hpp"
#include "hexnav/pathfinding/AStar.hpp"
#include "hexnav/pathfinding/BreadthFirst.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace hexnav::core {

namespace {
    // Settings JSON schema version. SaveNavSettings always writes the latest.
    constexpr int kNavSettingsSchemaVersion = 1;

    constexpr std::size_t kMaxSettingsBytes = 1u * 1024u * 1024u;

    float ClampHexSize(float v) noexcept
    {
        if (!(v >= kMinHexSize)) return kMinHexSize; // also catches NaN
        if (v > kMaxHexSize) return kMaxHexSize;
        return v;
    }

    unsigned ClampWorkerThreads(long long v) noexcept
    {
        if (v < static_cast<long long>(kMinWorkerThreads)) return kMinWorkerThreads;
        if (v > static_cast<long long>(kMaxWorkerThreads)) return kMaxWorkerThreads;
        return static_cast<unsigned>(v);
    }

    bool IsKnownStrategy(std::string_view s) noexcept
    {
        return s == "astar" || s == "bfs";
    }

    bool ReadFileToString(const std::filesystem::path& p, std::string& out)
    {
        out.clear();

        std::error_code ec;
        const auto size = std::filesystem::file_size(p, ec);
        if (ec || size == 0 || size > kMaxSettingsBytes)
            return false;

        std::ifstream f(p, std::ios::binary);
        if (!f)
            return false;

        std::ostringstream oss;
        oss << f.rdbuf();
        out = oss.str();
        return !out.empty();
    }

    const nlohmann::json* FindObject(const nlohmann::json& j, const char* key)
    {
        if (auto it = j.find(key); it != j.end() && it->is_object())
            return &*it;
        return nullptr;
    }
} // namespace

bool LoadNavSettings(NavSettings& settings, const std::filesystem::path& file)
{
    std::string text;
    if (!ReadFileToString(file, text))
        return false;

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        HEXNAV_LOG_WARN("LoadNavSettings: {} is not a JSON object", file.string());
        return false;
    }

    if (auto it = j.find("version"); it != j.end() && it->is_number_integer())
    {
        if (it->get<int>() > kNavSettingsSchemaVersion)
            HEXNAV_LOG_WARN("LoadNavSettings: {} has newer schema version {}", file.string(), it->get<int>());
    }

    if (const auto* grid = FindObject(j, "grid"))
    {
        if (auto it = grid->find("hexSize"); it != grid->end() && it->is_number())
            settings.hexSize = ClampHexSize(it->get<float>());
    }

    if (const auto* pathfinding = FindObject(j, "pathfinding"))
    {
        if (auto it = pathfinding->find("strategy"); it != pathfinding->end() && it->is_string())
        {
            const std::string s = it->get<std::string>();
            if (IsKnownStrategy(s))
                settings.strategy = s;
            else
                HEXNAV_LOG_WARN("LoadNavSettings: unknown strategy '{}', keeping '{}'", s, settings.strategy);
        }

        if (auto it = pathfinding->find("async"); it != pathfinding->end() && it->is_boolean())
            settings.asyncPathfinding = it->get<bool>();

        if (auto it = pathfinding->find("workerThreads"); it != pathfinding->end() && it->is_number_integer())
            settings.workerThreads = ClampWorkerThreads(it->get<long long>());
    }

    if (const auto* logging = FindObject(j, "logging"))
    {
        if (auto it = logging->find("level"); it != logging->end() && it->is_string())
            settings.logLevel = it->get<std::string>();

        if (auto it = logging->find("file"); it != logging->end() && it->is_string())
            settings.logFile = it->get<std::string>();
    }

    return true;
}

bool SaveNavSettings(const NavSettings& settings, const std::filesystem::path& file)
{
    std::error_code ec;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            HEXNAV_LOG_ERROR("SaveNavSettings: create_directories failed for {} ({}: {})",
                             file.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    nlohmann::json j;
    j["version"] = kNavSettingsSchemaVersion;
    j["grid"] = {
        { "hexSize", settings.hexSize },
    };
    j["pathfinding"] = {
        { "strategy", settings.strategy },
        { "async", settings.asyncPathfinding },
        { "workerThreads", settings.workerThreads },
    };
    j["logging"] = {
        { "level", settings.logLevel },
        { "file", settings.logFile },
    };

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        HEXNAV_LOG_ERROR("SaveNavSettings: cannot open {} for writing", file.string());
        return false;
    }
    f << j.dump(2) << '\n';
    return static_cast<bool>(f);
}

std::shared_ptr<pf::IPathStrategy> MakeStrategy(std::string_view name)
{
    if (name == "bfs")
        return std::make_shared<pf::BreadthFirstStrategy>();
    if (name != "astar")
        HEXNAV_LOG_WARN("MakeStrategy: unknown strategy '{}', using A*", name);
    return std::make_shared<pf::AStarStrategy>();
}

pathjobs::PathCoordinator::Options MakeCoordinatorOptions(const NavSettings& settings) noexcept
{
    pathjobs::PathCoordinator::Options opt;
    opt.offload = settings.asyncPathfinding;
    opt.worker_threads = std::clamp(settings.workerThreads, kMinWorkerThreads, kMaxWorkerThreads);
    return opt;
}

} // namespace hexnav::core
