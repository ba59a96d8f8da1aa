#include "hexnav/grid/MapText.hpp"
#include "hexnav/core/Log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

namespace hexnav::grid {

namespace {

std::vector<std::string_view> SplitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t begin = 0;
    for (std::size_t i = 0; i <= text.size(); ++i)
    {
        if (i == text.size() || text[i] == '\r' || text[i] == '\n')
        {
            if (i > begin)
                lines.push_back(text.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    return lines;
}

} // namespace

std::optional<MapData> ParseMapText(std::string_view text)
{
    if (text.empty())
    {
        HEXNAV_LOG_ERROR("MapText: map text is empty");
        return std::nullopt;
    }

    const auto lines = SplitLines(text);
    if (lines.empty())
    {
        HEXNAV_LOG_ERROR("MapText: no valid lines in map text");
        return std::nullopt;
    }

    MapData map;
    map.height = static_cast<int32_t>(lines.size());
    map.width  = static_cast<int32_t>(lines.front().size());
    map.cells.assign(static_cast<std::size_t>(map.width) * static_cast<std::size_t>(map.height), 0);

    for (int32_t y = 0; y < map.height; ++y)
    {
        const std::string_view line = lines[static_cast<std::size_t>(y)];
        if (static_cast<int32_t>(line.size()) != map.width)
        {
            HEXNAV_LOG_WARN("MapText: inconsistent line width on row {}. Expected {}, got {}",
                            y, map.width, line.size());
        }

        const int32_t n = std::min(map.width, static_cast<int32_t>(line.size()));
        for (int32_t x = 0; x < n; ++x)
        {
            // Unknown characters default to water.
            map.cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(map.width) + static_cast<std::size_t>(x)] =
                line[static_cast<std::size_t>(x)] == '1' ? 1 : 0;
        }
    }

    return map;
}

std::optional<MapData> LoadMapFile(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        HEXNAV_LOG_ERROR("MapText: cannot open {}", path.string());
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    auto map = ParseMapText(oss.str());
    if (!map || !map->IsValid())
    {
        HEXNAV_LOG_ERROR("MapText: invalid map data in {}", path.string());
        return std::nullopt;
    }

    HEXNAV_LOG_INFO("MapText: loaded {} ({}x{})", path.string(), map->width, map->height);
    return map;
}

std::size_t PopulateIndex(TileIndex& index, const MapData& map, float hexSize)
{
    index.Initialize(map.width, map.height, hexSize);
    if (!map.IsValid())
        return 0;

    for (int32_t y = 0; y < map.height; ++y)
    {
        for (int32_t x = 0; x < map.width; ++x)
        {
            const HexCoord coord = HexCoord::FromOffset(x, y);
            index.Insert(coord, HexTile{ coord, map.IsBlocked(x, y) ? TileKind::Blocked : TileKind::Traversable });
        }
    }
    return index.TileCount();
}

} // namespace hexnav::grid
