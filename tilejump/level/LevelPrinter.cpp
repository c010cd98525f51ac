#include "tilejump/level/LevelPrinter.hpp"

#include <optional>
#include <vector>

#include "tilejump/level/LevelRules.hpp"

namespace tilejump::level
{
namespace
{
constexpr const char* kReset = "\x1b[0m";
constexpr const char* kBlue = "\x1b[34m";
constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kRed = "\x1b[31m";
constexpr const char* kMagenta = "\x1b[35m";
constexpr const char* kCyan = "\x1b[36m";

constexpr char kPlayerGlyph = 'D';
constexpr char kPathGlyph = '.';

const char* TileColor(Tile tile)
{
    switch (tile)
    {
        case Tile::Wall: return kBlue;
        case Tile::Trophy: return kYellow;
        case Tile::Exit: return kGreen;
        case Tile::Hazard: return kRed;
        case Tile::Diamond: return kMagenta;
        default: return nullptr;
    }
}

void AppendGlyph(std::string& out, char glyph, const char* color, bool ansiColor)
{
    if (ansiColor && color != nullptr)
    {
        out += color;
        out += glyph;
        out += kReset;
        return;
    }
    out += glyph;
}

std::vector<bool> RouteMask(const GeneratedLevel& level, const JumpEnvelope& jump)
{
    const TileGrid& grid = level.grid;
    std::vector<bool> mask(static_cast<std::size_t>(grid.Width() * grid.Height()), false);

    const auto mark = [&](const std::optional<std::vector<glm::ivec2>>& path) {
        if (!path.has_value())
        {
            return;
        }
        for (const glm::ivec2& cell : *path)
        {
            mask[static_cast<std::size_t>(cell.y * grid.Width() + cell.x)] = true;
        }
    };

    const glm::ivec2 startCell = LevelRuleChecker::StartCell(level.start);
    mark(FindPath(grid, startCell, level.trophy, jump));
    mark(FindPath(grid, level.trophy, level.exit, jump));
    return mask;
}
} // namespace

std::string RenderLevelText(const GeneratedLevel& level, const PrintOptions& options)
{
    const TileGrid& grid = level.grid;
    const glm::ivec2 player = LevelRuleChecker::StartCell(level.start);

    std::vector<bool> route;
    if (options.showPath)
    {
        route = RouteMask(level, options.jump);
    }

    std::string out;
    out.reserve(static_cast<std::size_t>((grid.Width() + 1) * grid.Height() * (options.ansiColor ? 10 : 1) + 32));

    const std::string header = "--- Level " + std::to_string(level.seed) + " ---";
    if (options.ansiColor)
    {
        out += kMagenta;
        out += header;
        out += kReset;
    }
    else
    {
        out += header;
    }
    out += '\n';

    for (int y = 0; y < grid.Height(); ++y)
    {
        for (int x = 0; x < grid.Width(); ++x)
        {
            if (x == player.x && y == player.y)
            {
                AppendGlyph(out, kPlayerGlyph, kCyan, options.ansiColor);
                continue;
            }

            const Tile tile = grid.Get(x, y);
            if (tile == Tile::Empty && !route.empty() && route[static_cast<std::size_t>(y * grid.Width() + x)])
            {
                out += kPathGlyph;
                continue;
            }
            AppendGlyph(out, TileGlyph(tile), TileColor(tile), options.ansiColor);
        }
        out += '\n';
    }
    return out;
}
} // namespace tilejump::level
