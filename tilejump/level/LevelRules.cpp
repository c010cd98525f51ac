#include "tilejump/level/LevelRules.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tilejump::level
{
namespace
{
std::string CellText(const glm::ivec2& cell)
{
    return "(" + std::to_string(cell.x) + ", " + std::to_string(cell.y) + ")";
}

void Report(std::vector<RuleViolation>& out, RuleCategory category, std::string message, const glm::ivec2& location)
{
    out.push_back(RuleViolation{category, std::move(message), location});
}

void CheckSupported(const TileGrid& grid, const glm::ivec2& cell, const char* label, std::vector<RuleViolation>& out)
{
    if (!grid.IsSupported(cell))
    {
        Report(out, RuleCategory::Landmark, std::string{label} + " at " + CellText(cell) + " has no platform below", cell);
    }
}
} // namespace

const char* RuleCategoryName(RuleCategory category)
{
    switch (category)
    {
        case RuleCategory::Landmark: return "landmark";
        case RuleCategory::StartSafety: return "start_safety";
        case RuleCategory::HazardRun: return "hazard_run";
        case RuleCategory::HazardSpacing: return "hazard_spacing";
        case RuleCategory::HazardDensity: return "hazard_density";
        case RuleCategory::Boundary: return "boundary";
        case RuleCategory::Reachability: return "reachability";
        case RuleCategory::Internal: return "internal";
        default: return "unknown";
    }
}

std::vector<std::string> LevelCheckResult::FormatLines(std::uint32_t seed) const
{
    std::vector<std::string> lines;
    lines.reserve(violations.size());
    for (const RuleViolation& violation : violations)
    {
        lines.push_back("Seed " + std::to_string(seed) + ": " + violation.message);
    }
    return lines;
}

glm::ivec2 LevelRuleChecker::StartCell(const glm::vec2& start)
{
    return glm::ivec2{static_cast<int>(std::floor(start.x)), static_cast<int>(std::floor(start.y))};
}

LevelCheckResult LevelRuleChecker::CheckAll(const TileGrid& grid, const glm::vec2& start) const
{
    LevelCheckResult result;

    std::optional<glm::ivec2> trophy;
    std::optional<glm::ivec2> exit;
    CheckLandmarks(grid, result.violations, &trophy, &exit);
    CheckStartSafety(grid, start, result.violations);
    CheckHazardRuns(grid, result.violations);
    CheckHazardDensity(grid, result.violations);
    CheckBoundary(grid, result.violations);
    if (trophy.has_value() && exit.has_value())
    {
        CheckReachability(grid, StartCell(start), *trophy, *exit, result.violations);
    }

    result.passed = result.violations.empty();
    return result;
}

void LevelRuleChecker::CheckLandmarks(
    const TileGrid& grid,
    std::vector<RuleViolation>& outViolations,
    std::optional<glm::ivec2>* outTrophy,
    std::optional<glm::ivec2>* outExit) const
{
    std::optional<glm::ivec2> trophy;
    std::optional<glm::ivec2> exit;

    for (int y = 0; y < grid.Height(); ++y)
    {
        for (int x = 0; x < grid.Width(); ++x)
        {
            const Tile tile = grid.Get(x, y);
            if (tile == Tile::Trophy)
            {
                trophy = glm::ivec2{x, y};
                CheckSupported(grid, *trophy, "Trophy", outViolations);
            }
            else if (tile == Tile::Exit)
            {
                exit = glm::ivec2{x, y};
                CheckSupported(grid, *exit, "Exit", outViolations);
            }
        }
    }

    if (!trophy.has_value())
    {
        Report(outViolations, RuleCategory::Landmark, "No Trophy found", glm::ivec2{-1, -1});
    }
    if (!exit.has_value())
    {
        Report(outViolations, RuleCategory::Landmark, "No Exit found", glm::ivec2{-1, -1});
    }

    if (outTrophy != nullptr)
    {
        *outTrophy = trophy;
    }
    if (outExit != nullptr)
    {
        *outExit = exit;
    }
}

void LevelRuleChecker::CheckStartSafety(const TileGrid& grid, const glm::vec2& start, std::vector<RuleViolation>& outViolations) const
{
    const glm::ivec2 cell = StartCell(start);
    if (grid.IsSafe(cell))
    {
        return;
    }

    std::ostringstream message;
    message << "Player starts in dangerous location (" << start.x << ", " << start.y << ")";
    Report(outViolations, RuleCategory::StartSafety, message.str(), cell);
}

void LevelRuleChecker::CheckHazardRuns(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const
{
    const int width = grid.Width();
    for (int y = 0; y < grid.Height(); ++y)
    {
        int x = 0;
        while (x < width)
        {
            if (grid.Get(x, y) != Tile::Hazard)
            {
                ++x;
                continue;
            }

            const int runStart = x;
            while (x < width && grid.Get(x, y) == Tile::Hazard)
            {
                ++x;
            }
            const int runLength = x - runStart;
            if (runLength > m_settings.maxHazardRun)
            {
                Report(outViolations, RuleCategory::HazardRun,
                    "Too many consecutive hazards at y=" + std::to_string(y) + ": found " + std::to_string(runLength),
                    glm::ivec2{runStart, y});
            }

            int gapEnd = x;
            while (gapEnd < width && grid.Get(gapEnd, y) != Tile::Hazard)
            {
                ++gapEnd;
            }
            const int gap = gapEnd - x;
            if (gapEnd < width && gap < m_settings.minHazardGap)
            {
                Report(outViolations, RuleCategory::HazardSpacing,
                    "Hazards too close together at y=" + std::to_string(y) + ": space was only " + std::to_string(gap) + " blocks",
                    glm::ivec2{x, y});
            }
        }
    }
}

void LevelRuleChecker::CheckHazardDensity(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const
{
    const int window = std::max(1, m_settings.densityWindow);
    const int lastStart = std::max(0, grid.Width() - window);
    for (int y = 0; y < grid.Height(); ++y)
    {
        for (int startX = 0; startX <= lastStart; ++startX)
        {
            int count = 0;
            for (int x = startX; x < startX + window && x < grid.Width(); ++x)
            {
                if (grid.Get(x, y) == Tile::Hazard)
                {
                    ++count;
                }
            }
            if (count > m_settings.maxHazardsPerWindow)
            {
                Report(outViolations, RuleCategory::HazardDensity,
                    "Hazard density too high at y=" + std::to_string(y) + ", x range " + std::to_string(startX) + ".." +
                        std::to_string(startX + window),
                    glm::ivec2{startX, y});
                break;
            }
        }
    }
}

void LevelRuleChecker::CheckBoundary(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const
{
    const int bottom = grid.Height() - 1;
    const int right = grid.Width() - 1;

    for (int x = 0; x < grid.Width(); ++x)
    {
        if (grid.Get(x, 0) != Tile::Wall)
        {
            Report(outViolations, RuleCategory::Boundary, "Top boundary broken at x=" + std::to_string(x), glm::ivec2{x, 0});
        }
        // Floor hazards sit in the bottom row on purpose.
        const Tile floor = grid.Get(x, bottom);
        if (floor != Tile::Wall && floor != Tile::Hazard)
        {
            Report(outViolations, RuleCategory::Boundary, "Bottom boundary broken at x=" + std::to_string(x), glm::ivec2{x, bottom});
        }
    }
    for (int y = 0; y < grid.Height(); ++y)
    {
        if (grid.Get(0, y) != Tile::Wall)
        {
            Report(outViolations, RuleCategory::Boundary, "Left boundary broken at y=" + std::to_string(y), glm::ivec2{0, y});
        }
        if (grid.Get(right, y) != Tile::Wall)
        {
            Report(outViolations, RuleCategory::Boundary, "Right boundary broken at y=" + std::to_string(y), glm::ivec2{right, y});
        }
    }
}

void LevelRuleChecker::CheckReachability(
    const TileGrid& grid,
    const glm::ivec2& startCell,
    const glm::ivec2& trophy,
    const glm::ivec2& exit,
    std::vector<RuleViolation>& outViolations) const
{
    if (!IsReachable(grid, startCell, trophy, m_settings.jump))
    {
        Report(outViolations, RuleCategory::Reachability, "Trophy is not reachable from start", trophy);
    }
    if (!IsReachable(grid, trophy, exit, m_settings.jump))
    {
        Report(outViolations, RuleCategory::Reachability, "Exit is not reachable from Trophy", exit);
    }
}
} // namespace tilejump::level
