#include "tilejump/level/Reachability.hpp"

#include <algorithm>
#include <queue>

namespace tilejump::level
{
namespace
{
constexpr int kUnvisited = -1;

int FlatIndex(const TileGrid& grid, const glm::ivec2& cell)
{
    return cell.y * grid.Width() + cell.x;
}
} // namespace

std::vector<glm::ivec2> Neighbors(const TileGrid& grid, const glm::ivec2& cell, const JumpEnvelope& envelope)
{
    std::vector<glm::ivec2> result;

    const auto tryAdd = [&](int x, int y) {
        if (grid.IsSafe(x, y))
        {
            result.emplace_back(x, y);
        }
    };

    tryAdd(cell.x - 1, cell.y);
    tryAdd(cell.x + 1, cell.y);

    if (!grid.IsSupported(cell))
    {
        tryAdd(cell.x, cell.y + 1);
        tryAdd(cell.x - 1, cell.y + 1);
        tryAdd(cell.x + 1, cell.y + 1);
        return result;
    }

    for (int rise = 1; rise <= envelope.MaxRise(); ++rise)
    {
        const int y = cell.y - rise;
        if (y < 0)
        {
            break;
        }
        const int halfWidth = envelope.HalfWidthAt(rise);
        for (int dx = -halfWidth; dx <= halfWidth; ++dx)
        {
            tryAdd(cell.x + dx, y);
        }
    }
    return result;
}

std::optional<std::vector<glm::ivec2>> FindPath(
    const TileGrid& grid,
    const glm::ivec2& start,
    const glm::ivec2& target,
    const JumpEnvelope& envelope)
{
    if (!grid.InBounds(start) || !grid.InBounds(target))
    {
        return std::nullopt;
    }

    // parent[i] holds the flat index of the cell that discovered i.
    std::vector<int> parent(static_cast<std::size_t>(grid.Width() * grid.Height()), kUnvisited);
    std::queue<glm::ivec2> frontier;

    const int startIndex = FlatIndex(grid, start);
    parent[static_cast<std::size_t>(startIndex)] = startIndex;
    frontier.push(start);

    while (!frontier.empty())
    {
        const glm::ivec2 current = frontier.front();
        frontier.pop();

        if (current == target)
        {
            std::vector<glm::ivec2> path;
            int index = FlatIndex(grid, current);
            while (index != startIndex)
            {
                path.emplace_back(index % grid.Width(), index / grid.Width());
                index = parent[static_cast<std::size_t>(index)];
            }
            path.push_back(start);
            std::reverse(path.begin(), path.end());
            return path;
        }

        const int currentIndex = FlatIndex(grid, current);
        for (const glm::ivec2& next : Neighbors(grid, current, envelope))
        {
            int& slot = parent[static_cast<std::size_t>(FlatIndex(grid, next))];
            if (slot != kUnvisited)
            {
                continue;
            }
            slot = currentIndex;
            frontier.push(next);
        }
    }

    return std::nullopt;
}

bool IsReachable(const TileGrid& grid, const glm::ivec2& start, const glm::ivec2& target, const JumpEnvelope& envelope)
{
    return FindPath(grid, start, target, envelope).has_value();
}
} // namespace tilejump::level
