#include "tilejump/level/TileGrid.hpp"

#include <algorithm>

namespace tilejump::level
{
TileGrid::TileGrid() : TileGrid(kLevelWidth, kLevelHeight)
{
}

TileGrid::TileGrid(int width, int height, Tile fill)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
    , m_tiles(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height), fill)
{
}

Tile TileGrid::Get(int x, int y) const
{
    if (!InBounds(x, y))
    {
        return Tile::Wall;
    }
    return m_tiles[Index(x, y)];
}

bool TileGrid::Set(int x, int y, Tile tile)
{
    if (!InBounds(x, y))
    {
        return false;
    }
    m_tiles[Index(x, y)] = tile;
    return true;
}

void TileGrid::FillRow(int y, int xBegin, int xEnd, Tile tile)
{
    if (y < 0 || y >= m_height)
    {
        return;
    }
    const int begin = std::max(0, xBegin);
    const int end = std::min(m_width, xEnd);
    for (int x = begin; x < end; ++x)
    {
        m_tiles[Index(x, y)] = tile;
    }
}

void TileGrid::StampBoundary()
{
    if (m_width == 0 || m_height == 0)
    {
        return;
    }
    FillRow(0, 0, m_width, Tile::Wall);
    FillRow(m_height - 1, 0, m_width, Tile::Wall);
    for (int y = 0; y < m_height; ++y)
    {
        m_tiles[Index(0, y)] = Tile::Wall;
        m_tiles[Index(m_width - 1, y)] = Tile::Wall;
    }
}

std::optional<glm::ivec2> TileGrid::Find(Tile tile) const
{
    for (int y = 0; y < m_height; ++y)
    {
        for (int x = 0; x < m_width; ++x)
        {
            if (m_tiles[Index(x, y)] == tile)
            {
                return glm::ivec2{x, y};
            }
        }
    }
    return std::nullopt;
}

int TileGrid::Count(Tile tile) const
{
    return static_cast<int>(std::count(m_tiles.begin(), m_tiles.end(), tile));
}

int TileGrid::CountInRow(int y, Tile tile) const
{
    if (y < 0 || y >= m_height)
    {
        return 0;
    }
    const auto rowBegin = m_tiles.begin() + static_cast<std::ptrdiff_t>(Index(0, y));
    return static_cast<int>(std::count(rowBegin, rowBegin + m_width, tile));
}

bool TileGrid::operator==(const TileGrid& other) const
{
    return m_width == other.m_width && m_height == other.m_height && m_tiles == other.m_tiles;
}
} // namespace tilejump::level
