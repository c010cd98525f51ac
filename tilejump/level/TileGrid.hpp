#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <glm/vec2.hpp>

#include "tilejump/level/Tile.hpp"

namespace tilejump::level
{
constexpr int kLevelWidth = 60;
constexpr int kLevelHeight = 20;

// Row-major tile storage. x is the column, y the row (row 0 is the top).
class TileGrid
{
public:
    TileGrid();
    TileGrid(int width, int height, Tile fill = Tile::Empty);

    [[nodiscard]] int Width() const { return m_width; }
    [[nodiscard]] int Height() const { return m_height; }

    [[nodiscard]] bool InBounds(int x, int y) const
    {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }
    [[nodiscard]] bool InBounds(const glm::ivec2& cell) const { return InBounds(cell.x, cell.y); }

    // Reads outside the grid report Wall.
    [[nodiscard]] Tile Get(int x, int y) const;
    [[nodiscard]] Tile Get(const glm::ivec2& cell) const { return Get(cell.x, cell.y); }

    // Returns false and leaves the grid untouched for out-of-bounds writes.
    bool Set(int x, int y, Tile tile);
    bool Set(const glm::ivec2& cell, Tile tile) { return Set(cell.x, cell.y, tile); }

    // Fills columns [xBegin, xEnd) of row y, clipped to the grid.
    void FillRow(int y, int xBegin, int xEnd, Tile tile);

    // Walls on row 0, the last row, column 0 and the last column.
    void StampBoundary();

    [[nodiscard]] bool IsSafe(int x, int y) const { return InBounds(x, y) && IsTraversable(Get(x, y)); }
    [[nodiscard]] bool IsSafe(const glm::ivec2& cell) const { return IsSafe(cell.x, cell.y); }

    // True when the cell directly below is a Wall.
    [[nodiscard]] bool IsSupported(int x, int y) const
    {
        return y + 1 < m_height && Get(x, y + 1) == Tile::Wall;
    }
    [[nodiscard]] bool IsSupported(const glm::ivec2& cell) const { return IsSupported(cell.x, cell.y); }

    // First cell holding |tile| in row-major order.
    [[nodiscard]] std::optional<glm::ivec2> Find(Tile tile) const;
    [[nodiscard]] int Count(Tile tile) const;
    [[nodiscard]] int CountInRow(int y, Tile tile) const;

    bool operator==(const TileGrid& other) const;
    bool operator!=(const TileGrid& other) const { return !(*this == other); }

private:
    [[nodiscard]] std::size_t Index(int x, int y) const
    {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x);
    }

    int m_width;
    int m_height;
    std::vector<Tile> m_tiles;
};
} // namespace tilejump::level
