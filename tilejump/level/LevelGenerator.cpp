#include "tilejump/level/LevelGenerator.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "tilejump/core/SeededRng.hpp"

namespace tilejump::level
{
namespace
{
using core::SeededRng;

constexpr int kFloorHazardBegin = 15;
constexpr int kFloorHazardEnd = 50;     // exclusive
constexpr int kSafeLaneStride = 10;     // floor columns divisible by this stay clear
constexpr int kPlatformHazardBegin = 5;
constexpr int kPlatformHazardEnd = 55;  // exclusive
constexpr int kTierMargin = 2;
constexpr int kPickupMargin = 1;
constexpr int kMaxHazardBlock = 2;
constexpr int kNoHazardYet = -10;

std::uint32_t ToRange(int value)
{
    return static_cast<std::uint32_t>(std::max(0, value));
}

int Roll(SeededRng& rng, int min, int max)
{
    return static_cast<int>(rng.Range(ToRange(min), ToRange(max)));
}

bool WithinMargin(int column, int anchor, int margin)
{
    return column >= anchor - margin && column <= anchor + margin;
}

// Would placing [x, x + size) on |row| push any 15-wide window that ends inside the
// block above the allowed count?
bool HazardWindowAllows(const TileGrid& grid, int row, int x, int size, const LevelGenerator::GenerationSettings& settings)
{
    const int window = std::max(1, settings.hazardWindow);
    for (int windowStart = std::max(0, x + size - window); windowStart <= x; ++windowStart)
    {
        int count = 0;
        for (int i = 0; i < window; ++i)
        {
            const int checkX = windowStart + i;
            if (checkX >= grid.Width())
            {
                break;
            }
            const bool proposed = checkX >= x && checkX < x + size;
            if (proposed || grid.Get(checkX, row) == Tile::Hazard)
            {
                ++count;
            }
        }
        if (count > settings.hazardWindowMax)
        {
            return false;
        }
    }
    return true;
}

int RollBlockSize(SeededRng& rng)
{
    return rng.Range(0, 2) == 0 ? 1 : kMaxHazardBlock;
}

void BuildZigZag(TileGrid& grid, SeededRng& rng, Landmarks& landmarks)
{
    const int right = grid.Width() - 1;

    // Row 16 runs right from column 15, row 12 hangs off the right wall, row 8
    // off the left wall and row 4 off the right wall again. The ranges overlap so
    // every tier end sits within jump reach of the next tier.
    landmarks.w1Start = 15;
    landmarks.w1 = Roll(rng, 35, 55);
    grid.FillRow(kTierRows[0], landmarks.w1Start, landmarks.w1, Tile::Wall);

    landmarks.w2 = Roll(rng, 25, 45);
    grid.FillRow(kTierRows[1], landmarks.w2, right, Tile::Wall);

    landmarks.w3 = Roll(rng, 35, 55);
    grid.FillRow(kTierRows[2], 1, landmarks.w3, Tile::Wall);

    landmarks.w4 = Roll(rng, 25, 45);
    grid.FillRow(kTierRows[3], landmarks.w4, right, Tile::Wall);
}

void BuildFloatingIslands(TileGrid& grid, SeededRng& rng, const LevelGenerator::GenerationSettings& settings, Landmarks& landmarks)
{
    const int right = grid.Width() - 1;

    for (const int row : kTierRows)
    {
        const int islands = Roll(rng, settings.islandsPerTierMin, settings.islandsPerTierMax);
        for (int i = 0; i < islands; ++i)
        {
            const int start = Roll(rng, 5 + i * 15, 15 + i * 15);
            const int length = Roll(rng, settings.islandLengthMin, settings.islandLengthMax);
            grid.FillRow(row, start, std::min(start + length, right), Tile::Wall);

            if (i != 0)
            {
                continue;
            }
            if (row == kTierRows[0])
            {
                landmarks.w1 = start + length;
                landmarks.w1Start = start;
            }
            else if (row == kTierRows[1])
            {
                landmarks.w2 = start;
            }
            else if (row == kTierRows[2])
            {
                landmarks.w3 = start + length;
            }
            else if (row == kTierRows[3])
            {
                landmarks.w4 = start;
            }
        }
    }

    // Only reachable when a tier drew no islands at all.
    if (landmarks.w1 == 0)
    {
        landmarks.w1 = 40;
    }
    if (landmarks.w2 == 0)
    {
        landmarks.w2 = 20;
    }
    if (landmarks.w3 == 0)
    {
        landmarks.w3 = 40;
    }
    if (landmarks.w4 == 0)
    {
        landmarks.w4 = 20;
    }
}

glm::ivec2 PlaceTrophy(TileGrid& grid, SeededRng& rng, const Landmarks& landmarks)
{
    std::vector<int> candidates;
    for (int x = 1; x < grid.Width() - 1; ++x)
    {
        if (grid.Get(x, kTrophyTierRow) == Tile::Wall)
        {
            candidates.push_back(x);
        }
    }

    int trophyX = 0;
    if (!candidates.empty())
    {
        trophyX = candidates[rng.Range(0, static_cast<std::uint32_t>(candidates.size()))];
    }
    else
    {
        trophyX = Roll(rng, landmarks.w4 + 2, grid.Width() - 2);
    }

    const glm::ivec2 cell{trophyX, kTrophyTierRow - 1};
    grid.Set(cell, Tile::Trophy);
    return cell;
}

glm::ivec2 PlaceExit(TileGrid& grid, SeededRng& rng, const Landmarks& landmarks)
{
    glm::ivec2 cell = kFloorExitCell;
    if (rng.Range(0, 2) != 0)
    {
        const int x = std::min(std::max(landmarks.w1 - 2, landmarks.w1Start), grid.Width() - 2);
        cell = glm::ivec2{x, kPlatformExitRow};
    }
    grid.Set(cell, Tile::Exit);
    return cell;
}

int PlaceDiamonds(TileGrid& grid, SeededRng& rng, int attempts)
{
    int placed = 0;
    for (int attempt = 0; attempt < attempts; ++attempt)
    {
        const int row = kTierRows[rng.Range(0, static_cast<std::uint32_t>(kTierRows.size()))];
        const int x = Roll(rng, 2, grid.Width() - 2);
        if (grid.Get(x, row) == Tile::Wall && grid.Get(x, row - 1) == Tile::Empty)
        {
            grid.Set(x, row - 1, Tile::Diamond);
            ++placed;
        }
    }
    return placed;
}

int PlaceFloorHazards(TileGrid& grid, SeededRng& rng, int chance, const LevelGenerator::GenerationSettings& settings)
{
    const int floorRow = grid.Height() - 1;
    const auto isFloorColumn = [](int x) {
        return x < kFloorHazardEnd && x % kSafeLaneStride != 0;
    };

    int placedCells = 0;
    int lastHazardEnd = kNoHazardYet;
    for (int x = kFloorHazardBegin; x < kFloorHazardEnd; ++x)
    {
        if (!isFloorColumn(x) || x - lastHazardEnd < settings.hazardMinSpacing)
        {
            continue;
        }
        if (Roll(rng, 0, 100) >= chance)
        {
            continue;
        }

        const int size = RollBlockSize(rng);
        int actualSize = 0;
        while (actualSize < size && isFloorColumn(x + actualSize))
        {
            ++actualSize;
        }
        if (actualSize == 0 || !HazardWindowAllows(grid, floorRow, x, actualSize, settings))
        {
            continue;
        }

        grid.FillRow(floorRow, x, x + actualSize, Tile::Hazard);
        placedCells += actualSize;
        lastHazardEnd = x + actualSize - 1;
    }
    return placedCells;
}

int PlacePlatformHazards(TileGrid& grid, SeededRng& rng, const Landmarks& landmarks, const LevelGenerator::GenerationSettings& settings)
{
    int placedCells = 0;
    for (const int row : kTierRows)
    {
        const int hazardRow = row - 1;
        const auto isEligible = [&](int x) {
            return x >= kPlatformHazardBegin && x < kPlatformHazardEnd &&
                   !IsCriticalColumn(landmarks, row, x) &&
                   grid.Get(x, row) == Tile::Wall &&
                   grid.Get(x - 1, row) == Tile::Wall &&
                   grid.Get(x + 1, row) == Tile::Wall;
        };

        int lastHazardEnd = kNoHazardYet;
        for (int x = kPlatformHazardBegin; x < kPlatformHazardEnd; ++x)
        {
            if (!isEligible(x) || x - lastHazardEnd < settings.hazardMinSpacing)
            {
                continue;
            }
            if (Roll(rng, 0, 100) >= settings.platformHazardChance)
            {
                continue;
            }

            const int size = RollBlockSize(rng);
            int actualSize = 0;
            while (actualSize < size && isEligible(x + actualSize))
            {
                ++actualSize;
            }
            if (actualSize == 0 || !HazardWindowAllows(grid, hazardRow, x, actualSize, settings))
            {
                continue;
            }

            grid.FillRow(hazardRow, x, x + actualSize, Tile::Hazard);
            placedCells += actualSize;
            lastHazardEnd = x + actualSize - 1;
        }
    }
    return placedCells;
}
} // namespace

const char* ArchetypeName(LevelArchetype archetype)
{
    switch (archetype)
    {
        case LevelArchetype::ZigZag: return "zigzag";
        case LevelArchetype::FloatingIslands: return "floating_islands";
        default: return "unknown";
    }
}

bool IsCriticalColumn(const Landmarks& landmarks, int tierRow, int column)
{
    const int lowerLink = std::max(landmarks.w2, landmarks.w1Start);

    // Each tier connection is both a take-off point on the lower row and a
    // landing point on the upper one.
    if ((tierRow == kTierRows[0] || tierRow == kTierRows[1]) && WithinMargin(column, lowerLink, kTierMargin))
    {
        return true;
    }
    if ((tierRow == kTierRows[1] || tierRow == kTierRows[2]) && WithinMargin(column, landmarks.w3, kTierMargin))
    {
        return true;
    }
    if ((tierRow == kTierRows[2] || tierRow == kTierRows[3]) && WithinMargin(column, landmarks.w4, kTierMargin))
    {
        return true;
    }
    if (tierRow == kTrophyTierRow && WithinMargin(column, landmarks.trophyX, kPickupMargin))
    {
        return true;
    }
    return tierRow == landmarks.exit.y + 1 && WithinMargin(column, landmarks.exit.x, kPickupMargin);
}

LevelArchetype LevelGenerator::ArchetypeForSeed(std::uint32_t levelNum)
{
    return levelNum % 2 != 0 ? LevelArchetype::ZigZag : LevelArchetype::FloatingIslands;
}

int LevelGenerator::FloorHazardChanceForSeed(std::uint32_t levelNum) const
{
    return levelNum == 1 ? m_settings.firstLevelFloorHazardChance : m_settings.floorHazardChance;
}

GeneratedLevel LevelGenerator::Generate(std::uint32_t levelNum) const
{
    GeneratedLevel level;
    level.seed = levelNum;
    level.grid = TileGrid(kLevelWidth, kLevelHeight);
    level.grid.StampBoundary();

    SeededRng rng(levelNum);

    level.start = kPlayerStart;
    level.grid.FillRow(kStartPlatformRow, 1, 10, Tile::Wall);

    level.archetype = ArchetypeForSeed(levelNum);
    Landmarks& landmarks = level.landmarks;
    if (level.archetype == LevelArchetype::ZigZag)
    {
        BuildZigZag(level.grid, rng, landmarks);
    }
    else
    {
        BuildFloatingIslands(level.grid, rng, m_settings, landmarks);
    }

    level.trophy = PlaceTrophy(level.grid, rng, landmarks);
    landmarks.trophyX = level.trophy.x;

    level.exit = PlaceExit(level.grid, rng, landmarks);
    landmarks.exit = level.exit;

    level.diamondsPlaced = PlaceDiamonds(level.grid, rng, m_settings.diamondAttempts);

    level.floorHazardChancePercent = FloorHazardChanceForSeed(levelNum);
    level.floorHazardCells = PlaceFloorHazards(level.grid, rng, level.floorHazardChancePercent, m_settings);
    level.platformHazardCells = PlacePlatformHazards(level.grid, rng, landmarks, m_settings);

    if (m_settings.verboseLogging)
    {
        std::cout << "[LevelGen] Seed=" << levelNum
                  << " archetype=" << ArchetypeName(level.archetype)
                  << " trophy=(" << level.trophy.x << ", " << level.trophy.y << ")"
                  << " exit=(" << level.exit.x << ", " << level.exit.y << ")"
                  << " diamonds=" << level.diamondsPlaced
                  << " floorHazards=" << level.floorHazardCells
                  << " platformHazards=" << level.platformHazardCells
                  << "\n";
    }

    return level;
}

GeneratedLevel GenerateLevel(std::uint32_t levelNum)
{
    return LevelGenerator{}.Generate(levelNum);
}
} // namespace tilejump::level
