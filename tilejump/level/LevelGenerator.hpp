#pragma once

#include <array>
#include <cstdint>

#include <glm/vec2.hpp>

#include "tilejump/level/TileGrid.hpp"

namespace tilejump::level
{
// Platform rows from bottom to top. Row 4 is the trophy tier.
constexpr std::array<int, 4> kTierRows{16, 12, 8, 4};
constexpr int kTrophyTierRow = 4;
constexpr int kStartPlatformRow = 18;
constexpr int kPlatformExitRow = 15;
constexpr glm::ivec2 kFloorExitCell{55, 18};
constexpr glm::vec2 kPlayerStart{2.0F, 17.99F};

enum class LevelArchetype
{
    ZigZag,          // four long alternating platforms (odd seeds)
    FloatingIslands  // 2-3 short islands per tier (even seeds)
};

[[nodiscard]] const char* ArchetypeName(LevelArchetype archetype);

// Column landmarks that connect tiers. Hazards stay clear of them.
struct Landmarks
{
    int w1 = 0;        // end of the row-16 run (first island end on floating levels)
    int w1Start = 15;  // start of the row-16 run
    int w2 = 0;        // start of the row-12 run
    int w3 = 0;        // end of the row-8 run
    int w4 = 0;        // start of the row-4 run
    int trophyX = 0;
    glm::ivec2 exit{0, 0};
};

// Pure predicate: true when |column| on platform row |tierRow| is a jump/landing
// point, the trophy, or directly under the exit.
[[nodiscard]] bool IsCriticalColumn(const Landmarks& landmarks, int tierRow, int column);

struct GeneratedLevel
{
    std::uint32_t seed = 0;
    TileGrid grid;
    glm::vec2 start = kPlayerStart;
    LevelArchetype archetype = LevelArchetype::ZigZag;
    Landmarks landmarks;
    glm::ivec2 trophy{0, 0};
    glm::ivec2 exit{0, 0};
    int floorHazardChancePercent = 0;
    int diamondsPlaced = 0;
    int floorHazardCells = 0;
    int platformHazardCells = 0;
};

class LevelGenerator
{
public:
    struct GenerationSettings
    {
        // --- Hazard chances (percent per eligible column) ---
        int floorHazardChance = 30;
        int firstLevelFloorHazardChance = 10;
        int platformHazardChance = 15;

        // --- Pickups ---
        int diamondAttempts = 8;

        // --- Floating islands (max values are exclusive) ---
        int islandsPerTierMin = 2;
        int islandsPerTierMax = 4;
        int islandLengthMin = 5;
        int islandLengthMax = 12;

        // --- Hazard fairness ---
        int hazardMinSpacing = 4;  // columns from the previous block end to the next block start
        int hazardWindow = 15;
        int hazardWindowMax = 4;

        bool verboseLogging = false;
    };

    LevelGenerator() = default;
    explicit LevelGenerator(const GenerationSettings& settings) : m_settings(settings) {}

    [[nodiscard]] GeneratedLevel Generate(std::uint32_t levelNum) const;

    [[nodiscard]] static LevelArchetype ArchetypeForSeed(std::uint32_t levelNum);
    [[nodiscard]] int FloorHazardChanceForSeed(std::uint32_t levelNum) const;

    [[nodiscard]] const GenerationSettings& Settings() const { return m_settings; }

private:
    GenerationSettings m_settings;
};

// Default-settings generation used by the tools and the game loop.
[[nodiscard]] GeneratedLevel GenerateLevel(std::uint32_t levelNum);
} // namespace tilejump::level
