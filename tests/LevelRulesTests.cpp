#include "tilejump/level/LevelRules.hpp"

#include <gtest/gtest.h>

#include "tilejump/level/LevelGenerator.hpp"

using namespace tilejump::level;

namespace
{
// Bounded 60x20 room: trophy on the floor mid-way, exit at the floor exit cell.
TileGrid MakeCleanRoom()
{
    TileGrid grid;
    grid.StampBoundary();
    grid.Set(30, 18, Tile::Trophy);
    grid.Set(kFloorExitCell, Tile::Exit);
    return grid;
}

std::vector<RuleViolation> OfCategory(const LevelCheckResult& result, RuleCategory category)
{
    std::vector<RuleViolation> matches;
    for (const RuleViolation& violation : result.violations)
    {
        if (violation.category == category)
        {
            matches.push_back(violation);
        }
    }
    return matches;
}
} // namespace

TEST(LevelRules, CleanRoomPasses)
{
    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(MakeCleanRoom(), kPlayerStart);
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.violations.empty());
}

TEST(LevelRules, StartCellFloorsThePosition)
{
    EXPECT_EQ(LevelRuleChecker::StartCell(kPlayerStart), glm::ivec2(2, 17));
    EXPECT_EQ(LevelRuleChecker::StartCell(glm::vec2{5.9F, 0.1F}), glm::ivec2(5, 0));
}

TEST(LevelRules, HazardRunOfThreeIsReported)
{
    TileGrid grid = MakeCleanRoom();
    grid.FillRow(10, 20, 23, Tile::Hazard);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.violations.size(), 1U);

    const RuleViolation& violation = result.violations.front();
    EXPECT_EQ(violation.category, RuleCategory::HazardRun);
    EXPECT_EQ(violation.message, "Too many consecutive hazards at y=10: found 3");
    EXPECT_EQ(violation.location, glm::ivec2(20, 10));
}

TEST(LevelRules, LongerRunLimitComesFromSettings)
{
    TileGrid grid = MakeCleanRoom();
    grid.FillRow(10, 20, 23, Tile::Hazard);

    LevelRuleSettings settings;
    settings.maxHazardRun = 3;
    EXPECT_TRUE(LevelRuleChecker(settings).CheckAll(grid, kPlayerStart).passed);
}

TEST(LevelRules, NarrowGapBetweenHazards)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(20, 10, Tile::Hazard);
    grid.Set(22, 10, Tile::Hazard);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations[0].category, RuleCategory::HazardSpacing);
    EXPECT_EQ(result.violations[0].message, "Hazards too close together at y=10: space was only 1 blocks");
    EXPECT_EQ(result.violations[0].location, glm::ivec2(21, 10));
}

TEST(LevelRules, DenseRowReportedOnce)
{
    TileGrid grid = MakeCleanRoom();
    grid.FillRow(10, 20, 22, Tile::Hazard);
    grid.FillRow(10, 25, 27, Tile::Hazard);
    grid.FillRow(10, 30, 32, Tile::Hazard);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations[0].category, RuleCategory::HazardDensity);
    EXPECT_EQ(result.violations[0].message, "Hazard density too high at y=10, x range 16..31");
}

TEST(LevelRules, BrokenBoundariesAreListed)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(7, 0, Tile::Empty);
    grid.Set(0, 5, Tile::Empty);
    grid.Set(59, 6, Tile::Diamond);
    grid.Set(12, 19, Tile::Empty);
    grid.Set(40, 19, Tile::Hazard);  // floor hazards are legal

    std::vector<RuleViolation> violations;
    LevelRuleChecker{}.CheckBoundary(grid, violations);

    ASSERT_EQ(violations.size(), 4U);
    EXPECT_EQ(violations[0].message, "Top boundary broken at x=7");
    EXPECT_EQ(violations[1].message, "Bottom boundary broken at x=12");
    EXPECT_EQ(violations[2].message, "Left boundary broken at y=5");
    EXPECT_EQ(violations[3].message, "Right boundary broken at y=6");
}

TEST(LevelRules, FloatingTrophyFlaggedAtItsCell)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(30, 18, Tile::Empty);
    grid.Set(30, 10, Tile::Trophy);

    std::vector<RuleViolation> violations;
    std::optional<glm::ivec2> trophy;
    std::optional<glm::ivec2> exit;
    LevelRuleChecker{}.CheckLandmarks(grid, violations, &trophy, &exit);

    ASSERT_EQ(violations.size(), 1U);
    EXPECT_EQ(violations[0].message, "Trophy at (30, 10) has no platform below");
    EXPECT_EQ(violations[0].location, glm::ivec2(30, 10));
    ASSERT_TRUE(trophy.has_value());
    EXPECT_EQ(*trophy, glm::ivec2(30, 10));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(*exit, kFloorExitCell);
}

TEST(LevelRules, FloatingExitFlagged)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(kFloorExitCell, Tile::Empty);
    grid.Set(50, 15, Tile::Exit);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    const auto landmark = OfCategory(result, RuleCategory::Landmark);
    ASSERT_EQ(landmark.size(), 1U);
    EXPECT_EQ(landmark[0].message, "Exit at (50, 15) has no platform below");
}

TEST(LevelRules, MissingLandmarksSkipReachability)
{
    TileGrid grid;
    grid.StampBoundary();

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    ASSERT_EQ(result.violations.size(), 2U);
    EXPECT_EQ(result.violations[0].message, "No Trophy found");
    EXPECT_EQ(result.violations[1].message, "No Exit found");
    EXPECT_TRUE(OfCategory(result, RuleCategory::Reachability).empty());
}

TEST(LevelRules, StartInsideWall)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(5, 3, Tile::Wall);

    std::vector<RuleViolation> violations;
    LevelRuleChecker{}.CheckStartSafety(grid, glm::vec2{5.5F, 3.25F}, violations);
    ASSERT_EQ(violations.size(), 1U);
    EXPECT_EQ(violations[0].category, RuleCategory::StartSafety);
    EXPECT_EQ(violations[0].message, "Player starts in dangerous location (5.5, 3.25)");
}

TEST(LevelRules, StartOutsideGridIsDangerous)
{
    std::vector<RuleViolation> violations;
    LevelRuleChecker{}.CheckStartSafety(MakeCleanRoom(), glm::vec2{-1.0F, 4.0F}, violations);
    EXPECT_EQ(violations.size(), 1U);
}

TEST(LevelRules, UnreachableTrophyStillChecksExitLeg)
{
    TileGrid grid = MakeCleanRoom();
    grid.Set(30, 18, Tile::Empty);
    grid.Set(30, 10, Tile::Trophy);
    grid.Set(30, 11, Tile::Wall);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations[0].category, RuleCategory::Reachability);
    EXPECT_EQ(result.violations[0].message, "Trophy is not reachable from start");
}

TEST(LevelRules, SealedExitIsUnreachable)
{
    TileGrid grid = MakeCleanRoom();
    grid.FillRow(17, 54, 57, Tile::Wall);
    grid.Set(54, 18, Tile::Wall);
    grid.Set(56, 18, Tile::Wall);

    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations[0].message, "Exit is not reachable from Trophy");
    EXPECT_EQ(result.violations[0].location, kFloorExitCell);
}

TEST(LevelRules, FormatLinesPrefixSeed)
{
    TileGrid grid;
    grid.StampBoundary();
    const LevelCheckResult result = LevelRuleChecker{}.CheckAll(grid, kPlayerStart);

    const std::vector<std::string> lines = result.FormatLines(7);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0], "Seed 7: No Trophy found");
}

TEST(LevelRules, CategoryNames)
{
    EXPECT_STREQ(RuleCategoryName(RuleCategory::HazardRun), "hazard_run");
    EXPECT_STREQ(RuleCategoryName(RuleCategory::StartSafety), "start_safety");
    EXPECT_STREQ(RuleCategoryName(RuleCategory::Reachability), "reachability");
    EXPECT_STREQ(RuleCategoryName(RuleCategory::Internal), "internal");
}

TEST(LevelRules, GeneratedLevelsPassEveryRule)
{
    const LevelGenerator generator;
    const LevelRuleChecker checker;
    for (std::uint32_t seed = 0; seed <= 200; ++seed)
    {
        const GeneratedLevel level = generator.Generate(seed);
        const LevelCheckResult result = checker.CheckAll(level.grid, level.start);
        EXPECT_TRUE(result.passed) << "seed " << seed << ": "
                                   << (result.violations.empty() ? std::string{} : result.violations.front().message);
    }
}
