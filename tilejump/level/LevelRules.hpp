#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glm/vec2.hpp>

#include "tilejump/level/Reachability.hpp"
#include "tilejump/level/TileGrid.hpp"

namespace tilejump::level
{
enum class RuleCategory
{
    Landmark,
    StartSafety,
    HazardRun,
    HazardSpacing,
    HazardDensity,
    Boundary,
    Reachability,
    Internal  // validation itself failed
};

[[nodiscard]] const char* RuleCategoryName(RuleCategory category);

struct RuleViolation
{
    RuleCategory category = RuleCategory::Landmark;
    std::string message;
    glm::ivec2 location{-1, -1};
};

struct LevelCheckResult
{
    bool passed = true;
    std::vector<RuleViolation> violations;

    // One "Seed <n>: <message>" line per violation.
    [[nodiscard]] std::vector<std::string> FormatLines(std::uint32_t seed) const;
};

struct LevelRuleSettings
{
    int maxHazardRun = 2;
    int minHazardGap = 3;
    int densityWindow = 15;
    int maxHazardsPerWindow = 4;
    JumpEnvelope jump;
};

// Static fairness checks over a finished grid. Every check appends its findings
// and never stops at the first one.
class LevelRuleChecker
{
public:
    LevelRuleChecker() = default;
    explicit LevelRuleChecker(LevelRuleSettings settings) : m_settings(std::move(settings)) {}

    [[nodiscard]] LevelCheckResult CheckAll(const TileGrid& grid, const glm::vec2& start) const;

    // Trophy and exit exist and stand on a wall. Returns their cells when found.
    void CheckLandmarks(
        const TileGrid& grid,
        std::vector<RuleViolation>& outViolations,
        std::optional<glm::ivec2>* outTrophy = nullptr,
        std::optional<glm::ivec2>* outExit = nullptr) const;
    void CheckStartSafety(const TileGrid& grid, const glm::vec2& start, std::vector<RuleViolation>& outViolations) const;
    // Run length and gap between runs, per row.
    void CheckHazardRuns(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const;
    void CheckHazardDensity(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const;
    void CheckBoundary(const TileGrid& grid, std::vector<RuleViolation>& outViolations) const;
    void CheckReachability(
        const TileGrid& grid,
        const glm::ivec2& startCell,
        const glm::ivec2& trophy,
        const glm::ivec2& exit,
        std::vector<RuleViolation>& outViolations) const;

    [[nodiscard]] static glm::ivec2 StartCell(const glm::vec2& start);

    [[nodiscard]] const LevelRuleSettings& Settings() const { return m_settings; }

private:
    LevelRuleSettings m_settings;
};
} // namespace tilejump::level
