#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "tilejump/level/LevelGenerator.hpp"
#include "tilejump/level/LevelRules.hpp"

namespace tilejump::level
{
struct SeedReport
{
    std::uint32_t seed = 0;
    LevelArchetype archetype = LevelArchetype::ZigZag;
    std::vector<RuleViolation> violations;

    [[nodiscard]] bool Passed() const { return violations.empty(); }
};

struct BatchReport
{
    std::vector<SeedReport> seeds;  // ascending seed order

    [[nodiscard]] std::size_t TotalCount() const { return seeds.size(); }
    [[nodiscard]] std::size_t FailedCount() const;
    [[nodiscard]] bool AllPassed() const { return FailedCount() == 0; }

    // "Seed <n>: <message>" for every finding, in seed order.
    [[nodiscard]] std::vector<std::string> FindingLines() const;
    // Closing verdict line printed by the batch tool.
    [[nodiscard]] std::string SummaryLine() const;
};

class LevelValidator
{
public:
    LevelValidator() = default;
    LevelValidator(LevelGenerator generator, LevelRuleChecker checker)
        : m_generator(std::move(generator))
        , m_checker(std::move(checker))
    {
    }

    virtual ~LevelValidator() = default;

    [[nodiscard]] virtual SeedReport ValidateSeed(std::uint32_t seed) const;

    // Validates [first, last] inclusive. Uses the JobSystem when |parallel| is set
    // and the pool is running; results are ordered by seed either way. A seed whose
    // validation throws is reported as failed with an Internal finding.
    [[nodiscard]] BatchReport ValidateRange(std::uint32_t first, std::uint32_t last, bool parallel = true) const;

    [[nodiscard]] const LevelGenerator& Generator() const { return m_generator; }
    [[nodiscard]] const LevelRuleChecker& Checker() const { return m_checker; }

private:
    LevelGenerator m_generator;
    LevelRuleChecker m_checker;
};

[[nodiscard]] nlohmann::json ToJson(const BatchReport& report);
} // namespace tilejump::level
