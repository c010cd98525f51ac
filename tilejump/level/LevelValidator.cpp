#include "tilejump/level/LevelValidator.hpp"

#include <algorithm>
#include <exception>

#include <nlohmann/json.hpp>

#include "tilejump/core/JobSystem.hpp"

namespace tilejump::level
{
namespace
{
using json = nlohmann::json;

constexpr std::size_t kSeedsPerJob = 16;

SeedReport AbortedSeed(std::uint32_t seed, const char* reason)
{
    SeedReport report;
    report.seed = seed;
    report.archetype = LevelGenerator::ArchetypeForSeed(seed);
    report.violations.push_back(
        RuleViolation{RuleCategory::Internal, std::string{"Validation aborted: "} + reason, glm::ivec2{-1, -1}});
    return report;
}
} // namespace

std::size_t BatchReport::FailedCount() const
{
    return static_cast<std::size_t>(std::count_if(seeds.begin(), seeds.end(), [](const SeedReport& report) {
        return !report.Passed();
    }));
}

std::vector<std::string> BatchReport::FindingLines() const
{
    std::vector<std::string> lines;
    for (const SeedReport& report : seeds)
    {
        for (const RuleViolation& violation : report.violations)
        {
            lines.push_back("Seed " + std::to_string(report.seed) + ": " + violation.message);
        }
    }
    return lines;
}

std::string BatchReport::SummaryLine() const
{
    const std::size_t failed = FailedCount();
    if (failed == 0)
    {
        return "All " + std::to_string(TotalCount()) + " levels validated successfully!";
    }
    return "Found " + std::to_string(failed) + " seeds with validation failures.";
}

SeedReport LevelValidator::ValidateSeed(std::uint32_t seed) const
{
    const GeneratedLevel level = m_generator.Generate(seed);
    LevelCheckResult result = m_checker.CheckAll(level.grid, level.start);

    SeedReport report;
    report.seed = seed;
    report.archetype = level.archetype;
    report.violations = std::move(result.violations);
    return report;
}

BatchReport LevelValidator::ValidateRange(std::uint32_t first, std::uint32_t last, bool parallel) const
{
    BatchReport batch;
    if (first > last)
    {
        return batch;
    }

    const std::size_t count = static_cast<std::size_t>(last - first) + 1;
    batch.seeds.resize(count);

    // Every seed owns its slot, so workers never touch shared state.
    const auto validateOne = [this, first, &batch](std::size_t index) {
        const std::uint32_t seed = first + static_cast<std::uint32_t>(index);
        try
        {
            batch.seeds[index] = ValidateSeed(seed);
        }
        catch (const std::exception& ex)
        {
            batch.seeds[index] = AbortedSeed(seed, ex.what());
        }
    };

    core::JobSystem& jobs = core::JobSystem::Instance();
    if (!parallel || !jobs.IsInitialized())
    {
        for (std::size_t i = 0; i < count; ++i)
        {
            validateOne(i);
        }
        return batch;
    }

    core::JobCounter counter;
    jobs.ParallelFor(count, kSeedsPerJob, validateOne, counter);
    jobs.WaitForCounter(counter);
    return batch;
}

json ToJson(const BatchReport& report)
{
    json root;
    root["total"] = report.TotalCount();
    root["failed"] = report.FailedCount();

    json seeds = json::array();
    for (const SeedReport& seedReport : report.seeds)
    {
        json violations = json::array();
        for (const RuleViolation& violation : seedReport.violations)
        {
            violations.push_back({
                {"category", RuleCategoryName(violation.category)},
                {"message", violation.message},
                {"x", violation.location.x},
                {"y", violation.location.y},
            });
        }
        seeds.push_back({
            {"seed", seedReport.seed},
            {"archetype", ArchetypeName(seedReport.archetype)},
            {"passed", seedReport.Passed()},
            {"violations", std::move(violations)},
        });
    }
    root["seeds"] = std::move(seeds);
    return root;
}
} // namespace tilejump::level
