#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "tilejump/config/ToolSettings.hpp"
#include "tilejump/core/JobSystem.hpp"
#include "tilejump/level/LevelValidator.hpp"

namespace
{
constexpr int kExitSuccess = 0;
constexpr int kExitFailures = 1;
constexpr int kExitUsage = 2;

struct CommandLine
{
    std::filesystem::path configPath = tilejump::config::kDefaultSettingsPath;
    std::optional<std::uint32_t> first;
    std::optional<std::uint32_t> last;
    bool serial = false;
    std::optional<std::filesystem::path> jsonPath;
};

void PrintUsage()
{
    std::cout << "Usage: tilejump_validate [--config <path>] [--first <n>] [--last <n>] [--serial] [--json <path>]\n";
}

std::optional<std::uint32_t> ParseSeed(std::string_view text)
{
    std::uint32_t value = 0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty())
    {
        return std::nullopt;
    }
    return value;
}

bool ParseCommandLine(int argc, char** argv, CommandLine* outLine)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--serial")
        {
            outLine->serial = true;
        }
        else if (arg == "--config" && hasValue)
        {
            outLine->configPath = argv[++i];
        }
        else if (arg == "--json" && hasValue)
        {
            outLine->jsonPath = std::filesystem::path(argv[++i]);
        }
        else if ((arg == "--first" || arg == "--last") && hasValue)
        {
            const std::optional<std::uint32_t> seed = ParseSeed(argv[++i]);
            if (!seed.has_value())
            {
                std::cout << "Invalid level number: " << argv[i] << "\n";
                return false;
            }
            (arg == "--first" ? outLine->first : outLine->last) = seed;
        }
        else
        {
            std::cout << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

bool WriteJsonReport(const std::filesystem::path& path, const tilejump::level::BatchReport& report, std::string* outError)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        *outError = "Unable to open file for writing: " + path.string();
        return false;
    }
    stream << tilejump::level::ToJson(report).dump(2) << "\n";
    return true;
}
} // namespace

int main(int argc, char** argv)
{
    using namespace tilejump;

    CommandLine commandLine;
    if (!ParseCommandLine(argc, argv, &commandLine))
    {
        PrintUsage();
        return kExitUsage;
    }

    config::ToolSettings settings;
    std::string error;
    if (!config::LoadOrCreateToolSettings(commandLine.configPath, &settings, &error))
    {
        std::cout << "[Config] " << error << "\n";
    }

    const std::uint32_t first = commandLine.first.value_or(1);
    const std::uint32_t last = commandLine.last.value_or(settings.maxLevel);
    if (last < first)
    {
        std::cout << "Empty seed range: " << first << ".." << last << "\n";
        PrintUsage();
        return kExitUsage;
    }

    const bool parallel = settings.parallel && !commandLine.serial;
    if (parallel)
    {
        core::JobSystem::Instance().Initialize(static_cast<std::size_t>(std::max(0, settings.workerCount)));
    }

    std::cout << "[Validate] Checking levels " << first << ".." << last << "\n";
    const level::LevelValidator validator(level::LevelGenerator(settings.generation), level::LevelRuleChecker(settings.rules));
    const level::BatchReport report = validator.ValidateRange(first, last, parallel);

    core::JobSystem::Instance().Shutdown();

    for (const std::string& line : report.FindingLines())
    {
        std::cout << line << "\n";
    }
    std::cout << report.SummaryLine() << "\n";

    if (commandLine.jsonPath.has_value())
    {
        if (!WriteJsonReport(*commandLine.jsonPath, report, &error))
        {
            std::cout << "[Validate] " << error << "\n";
        }
        else
        {
            std::cout << "[Validate] Report written to " << commandLine.jsonPath->string() << "\n";
        }
    }

    return report.AllPassed() ? kExitSuccess : kExitFailures;
}
