#include "tilejump/config/ToolSettings.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tilejump::config
{
namespace
{
using json = nlohmann::json;

constexpr int kMaxJumpHalfWidth = 1024;

// |value| as an integer if it is one and fits in [minValue, maxValue].
std::optional<std::int64_t> BoundedInteger(const json& value, std::int64_t minValue, std::int64_t maxValue)
{
    if (value.is_number_unsigned())
    {
        const std::uint64_t raw = value.get<std::uint64_t>();
        if (maxValue < 0 || raw > static_cast<std::uint64_t>(maxValue) || static_cast<std::int64_t>(raw) < minValue)
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer())
    {
        const std::int64_t raw = value.get<std::int64_t>();
        if (raw < minValue || raw > maxValue)
        {
            return std::nullopt;
        }
        return raw;
    }
    return std::nullopt;
}

// Out-of-range integers are logged and ignored; other types are ignored silently.
std::optional<std::int64_t> ReadBoundedInteger(const json& node, const char* key, std::int64_t minValue, std::int64_t maxValue)
{
    if (!node.contains(key) || !node[key].is_number_integer())
    {
        return std::nullopt;
    }

    const std::optional<std::int64_t> value = BoundedInteger(node[key], minValue, maxValue);
    if (!value.has_value())
    {
        std::cout << "[Config] Ignoring out-of-range value for '" << key << "': " << node[key].dump() << "\n";
    }
    return value;
}

void ReadInt(const json& node, const char* key, int& target)
{
    const auto value = ReadBoundedInteger(node, key, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    if (value.has_value())
    {
        target = static_cast<int>(*value);
    }
}

void ReadBool(const json& node, const char* key, bool& target)
{
    if (node.contains(key) && node[key].is_boolean())
    {
        target = node[key].get<bool>();
    }
}

void ApplyGeneration(const json& node, level::LevelGenerator::GenerationSettings& generation)
{
    ReadInt(node, "floor_hazard_chance", generation.floorHazardChance);
    ReadInt(node, "first_level_floor_hazard_chance", generation.firstLevelFloorHazardChance);
    ReadInt(node, "platform_hazard_chance", generation.platformHazardChance);
    ReadInt(node, "diamond_attempts", generation.diamondAttempts);
    ReadInt(node, "islands_per_tier_min", generation.islandsPerTierMin);
    ReadInt(node, "islands_per_tier_max", generation.islandsPerTierMax);
    ReadInt(node, "island_length_min", generation.islandLengthMin);
    ReadInt(node, "island_length_max", generation.islandLengthMax);
    ReadInt(node, "hazard_min_spacing", generation.hazardMinSpacing);
    ReadInt(node, "hazard_window", generation.hazardWindow);
    ReadInt(node, "hazard_window_max", generation.hazardWindowMax);
    ReadBool(node, "verbose_logging", generation.verboseLogging);
}

void ApplyRules(const json& node, level::LevelRuleSettings& rules)
{
    ReadInt(node, "max_hazard_run", rules.maxHazardRun);
    ReadInt(node, "min_hazard_gap", rules.minHazardGap);
    ReadInt(node, "density_window", rules.densityWindow);
    ReadInt(node, "max_hazards_per_window", rules.maxHazardsPerWindow);

    if (!node.contains("jump_half_widths") || !node["jump_half_widths"].is_array())
    {
        return;
    }
    const json& widths = node["jump_half_widths"];
    std::vector<int> parsed;
    for (const json& value : widths)
    {
        const std::optional<std::int64_t> width = BoundedInteger(value, 0, kMaxJumpHalfWidth);
        if (!width.has_value())
        {
            std::cout << "[Config] Ignoring invalid jump_half_widths entry: " << value.dump() << "\n";
            return;
        }
        parsed.push_back(static_cast<int>(*width));
    }
    if (!parsed.empty())
    {
        rules.jump.halfWidths = std::move(parsed);
    }
}
} // namespace

json ToJson(const ToolSettings& settings)
{
    const auto& generation = settings.generation;
    const auto& rules = settings.rules;

    json root;
    root["asset_version"] = settings.assetVersion;
    root["max_level"] = settings.maxLevel;
    root["parallel"] = settings.parallel;
    root["worker_count"] = settings.workerCount;
    root["generation"] = {
        {"floor_hazard_chance", generation.floorHazardChance},
        {"first_level_floor_hazard_chance", generation.firstLevelFloorHazardChance},
        {"platform_hazard_chance", generation.platformHazardChance},
        {"diamond_attempts", generation.diamondAttempts},
        {"islands_per_tier_min", generation.islandsPerTierMin},
        {"islands_per_tier_max", generation.islandsPerTierMax},
        {"island_length_min", generation.islandLengthMin},
        {"island_length_max", generation.islandLengthMax},
        {"hazard_min_spacing", generation.hazardMinSpacing},
        {"hazard_window", generation.hazardWindow},
        {"hazard_window_max", generation.hazardWindowMax},
        {"verbose_logging", generation.verboseLogging},
    };
    root["rules"] = {
        {"max_hazard_run", rules.maxHazardRun},
        {"min_hazard_gap", rules.minHazardGap},
        {"density_window", rules.densityWindow},
        {"max_hazards_per_window", rules.maxHazardsPerWindow},
        {"jump_half_widths", rules.jump.halfWidths},
    };
    return root;
}

bool ApplyJson(const json& root, ToolSettings* outSettings, std::string* outError)
{
    if (outSettings == nullptr)
    {
        return false;
    }
    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Settings root must be a JSON object";
        }
        return false;
    }

    ReadInt(root, "asset_version", outSettings->assetVersion);
    ReadBool(root, "parallel", outSettings->parallel);
    ReadInt(root, "worker_count", outSettings->workerCount);
    const auto maxLevel = ReadBoundedInteger(root, "max_level", 1, std::numeric_limits<std::uint32_t>::max());
    if (maxLevel.has_value())
    {
        outSettings->maxLevel = static_cast<std::uint32_t>(*maxLevel);
    }

    if (root.contains("generation") && root["generation"].is_object())
    {
        ApplyGeneration(root["generation"], outSettings->generation);
    }
    if (root.contains("rules") && root["rules"].is_object())
    {
        ApplyRules(root["rules"], outSettings->rules);
    }
    return true;
}

bool LoadToolSettings(const std::filesystem::path& path, ToolSettings* outSettings, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open settings file: " + path.string();
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid JSON in " + path.string() + ": " + ex.what();
        }
        return false;
    }

    return ApplyJson(root, outSettings, outError);
}

bool SaveToolSettings(const std::filesystem::path& path, const ToolSettings& settings, std::string* outError)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file for writing: " + path.string();
        }
        return false;
    }

    stream << ToJson(settings).dump(2) << "\n";
    return true;
}

bool LoadOrCreateToolSettings(const std::filesystem::path& path, ToolSettings* outSettings, std::string* outError)
{
    if (outSettings == nullptr)
    {
        return false;
    }
    *outSettings = ToolSettings{};

    if (!std::filesystem::exists(path))
    {
        std::cout << "[Config] Writing default settings to " << path.string() << "\n";
        return SaveToolSettings(path, *outSettings, outError);
    }

    ToolSettings loaded;
    if (!LoadToolSettings(path, &loaded, outError))
    {
        std::cout << "[Config] Using default settings\n";
        return false;
    }
    *outSettings = std::move(loaded);
    return true;
}
} // namespace tilejump::config
