#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "tilejump/level/LevelGenerator.hpp"
#include "tilejump/level/LevelRules.hpp"

namespace tilejump::config
{
constexpr int kSettingsAssetVersion = 1;
inline const std::filesystem::path kDefaultSettingsPath = std::filesystem::path("config") / "tilejump.json";

struct ToolSettings
{
    int assetVersion = kSettingsAssetVersion;
    std::uint32_t maxLevel = 10;  // default last seed of a validation batch
    bool parallel = true;
    int workerCount = 0;          // 0 = hardware threads - 1
    level::LevelGenerator::GenerationSettings generation;
    level::LevelRuleSettings rules;
};

[[nodiscard]] nlohmann::json ToJson(const ToolSettings& settings);

// Overlays the keys present in |root| onto |outSettings|. Keys that are missing or
// of the wrong type keep their current value.
[[nodiscard]] bool ApplyJson(const nlohmann::json& root, ToolSettings* outSettings, std::string* outError = nullptr);

[[nodiscard]] bool LoadToolSettings(const std::filesystem::path& path, ToolSettings* outSettings, std::string* outError = nullptr);
[[nodiscard]] bool SaveToolSettings(const std::filesystem::path& path, const ToolSettings& settings, std::string* outError = nullptr);

// Writes defaults when |path| does not exist. On a read or parse failure the
// defaults are kept in |outSettings| and false is returned.
[[nodiscard]] bool LoadOrCreateToolSettings(const std::filesystem::path& path, ToolSettings* outSettings, std::string* outError = nullptr);
} // namespace tilejump::config
