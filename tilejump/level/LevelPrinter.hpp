#pragma once

#include <string>

#include "tilejump/level/LevelGenerator.hpp"
#include "tilejump/level/Reachability.hpp"

namespace tilejump::level
{
struct PrintOptions
{
    bool ansiColor = false;
    bool showPath = false;  // overlay start -> trophy -> exit route
    JumpEnvelope jump;
};

// One character per tile, one line per row, headed by "--- Level <n> ---".
[[nodiscard]] std::string RenderLevelText(const GeneratedLevel& level, const PrintOptions& options = {});
} // namespace tilejump::level
