#pragma once

#include <optional>
#include <vector>

#include <glm/vec2.hpp>

#include "tilejump/level/TileGrid.hpp"

namespace tilejump::level
{
// Coarse jump arc: halfWidths[rise - 1] is how far sideways a grounded jump can
// land |rise| rows up. The entry count is the maximum rise.
struct JumpEnvelope
{
    std::vector<int> halfWidths{5, 8, 10, 12};

    [[nodiscard]] int MaxRise() const { return static_cast<int>(halfWidths.size()); }
    [[nodiscard]] int HalfWidthAt(int rise) const
    {
        return rise >= 1 && rise <= MaxRise() ? halfWidths[static_cast<std::size_t>(rise - 1)] : 0;
    }
};

// Cells one BFS step away from |cell|: walk left/right, fall (straight or
// diagonal) when unsupported, or jump anywhere inside the envelope when standing
// on a wall.
[[nodiscard]] std::vector<glm::ivec2> Neighbors(const TileGrid& grid, const glm::ivec2& cell, const JumpEnvelope& envelope = {});

// Breadth-first search; returns the cells from start to target inclusive.
[[nodiscard]] std::optional<std::vector<glm::ivec2>> FindPath(
    const TileGrid& grid,
    const glm::ivec2& start,
    const glm::ivec2& target,
    const JumpEnvelope& envelope = {});

[[nodiscard]] bool IsReachable(const TileGrid& grid, const glm::ivec2& start, const glm::ivec2& target, const JumpEnvelope& envelope = {});
} // namespace tilejump::level
