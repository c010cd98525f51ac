#pragma once

#include <cstdint>

namespace tilejump::level
{
enum class Tile : std::uint8_t
{
    Empty = 0,
    Wall,
    Trophy,  // must be collected before the exit opens
    Exit,
    Hazard,  // kills on contact
    Diamond  // score pickup
};

[[nodiscard]] const char* TileName(Tile tile);
[[nodiscard]] char TileGlyph(Tile tile);

// Everything except walls and hazards can be occupied by the player.
[[nodiscard]] constexpr bool IsTraversable(Tile tile)
{
    return tile != Tile::Wall && tile != Tile::Hazard;
}
} // namespace tilejump::level
