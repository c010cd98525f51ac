#include "tilejump/level/Tile.hpp"

namespace tilejump::level
{
const char* TileName(Tile tile)
{
    switch (tile)
    {
        case Tile::Empty: return "empty";
        case Tile::Wall: return "wall";
        case Tile::Trophy: return "trophy";
        case Tile::Exit: return "exit";
        case Tile::Hazard: return "hazard";
        case Tile::Diamond: return "diamond";
        default: return "unknown";
    }
}

char TileGlyph(Tile tile)
{
    switch (tile)
    {
        case Tile::Empty: return ' ';
        case Tile::Wall: return '#';
        case Tile::Trophy: return '*';
        case Tile::Exit: return 'E';
        case Tile::Hazard: return '^';
        case Tile::Diamond: return '+';
        default: return '?';
    }
}
} // namespace tilejump::level
