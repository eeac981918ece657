#include "constants.hpp"

const std::vector<Color> AVAILABLE_COLORS = {
    Color::ButtonBrown, Color::Tile2048, Color::Orange,    Color::Red,
    Color::Green,       Color::Blue,     Color::DarkBlue,  Color::Magenta,
    Color::Cyan,        Color::Brown,    Color::LightBlue, Color::Gray};

Color tile_color(int value)
{
        switch (value) {
        case 0:
                return EmptyCell;
        case 2:
                return Tile2;
        case 4:
                return Tile4;
        case 8:
                return Tile8;
        case 16:
                return Tile16;
        case 32:
                return Tile32;
        case 64:
                return Tile64;
        case 128:
                return Tile128;
        case 256:
                return Tile256;
        case 512:
                return Tile512;
        case 1024:
                return Tile1024;
        case 2048:
                return Tile2048;
        default:
                return TileSuper;
        }
}

Color tile_text_color(int value)
{
        // The two smallest tiles are very light, everything else is
        // saturated enough for the light text.
        if (value <= 4) {
                return DarkText;
        }
        return LightText;
}
