#pragma once

/**
 * Colors are stored in the RGB565 encoding: 5 bits of red, 6 bits of green
 * and 5 bits of blue packed into 16 bits. The display implementation is
 * responsible for scaling them up to whatever its backend expects.
 */
typedef enum Color : unsigned short {
        Black = 0x0000,
        White = 0xFFFF,
        Red = 0xF800,
        Green = 0x07E0,
        Blue = 0x001F,
        DarkBlue = 0x01CF,
        Magenta = 0xF81F,
        Cyan = 0x7FFF,
        Brown = 0xBC40,
        Yellow = 0xFFE0,
        Gray = 0x8430,
        LightBlue = 0x7D7C,
        LightGreen = 0x841F,
        Orange = 0xFD20,

        /* Classic 2048 palette */
        BoardBackground = 0xBD74,
        PageBackground = 0xFFDD,
        EmptyCell = 0xCE16,
        Tile2 = 0xEF3B,
        Tile4 = 0xEF19,
        Tile8 = 0xF58F,
        Tile16 = 0xF4AC,
        Tile32 = 0xF3EB,
        Tile64 = 0xF2E7,
        Tile128 = 0xEE6E,
        Tile256 = 0xEE6C,
        Tile512 = 0xEE4A,
        Tile1024 = 0xEE27,
        Tile2048 = 0xEE05,
        TileSuper = 0x39C6,
        DarkText = 0x736C,
        LightText = 0xFFBE,
        ButtonBrown = 0x8BCC,
} Color;

const char *color_to_string(Color color);

/**
 * Returns black or white, whichever reads better on top of the given
 * background color.
 */
Color get_good_contrast_text_color(Color background);
