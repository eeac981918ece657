#include "color.hpp"

const char *color_to_string(Color color)
{
        switch (color) {
        case Black:
                return "Black";
        case White:
                return "White";
        case Red:
                return "Red";
        case Green:
                return "Green";
        case Blue:
                return "Blue";
        case DarkBlue:
                return "Navy";
        case Magenta:
                return "Magenta";
        case Cyan:
                return "Cyan";
        case Brown:
                return "Brown";
        case Yellow:
                return "Yellow";
        case Gray:
                return "Gray";
        case LightBlue:
                return "Sky";
        case LightGreen:
                return "Lilac";
        case Orange:
                return "Orange";
        case ButtonBrown:
                return "Walnut";
        case Tile2048:
                return "Gold";
        default:
                return "Custom";
        }
}

Color get_good_contrast_text_color(Color background)
{
        int red = (background >> 11) & 0b11111;
        int green = (background >> 5) & 0b111111;
        int blue = background & 0b11111;

        // Perceived luminance with all channels scaled to the 0-63 range.
        int luminance = (299 * red * 2 + 587 * green + 114 * blue * 2) / 1000;
        return luminance > 36 ? Black : White;
}
