/* Definitions of platform-specific constants that are commonly used by the
 * games.*/
#pragma once

#include "platform/interface/color.hpp"
#include <vector>

#define FONT_SIZE 16
#define FONT_WIDTH 10
#define HEADING_FONT_SIZE 24
#define HEADING_FONT_WIDTH 15
#define LARGE_FONT_SIZE 32
#define LARGE_FONT_WIDTH 20

#define SCREEN_BORDER_WIDTH 3

/* Constants below control time intervals between input polling */
#define INPUT_POLLING_DELAY 20

// The keyboard auto-repeats quickly, without this pause a single key press
// would be registered as several moves.
#define MOVE_REGISTERED_DELAY 120

/* The game window mimics a phone screen held in portrait orientation. */
constexpr int DISPLAY_HEIGHT = 600;
constexpr int DISPLAY_WIDTH = 400;
constexpr int DISPLAY_CORNER_RADIUS = 24;

extern const std::vector<Color> AVAILABLE_COLORS;

/**
 * Background color of a 2048 tile holding the given value. Empty cells
 * (value 0) get their own color, values above 2048 share one dark color.
 */
Color tile_color(int value);
/**
 * Text color used for a tile value so that the number stays readable on top
 * of `tile_color(value)`.
 */
Color tile_text_color(int value);
