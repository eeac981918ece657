#pragma once
#include "../../point.hpp"
#include "../../font_size.hpp"
#include "color.hpp"

/*
 * @brief Display interface that needs to be implemented by the classes used
 * for drawing the games.
 *
 * The display is retained: whatever is drawn stays on screen until something
 * else is drawn on top of it. Games are expected to only redraw the regions
 * that changed.
 */
class Display
{
      public:
        virtual ~Display() = default;
        /**
         * One-off setup of the display backend (loading fonts, creating the
         * backing texture). Must be called once before anything is drawn.
         */
        virtual void setup() = 0;
        /**
         * Prepares the display for a new screen, e.g. drops any state left
         * over from the previously rendered screen.
         */
        virtual void initialize() = 0;
        /**
         * Clears the display by redrawing the entire screen with the
         * specified color.
         */
        virtual void clear(Color color) = 0;
        /**
         * Draws a rounded border encircling the whole screen. Used to signal
         * state changes (red border on game over, green border on win) in the
         * `Detailed` rendering mode.
         */
        virtual void draw_rounded_border(Color color) = 0;
        /**
         * Draws a circle with specified color, border width and fill.
         */
        virtual void draw_circle(Point center, int radius, Color color,
                                 int border_width, bool filled) = 0;
        /**
         * Draws a rectangle with specified color, border width and fill.
         */
        virtual void draw_rectangle(Point start, int width, int height,
                                    Color color, int border_width,
                                    bool filled) = 0;
        /**
         * Draws a filled rounded rectangle, this is what the tiles and the
         * score boxes are made of.
         */
        virtual void draw_rounded_rectangle(Point start, int width, int height,
                                            int radius, Color color) = 0;
        /**
         * Prints a string on the display, allows for specifying the font size,
         * color and background color.
         */
        virtual void draw_string(Point start, const char *string_buffer,
                                 FontSize font_size, Color bg_color,
                                 Color fg_color) = 0;
        /**
         * Clears a rectangular region of the display by redrawing it with
         * the specified color.
         */
        virtual void clear_region(Point top_left, Point bottom_right,
                                  Color clear_color) = 0;

        virtual int get_height() = 0;

        virtual int get_width() = 0;

        /**
         * For displays with rounded corners it returns the radius in pixels.
         */
        virtual int get_display_corner_radius() = 0;

        /**
         * Pushes the drawn contents to the screen. Returns false if the user
         * requested to close the window in the meantime, in which case the
         * caller is expected to unwind back to the entrypoint.
         */
        virtual bool refresh() = 0;
};
