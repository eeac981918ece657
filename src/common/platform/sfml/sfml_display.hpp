#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include <string>

#include "../interface/display.hpp"

/**
 * Desktop display backed by SFML. Everything is drawn into a RenderTexture
 * that keeps its contents between frames, `refresh` copies it into the
 * window. This gives us the retained drawing model the games are written
 * against.
 */
class SfmlDisplay : public Display
{
      public:
        SfmlDisplay(sf::RenderWindow *window, sf::RenderTexture *texture,
                    std::string font_path)
            : window(window), texture(texture), font_path(font_path)
        {
        }

        void setup() override;
        void initialize() override;
        void clear(Color color) override;
        void draw_rounded_border(Color color) override;
        void draw_circle(Point center, int radius, Color color,
                         int border_width, bool filled) override;
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override;
        void draw_rounded_rectangle(Point start, int width, int height,
                                    int radius, Color color) override;
        void draw_string(Point start, const char *string_buffer,
                         FontSize font_size, Color bg_color,
                         Color fg_color) override;
        void clear_region(Point top_left, Point bottom_right,
                          Color clear_color) override;
        int get_height() override;
        int get_width() override;
        int get_display_corner_radius() override;
        bool refresh() override;

      private:
        sf::RenderWindow *window;
        sf::RenderTexture *texture;
        std::string font_path;
        std::optional<sf::Font> font;

        void draw_shape(const sf::Shape &shape);
};

/**
 * The games use RGB565 colors, whereas SFML uses RGB888 with the additional
 * opacity channel. This scales each channel and sets the opacity to 255.
 */
sf::Color map_to_sf_color(Color color);

/**
 * Builds an outline of a rectangle with rounded corners. Each corner is
 * approximated with a few points of an arc.
 */
sf::ConvexShape make_rounded_rectangle(Point start, int width, int height,
                                       int radius);
