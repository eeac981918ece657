#include <algorithm>
#include <cmath>
#include <cstdint>

#include "sfml_display.hpp"
#include "../../constants.hpp"
#include "../../logging.hpp"

#define TAG "sfml_display"

#define CORNER_POINTS 8

void SfmlDisplay::setup()
{
        sf::Font loaded;
        if (!loaded.openFromFile(font_path)) {
                LOG_ERROR(TAG, "Unable to load the font from %s, text will "
                               "not be rendered.",
                          font_path.c_str());
                return;
        }
        font = std::move(loaded);
        LOG_DEBUG(TAG, "Loaded font %s", font_path.c_str());
}

void SfmlDisplay::initialize() {}

void SfmlDisplay::clear(Color color)
{
        texture->clear(map_to_sf_color(color));
        texture->display();
}

void SfmlDisplay::draw_shape(const sf::Shape &shape)
{
        texture->draw(shape);
        texture->display();
}

void SfmlDisplay::draw_rounded_border(Color color)
{
        int margin = SCREEN_BORDER_WIDTH;
        int line_width = 3;
        sf::ConvexShape border = make_rounded_rectangle(
            {.x = margin, .y = margin}, get_width() - 2 * margin,
            get_height() - 2 * margin, get_display_corner_radius());
        border.setFillColor(sf::Color::Transparent);
        border.setOutlineColor(map_to_sf_color(color));
        // Negative thickness keeps the outline inside of the shape.
        border.setOutlineThickness(-line_width);
        draw_shape(border);
}

void SfmlDisplay::draw_circle(Point center, int radius, Color color,
                              int border_width, bool filled)
{
        sf::CircleShape circle(radius);
        circle.setPosition(
            {(float)(center.x - radius), (float)(center.y - radius)});

        if (filled) {
                circle.setFillColor(map_to_sf_color(color));
        } else {
                circle.setFillColor(sf::Color::Transparent);
        }

        circle.setOutlineColor(map_to_sf_color(color));
        circle.setOutlineThickness(border_width);
        draw_shape(circle);
}

void SfmlDisplay::draw_rectangle(Point start, int width, int height,
                                 Color color, int border_width, bool filled)
{
        sf::RectangleShape rectangle({(float)width, (float)height});
        rectangle.setPosition({(float)start.x, (float)start.y});
        if (filled) {
                rectangle.setFillColor(map_to_sf_color(color));
        } else {
                rectangle.setFillColor(sf::Color::Transparent);
        }
        rectangle.setOutlineColor(map_to_sf_color(color));
        rectangle.setOutlineThickness(border_width);
        draw_shape(rectangle);
}

void SfmlDisplay::draw_rounded_rectangle(Point start, int width, int height,
                                         int radius, Color color)
{
        sf::ConvexShape rectangle =
            make_rounded_rectangle(start, width, height, radius);
        rectangle.setFillColor(map_to_sf_color(color));
        draw_shape(rectangle);
}

void SfmlDisplay::draw_string(Point start, const char *string_buffer,
                              FontSize font_size, Color bg_color,
                              Color fg_color)
{
        if (!font) {
                return;
        }
        sf::Text text(*font, string_buffer, font_size);

        text.setFillColor(map_to_sf_color(fg_color));
        text.setPosition({(float)start.x, (float)start.y});
        texture->draw(text);
        texture->display();
}

void SfmlDisplay::clear_region(Point top_left, Point bottom_right,
                               Color clear_color)
{
        draw_rectangle(top_left, bottom_right.x - top_left.x,
                       bottom_right.y - top_left.y, clear_color, 0, true);
}

int SfmlDisplay::get_height() { return DISPLAY_HEIGHT; }

int SfmlDisplay::get_width() { return DISPLAY_WIDTH; }

int SfmlDisplay::get_display_corner_radius() { return DISPLAY_CORNER_RADIUS; }

bool SfmlDisplay::refresh()
{
        /* We need this polling when refreshing the display. Without it, linux
        desktop environments (e.g. gnome) think that the game window is not
        responsive and try to get us to force-close it. */
        while (const std::optional event = window->pollEvent()) {
                if (event->is<sf::Event::Closed>()) {
                        window->close();
                        return false;
                }
        }

        window->clear();
        sf::Sprite sprite(texture->getTexture());
        window->draw(sprite);
        window->display();
        return true;
}

sf::Color map_to_sf_color(Color color)
{
        int bitmask_5 = 0b11111;
        int bitmask_6 = 0b111111;

        int original_blue = color & bitmask_5;
        int original_green = (color >> 5) & bitmask_6;
        int original_red = (color >> 11);

        auto red = (std::uint8_t)((float)original_red / bitmask_5 * 255);
        auto green = (std::uint8_t)((float)original_green / bitmask_6 * 255);
        auto blue = (std::uint8_t)((float)original_blue / bitmask_5 * 255);

        return sf::Color(red, green, blue);
}

sf::ConvexShape make_rounded_rectangle(Point start, int width, int height,
                                       int radius)
{
        const float pi = 3.14159265f;
        radius = std::min(radius, std::min(width, height) / 2);

        // Corner centers in clockwise order starting from the top right, each
        // paired with the angle at which its arc begins.
        float centers[4][3] = {
            {(float)(start.x + width - radius), (float)(start.y + radius),
             -pi / 2},
            {(float)(start.x + width - radius),
             (float)(start.y + height - radius), 0},
            {(float)(start.x + radius), (float)(start.y + height - radius),
             pi / 2},
            {(float)(start.x + radius), (float)(start.y + radius), pi},
        };

        sf::ConvexShape shape(4 * CORNER_POINTS);
        for (int corner = 0; corner < 4; corner++) {
                for (int i = 0; i < CORNER_POINTS; i++) {
                        float angle = centers[corner][2] +
                                      (pi / 2) * i / (CORNER_POINTS - 1);
                        shape.setPoint(
                            corner * CORNER_POINTS + i,
                            {centers[corner][0] + radius * std::cos(angle),
                             centers[corner][1] + radius * std::sin(angle)});
                }
        }
        return shape;
}
