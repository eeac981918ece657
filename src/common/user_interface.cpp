#include <cstdio>
#include <cstring>
#include <sstream>

#include "user_interface.hpp"
#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "platform/interface/color.hpp"
#include "platform/interface/display.hpp"

#define TAG "user_interface"

#define SELECTOR_CIRCLE_RADIUS 5
#define CONFIG_BAR_GAP (FONT_SIZE / 2)
#define HEADING_AREA_HEIGHT (HEADING_FONT_SIZE * 3)

const char *rendering_mode_to_str(UserInterfaceRenderingMode mode)
{
        switch (mode) {
        case Minimalistic:
                return "Minimal";
        case Detailed:
                return "Detailed";
        default:
                return "Unknown";
        }
}

UserInterfaceRenderingMode rendering_mode_from_str(const char *mode_str)
{
        if (strcmp(mode_str, rendering_mode_to_str(Detailed)) == 0) {
                return Detailed;
        }
        return Minimalistic;
}

int get_centering_margin(int screen_width, int font_width, int text_length)
{
        return (screen_width - font_width * text_length) / 2;
}

/**
 * Vertical position of the text of the i-th bar of the configuration menu.
 * The bar with index `options_len` is the confirmation bar. The bars are
 * centered in the space left below the heading.
 */
static int config_bar_text_y(Display *display, Configuration *config,
                             int index)
{
        int bar_count = config->options_len() + 1;
        int bar_height = 2 * FONT_SIZE;
        int total_height =
            bar_count * bar_height + (bar_count - 1) * CONFIG_BAR_GAP;
        // Space at the bottom is reserved for the controls explanation.
        int available = display->get_height() - HEADING_AREA_HEIGHT -
                        3 * FONT_SIZE;
        int top = HEADING_AREA_HEIGHT + (available - total_height) / 2;
        return top + index * (bar_height + CONFIG_BAR_GAP) + FONT_SIZE / 2;
}

/**
 * Renders a centered configuration bar: the option name on the left and a
 * white value cell with the current value on the right.
 *   _____________________________________________
 *  /                     _______________________ \
 * |     Option text     |       Value cell      | |
 *  \                     ----------------------- /
 *   ---------------------------------------------
 * Unless `is_already_rendered` is false only the value cell gets redrawn.
 */
static void render_config_bar_centered(
    Display *display, int y_start, int option_text_max_len,
    int value_text_max_len, const char *option_text, const char *value_text,
    bool is_already_rendered, UserInterfaceCustomization *customization)
{
        // Two spaces separate the longest option name from the value cell.
        int option_value_gap_len = 2;
        int text_len =
            option_text_max_len + option_value_gap_len + value_text_max_len;

        int fw = FONT_WIDTH;
        int fh = FONT_SIZE;
        int left_margin =
            get_centering_margin(display->get_width(), fw, text_len);

        int h_padding = fw / 2;
        int v_padding = fh / 2;
        Point bar_start = {.x = left_margin - h_padding,
                           .y = y_start - v_padding};
        int bar_width = text_len * fw + 2 * h_padding;

        int value_cell_x =
            left_margin + (option_text_max_len + option_value_gap_len / 2) * fw;
        int value_cell_v_padding = fh / 4;
        Point value_cell_start = {.x = value_cell_x,
                                  .y = y_start - value_cell_v_padding};
        int value_cell_width = value_text_max_len * fw + 2 * h_padding;
        int value_cell_height = fh + v_padding;

        Color accent_color = customization->accent_color;

        if (!is_already_rendered) {
                Point name_start = {.x = left_margin, .y = y_start};
                if (customization->rendering_mode == Detailed) {
                        display->draw_rounded_rectangle(
                            bar_start, bar_width, fh * 2, fh, accent_color);
                        display->draw_string(
                            name_start, option_text, Size16, accent_color,
                            get_good_contrast_text_color(accent_color));
                } else {
                        display->draw_rectangle(bar_start, bar_width, fh * 2,
                                                accent_color, 1, false);
                        display->draw_string(name_start, option_text, Size16,
                                             Black, White);
                }
        }

        Point value_text_start = {.x = value_cell_start.x + h_padding,
                                  .y = value_cell_start.y +
                                       value_cell_v_padding};
        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_rectangle(
                    value_cell_start, value_cell_width, value_cell_height,
                    value_cell_height / 2, White);
                display->draw_string(value_text_start, value_text, Size16,
                                     White, Black);
        } else {
                // The old value needs to be erased before drawing the
                // outline on top of it.
                display->draw_rectangle(value_cell_start, value_cell_width,
                                        value_cell_height, Black, 0, true);
                display->draw_rectangle(value_cell_start, value_cell_width,
                                        value_cell_height, accent_color, 1,
                                        false);
                display->draw_string(value_text_start, value_text, Size16,
                                     Black, White);
        }
}

/**
 * Same as `render_config_bar_centered` but for bars without a value cell
 * (the confirmation bar at the bottom of the menu).
 */
static void render_text_bar_centered(Display *display, int y_start,
                                     int bar_text_len, const char *text,
                                     UserInterfaceCustomization *customization)
{
        int fw = FONT_WIDTH;
        int fh = FONT_SIZE;
        int left_margin =
            get_centering_margin(display->get_width(), fw, bar_text_len);
        int text_x = get_centering_margin(display->get_width(), fw,
                                          strlen(text));

        int h_padding = fw / 2;
        int v_padding = fh / 2;
        Point bar_start = {.x = left_margin - h_padding,
                           .y = y_start - v_padding};
        int bar_width = bar_text_len * fw + 2 * h_padding;
        Point text_start = {.x = text_x, .y = y_start};

        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_rectangle(bar_start, bar_width, fh * 2,
                                                fh, ButtonBrown);
                display->draw_string(text_start, text, Size16, ButtonBrown,
                                     LightText);
        } else {
                display->draw_rectangle(bar_start, bar_width, fh * 2,
                                        ButtonBrown, 1, false);
                display->draw_string(text_start, text, Size16, Black, White);
        }
}

/**
 * Moves the circle that marks the currently edited option. The old circle is
 * erased by drawing over it with the background color.
 */
static void render_circle_selector(Display *display, int x_axis, int prev_y,
                                   int curr_y, Color circle_color)
{
        display->draw_circle({.x = x_axis, .y = prev_y},
                             SELECTOR_CIRCLE_RADIUS, Black, 0, true);
        display->draw_circle({.x = x_axis, .y = curr_y},
                             SELECTOR_CIRCLE_RADIUS, circle_color, 0, true);
}

void render_config_menu(Display *display, Configuration *config,
                        ConfigurationDiff *diff, bool text_update_only,
                        UserInterfaceCustomization *customization)
{
        int name_max_len = find_max_config_option_name_text_length(config);
        int value_max_len = find_max_config_option_value_text_length(config);
        int bar_text_len = name_max_len + 2 + value_max_len;

        if (!text_update_only) {
                display->initialize();
                display->clear(Black);
                if (customization->rendering_mode == Detailed) {
                        display->draw_rounded_border(
                            customization->accent_color);
                }

                int heading_x = get_centering_margin(
                    display->get_width(), HEADING_FONT_WIDTH,
                    strlen(config->name));
                display->draw_string({.x = heading_x, .y = HEADING_FONT_SIZE},
                                     config->name, Size24, Black, White);
        }

        char value_buffer[16];
        for (int i = 0; i < config->options_len(); i++) {
                bool modified = false;
                for (int modified_idx : diff->modified_options) {
                        modified |= modified_idx == i;
                }
                if (text_update_only && !modified) {
                        continue;
                }
                ConfigurationOption *option = config->options[i];
                render_config_bar_centered(
                    display, config_bar_text_y(display, config, i),
                    name_max_len, value_max_len, option->name,
                    option->format_current_value(value_buffer,
                                                 sizeof(value_buffer)),
                    text_update_only, customization);
        }

        if (!text_update_only) {
                render_text_bar_centered(
                    display,
                    config_bar_text_y(display, config, config->options_len()),
                    bar_text_len, config->confirmation_cell_text,
                    customization);
        }

        int selector_x =
            get_centering_margin(display->get_width(), FONT_WIDTH,
                                 bar_text_len) -
            FONT_WIDTH - 2 * SELECTOR_CIRCLE_RADIUS;
        int circle_offset = FONT_SIZE / 2;
        render_circle_selector(
            display, selector_x,
            config_bar_text_y(display, config,
                              diff->previously_edited_option) +
                circle_offset,
            config_bar_text_y(display, config, diff->currently_edited_option) +
                circle_offset,
            customization->accent_color);
}

void render_controls_explanations(Display *display)
{
        const char *lines[] = {"Arrows: edit  Enter: ok",
                               "Esc: back  F1: help"};
        int line_count = sizeof(lines) / sizeof(lines[0]);
        int y = display->get_height() - (line_count + 1) * FONT_SIZE;
        for (int i = 0; i < line_count; i++) {
                int x = get_centering_margin(display->get_width(), FONT_WIDTH,
                                             strlen(lines[i]));
                display->draw_string({.x = x, .y = y + i * FONT_SIZE},
                                     lines[i], Size16, Black, Gray);
        }
}

std::vector<std::string> wrap_text(const char *text, int max_line_len)
{
        std::vector<std::string> lines;
        std::istringstream words(text);
        std::string word;
        std::string line;

        while (words >> word) {
                if (line.empty()) {
                        line = word;
                } else if ((int)(line.size() + 1 + word.size()) <=
                           max_line_len) {
                        line += " " + word;
                } else {
                        lines.push_back(line);
                        line = word;
                }
        }
        if (!line.empty()) {
                lines.push_back(line);
        }
        return lines;
}

int render_wrapped_text(Display *display, const char *text, int y_start,
                        Color text_color, Color bg_color)
{
        int margin = 2 * FONT_WIDTH;
        int max_line_len = (display->get_width() - 2 * margin) / FONT_WIDTH;

        int y = y_start;
        for (const std::string &line : wrap_text(text, max_line_len)) {
                display->draw_string({.x = margin, .y = y}, line.c_str(),
                                     Size16, bg_color, text_color);
                y += FONT_SIZE + FONT_SIZE / 4;
        }
        return y;
}

void render_wrapped_help_text(Platform *p,
                              UserInterfaceCustomization *customization,
                              const char *help_text)
{
        Display *display = p->display;
        display->initialize();
        display->clear(Black);
        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_border(customization->accent_color);
        }

        const char *heading = "Help";
        int heading_x = get_centering_margin(
            display->get_width(), HEADING_FONT_WIDTH, strlen(heading));
        display->draw_string({.x = heading_x, .y = HEADING_FONT_SIZE},
                             heading, Size24, Black, White);

        render_wrapped_text(display, help_text, HEADING_AREA_HEIGHT);

        const char *hint = "Press Enter to go back.";
        int hint_x = get_centering_margin(display->get_width(), FONT_WIDTH,
                                          strlen(hint));
        display->draw_string({.x = hint_x,
                              .y = display->get_height() - 2 * FONT_SIZE},
                             hint, Size16, Black, customization->accent_color);
        display->refresh();
}

std::optional<UserAction> wait_until_confirm_pressed(Platform *p)
{
        Action act;
        while (!poll_action_input(p->action_controllers, &act) ||
               act != CONFIRM) {
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
        return std::nullopt;
}
