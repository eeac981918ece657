#include <cstdio>
#include <cstring>

#include "common_transitions.hpp"
#include "../common/constants.hpp"
#include "../common/user_interface.hpp"

#define BANNER_HEIGHT 140
#define BANNER_RADIUS 12

static void draw_banner(Display *display, const char *title,
                        const char *subtitle, const char *hint,
                        Color accent_color)
{
        int width = display->get_width();
        int height = display->get_height();

        int banner_width = width - 2 * (SCREEN_BORDER_WIDTH + 2 * FONT_WIDTH);
        Point banner_start = {.x = (width - banner_width) / 2,
                              .y = (height - BANNER_HEIGHT) / 2};

        display->draw_rounded_rectangle(banner_start, banner_width,
                                        BANNER_HEIGHT, BANNER_RADIUS,
                                        PageBackground);
        display->draw_rectangle(banner_start, banner_width, BANNER_HEIGHT,
                                accent_color, 2, false);

        int y = banner_start.y + FONT_SIZE / 2;
        Point title_position = {
            .x = get_centering_margin(width, LARGE_FONT_WIDTH, strlen(title)),
            .y = y};
        display->draw_string(title_position, title, Size32, PageBackground,
                             accent_color);

        y += LARGE_FONT_SIZE + FONT_SIZE / 2;
        Point subtitle_position = {
            .x = get_centering_margin(width, FONT_WIDTH, strlen(subtitle)),
            .y = y};
        display->draw_string(subtitle_position, subtitle, Size16,
                             PageBackground, DarkText);

        y += 2 * FONT_SIZE;
        Point hint_position = {
            .x = get_centering_margin(width, FONT_WIDTH, strlen(hint)),
            .y = y};
        display->draw_string(hint_position, hint, Size16, PageBackground,
                             DarkText);
}

void display_game_over(Display *display,
                       UserInterfaceCustomization *customization, int score)
{
        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_border(Red);
        }

        char subtitle[32];
        snprintf(subtitle, sizeof(subtitle), "Final score: %d", score);

        const char *hint = customization->show_help_text
                               ? "Move to play again, Esc to exit."
                               : "";
        draw_banner(display, "Game Over", subtitle, hint, Red);
}

void display_game_won(Display *display,
                      UserInterfaceCustomization *customization,
                      int target_tile)
{
        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_border(Green);
        }

        char subtitle[32];
        snprintf(subtitle, sizeof(subtitle), "You reached %d!", target_tile);

        const char *hint = customization->show_help_text
                               ? "Move to keep going, Esc to exit."
                               : "";
        draw_banner(display, "You Won!", subtitle, hint, Green);
}

std::optional<UserAction>
pause_until_input(std::vector<DirectionalController *> *controllers,
                  std::vector<ActionController *> *action_controllers,
                  std::optional<Direction> *direction,
                  std::optional<Action> *action, DelayProvider *delay_provider,
                  Display *display)
{
        Direction dir;
        Action act;
        // A key still held from the previous screen must not count as input.
        while (poll_directional_input(controllers, &dir) ||
               poll_action_input(action_controllers, &act)) {
                delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
        while (true) {
                if (poll_directional_input(controllers, &dir)) {
                        *direction = dir;
                        break;
                }
                if (poll_action_input(action_controllers, &act)) {
                        *action = act;
                        break;
                }
                delay_provider->delay_ms(INPUT_POLLING_DELAY);
                // Refreshing also pumps the window events, so closing the
                // window is noticed even while we wait for input.
                if (!display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
        // Let go of the key before the next screen starts polling.
        delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
        return std::nullopt;
}
