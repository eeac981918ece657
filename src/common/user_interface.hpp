#pragma once

#include <optional>
#include <string>
#include <vector>

#include "user_interface_customization.hpp"
#include "configuration.hpp"
#include "platform/interface/display.hpp"

void render_config_menu(Display *display, Configuration *config,
                        ConfigurationDiff *diff, bool text_update_only,
                        UserInterfaceCustomization *customization);

void render_controls_explanations(Display *display);

/**
 * Renders a full screen of help text with a 'Help' heading and a hint to
 * press Enter to go back.
 */
void render_wrapped_help_text(Platform *p,
                              UserInterfaceCustomization *customization,
                              const char *help_text);
/**
 * Renders the text word-wrapped to the width of the display, starting at
 * `y_start`. Returns the y coordinate right below the last line.
 */
int render_wrapped_text(Display *display, const char *text, int y_start,
                        Color text_color = White, Color bg_color = Black);

/**
 * Splits the text into lines of at most `max_line_len` characters, breaking
 * only at spaces. Words longer than a line are put on a line of their own.
 */
std::vector<std::string> wrap_text(const char *text, int max_line_len);

/**
 * Blocks until the user presses Confirm. Returns `UserAction::CloseWindow`
 * if the window got closed while waiting.
 */
std::optional<UserAction> wait_until_confirm_pressed(Platform *p);

int get_centering_margin(int screen_width, int font_width, int text_length);
