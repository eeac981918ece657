#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/display.hpp"
#include "../common/platform/interface/controller.hpp"
#include "../common/platform/interface/delay.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../common/user_interface_customization.hpp"

/**
 * Draws a banner over the middle of the screen informing the user that the
 * game is over. The board behind it is left as it was so that the user can
 * still see the final position.
 */
void display_game_over(Display *display,
                       UserInterfaceCustomization *customization, int score);
/**
 * Same as `display_game_over` but celebrates reaching the target tile. The
 * game can be continued after that.
 */
void display_game_won(Display *display,
                      UserInterfaceCustomization *customization,
                      int target_tile);

/**
 * Blocks until the user enters a direction or presses any of the action
 * keys. Whichever of the two was entered is written into the output
 * parameters, the caller can tell them apart by resetting them beforehand
 * and checking which one changed. Inputs that are already held when the
 * pause starts are ignored until released.
 */
std::optional<UserAction>
pause_until_input(std::vector<DirectionalController *> *controllers,
                  std::vector<ActionController *> *action_controllers,
                  std::optional<Direction> *direction,
                  std::optional<Action> *action, DelayProvider *delay_provider,
                  Display *display);
