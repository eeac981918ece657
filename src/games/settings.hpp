#pragma once
#include "game_executor.hpp"
#include "common_transitions.hpp"
#include "game_menu.hpp"

/**
 * The persistent storage holds, one after another: the main menu
 * configuration, the 2048 configuration, the saved 2048 game and the
 * unlocked achievements.
 */
std::vector<int> get_settings_storage_offsets();
int get_settings_storage_offset(Game game);
int get_save_state_storage_offset();
int get_achievements_storage_offset();

/**
 * This 'game' is a settings menu responsible for setting the default values of
 * the config options. It first lets the user choose what they want to modify
 * and then renders the corresponding configuration menu using the same UI as
 * the one shown before starting the game. The chosen settings are saved in
 * the persistent storage and used as the default values in the future.
 *
 * It also allows for resetting the best score of the 2048 game.
 */
class Settings : public GameExecutor
{
      public:
        virtual std::optional<UserAction>
        game_loop(Platform *p,
                  UserInterfaceCustomization *customization) override;
};
