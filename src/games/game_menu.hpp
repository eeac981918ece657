#pragma once
#include "../common/platform/interface/platform.hpp"
#include "../common/user_interface.hpp"
#include <optional>

typedef enum Game : int {
        Unknown = 0,
        MainMenu = 1,
        Clean2048 = 2,
        AchievementGallery = 3,
        Settings = 4,
} Game;

typedef struct GameMenuConfiguration {
        Game game;
        Color accent_color;
        UserInterfaceRenderingMode rendering_mode;
        // Stored as a byte, 0 or 1.
        unsigned char show_help_text;
} GameMenuConfiguration;

extern const GameMenuConfiguration DEFAULT_MENU_CONFIGURATION;

extern Game game_from_string(const char *name);

extern const char *game_to_string(Game game);

bool is_valid_game(Game game);

/**
 * Shows the main menu and runs the screen the user picked. Returns
 * `UserAction::CloseWindow` if the user closed the window, in which case the
 * entrypoint is expected to shut down.
 */
std::optional<UserAction> select_game(Platform *p);

/**
 * Lets the user pick the screen to launch together with the look and feel of
 * the UI. The choice is saved as the default for the next launch.
 */
std::optional<UserAction>
collect_game_menu_config(Platform *p, GameMenuConfiguration *configuration);

GameMenuConfiguration load_initial_menu_configuration(PersistentStorage *storage);
