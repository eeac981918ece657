#include <cstring>
#include <optional>

#include "game_menu.hpp"
#include "../common/configuration.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include "../common/platform/interface/color.hpp"
#include "2048.hpp"
#include "achievement_gallery.hpp"
#include "game_executor.hpp"
#include "settings.hpp"

#define TAG "game_menu"

const GameMenuConfiguration DEFAULT_MENU_CONFIGURATION = {
    .game = Clean2048,
    .accent_color = ButtonBrown,
    .rendering_mode = Detailed,
    .show_help_text = true,
};

GameMenuConfiguration load_initial_menu_configuration(PersistentStorage *storage)
{
        int storage_offset = get_settings_storage_offset(MainMenu);

        GameMenuConfiguration configuration;
        LOG_DEBUG(TAG,
                  "Trying to load initial settings from the persistent storage "
                  "at offset %d",
                  storage_offset);
        bool loaded = storage->get(storage_offset, configuration);

        if (!loaded || !is_valid_game(configuration.game) ||
            configuration.game == MainMenu ||
            configuration.show_help_text > 1) {
                LOG_DEBUG(TAG, "The storage does not contain a valid "
                               "game menu configuration, using default values.");
                storage->put(storage_offset, DEFAULT_MENU_CONFIGURATION);
                return DEFAULT_MENU_CONFIGURATION;
        }

        LOG_DEBUG(TAG,
                  "Loaded menu configuration: game=%d, accent_color=%d, "
                  "show_help_text=%d",
                  configuration.game, configuration.accent_color,
                  configuration.show_help_text);
        return configuration;
}

static Configuration *
assemble_menu_selection_configuration(GameMenuConfiguration *initial_config)
{
        auto *game = ConfigurationOption::of_strings(
            "Play",
            {game_to_string(Clean2048), game_to_string(AchievementGallery),
             game_to_string(Settings)},
            game_to_string(initial_config->game));

        auto *accent_color = ConfigurationOption::of_colors(
            "Color", AVAILABLE_COLORS, initial_config->accent_color);

        auto *rendering_mode = ConfigurationOption::of_strings(
            "UI",
            {rendering_mode_to_str(Minimalistic),
             rendering_mode_to_str(Detailed)},
            rendering_mode_to_str(initial_config->rendering_mode));

        auto *show_help_text = ConfigurationOption::of_strings(
            "Hints", {"Yes", "No"},
            map_boolean_to_yes_or_no(initial_config->show_help_text));

        return new Configuration(
            "2048", {game, accent_color, rendering_mode, show_help_text},
            "Go");
}

static void extract_menu_config(GameMenuConfiguration *menu_configuration,
                                Configuration *config)
{
        ConfigurationOption *game_option = config->options[0];
        ConfigurationOption *accent_color = config->options[1];
        ConfigurationOption *rendering_mode = config->options[2];
        ConfigurationOption *show_help_text = config->options[3];

        menu_configuration->game =
            game_from_string(game_option->get_current_str_value());
        menu_configuration->accent_color =
            accent_color->get_current_color_value();
        menu_configuration->rendering_mode =
            rendering_mode_from_str(rendering_mode->get_current_str_value());
        menu_configuration->show_help_text =
            extract_yes_or_no_option(show_help_text->get_current_str_value());
}

std::optional<UserAction>
collect_game_menu_config(Platform *p, GameMenuConfiguration *configuration)
{
        GameMenuConfiguration initial_config =
            load_initial_menu_configuration(p->persistent_storage);

        Configuration *config =
            assemble_menu_selection_configuration(&initial_config);

        UserInterfaceCustomization customization = {
            .accent_color = initial_config.accent_color,
            .rendering_mode = initial_config.rendering_mode,
            .show_help_text = initial_config.show_help_text != 0,
        };

        auto maybe_interrupt =
            collect_configuration(p, config, &customization, false);
        if (maybe_interrupt) {
                // The help screen needs to know how to render itself.
                *configuration = initial_config;
                free_configuration(config);
                return maybe_interrupt;
        }

        extract_menu_config(configuration, config);
        free_configuration(config);

        p->persistent_storage->put(get_settings_storage_offset(MainMenu),
                                   *configuration);
        return std::nullopt;
}

std::optional<UserAction> select_game(Platform *p)
{
        GameMenuConfiguration config;

        auto maybe_interrupt = collect_game_menu_config(p, &config);

        UserInterfaceCustomization customization = {
            config.accent_color, config.rendering_mode,
            config.show_help_text != 0};

        if (maybe_interrupt.has_value()) {
                if (maybe_interrupt.value() == UserAction::ShowHelp) {
                        const char *help_text =
                            "Use Up/Down to switch between menu options and "
                            "Left/Right to change the value of the current "
                            "option. Press Enter to open the selected screen.";
                        render_wrapped_help_text(p, &customization, help_text);
                        return wait_until_confirm_pressed(p);
                }
                return maybe_interrupt;
        }

        LOG_INFO(TAG, "User selected: %s.", game_to_string(config.game));

        GameExecutor *executor = [&]() -> GameExecutor * {
                switch (config.game) {
                case Clean2048:
                        return new class Clean2048();
                case AchievementGallery:
                        return new class AchievementGallery();
                case Settings:
                        return new class Settings();
                default:
                        return nullptr;
                }
        }();

        if (!executor) {
                LOG_WARN(TAG, "Selected screen %d is not available.",
                         config.game);
                return std::nullopt;
        }

        auto action = executor->game_loop(p, &customization);
        delete executor;
        return action;
}

Game game_from_string(const char *name)
{
        if (strcmp(name, game_to_string(Clean2048)) == 0)
                return Game::Clean2048;
        if (strcmp(name, game_to_string(AchievementGallery)) == 0)
                return Game::AchievementGallery;
        if (strcmp(name, game_to_string(MainMenu)) == 0)
                return Game::MainMenu;
        if (strcmp(name, game_to_string(Settings)) == 0)
                return Game::Settings;
        return Game::Unknown;
}

bool is_valid_game(Game game)
{
        switch (game) {
        case MainMenu:
        case Clean2048:
        case AchievementGallery:
        case Settings:
                return true;
        default:
                return false;
        }
}

const char *game_to_string(Game game)
{
        switch (game) {
        case MainMenu:
                return "Main Menu";
        case Clean2048:
                return "2048";
        case AchievementGallery:
                return "Achievements";
        case Settings:
                return "Settings";
        default:
                return "Unknown";
        }
}
