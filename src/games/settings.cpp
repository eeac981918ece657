#include <cstring>

#include "2048.hpp"
#include "2048_save_state.hpp"
#include "2048_session.hpp"
#include "achievements.hpp"
#include "game_menu.hpp"
#include "../common/configuration.hpp"
#include "../common/logging.hpp"
#include "../common/user_interface.hpp"
#include "settings.hpp"

#define TAG "settings"

#define BEST_SCORE_SETTING "Best score"

static Configuration *assemble_settings_menu_configuration();
static const char *extract_menu_setting(Configuration *config);
static std::optional<UserAction>
reset_best_score_screen(Platform *p, UserInterfaceCustomization *custom);

static bool is_interrupting(const std::optional<UserAction> &action)
{
        return action && (action.value() == UserAction::Exit ||
                          action.value() == UserAction::CloseWindow);
}

std::optional<UserAction>
Settings::game_loop(Platform *p, UserInterfaceCustomization *custom)
{
        // We loop until the user presses Escape on any of the configuration
        // screens.
        while (true) {
                Configuration *settings_config =
                    assemble_settings_menu_configuration();
                auto maybe_interrupt =
                    collect_configuration(p, settings_config, custom);
                if (maybe_interrupt) {
                        free_configuration(settings_config);
                        if (maybe_interrupt.value() == UserAction::Exit) {
                                return std::nullopt;
                        }
                        if (maybe_interrupt.value() == UserAction::ShowHelp) {
                                render_wrapped_help_text(
                                    p, custom,
                                    "Pick what you want to modify and press "
                                    "Enter. Press Escape to go back to the "
                                    "main menu.");
                                auto closed = wait_until_confirm_pressed(p);
                                if (closed) {
                                        return closed;
                                }
                                continue;
                        }
                        return maybe_interrupt;
                }

                const char *selected = extract_menu_setting(settings_config);
                free_configuration(settings_config);

                if (strcmp(selected, BEST_SCORE_SETTING) == 0) {
                        auto action = reset_best_score_screen(p, custom);
                        if (action && action.value() == UserAction::CloseWindow) {
                                return action;
                        }
                        continue;
                }

                Game selected_game = game_from_string(selected);
                int offset = get_settings_storage_offset(selected_game);
                LOG_DEBUG(
                    TAG,
                    "Computed configuration storage offset for game %s: %d",
                    game_to_string(selected_game), offset);

                PersistentStorage *storage = p->persistent_storage;

                switch (selected_game) {
                case Game::MainMenu: {
                        GameMenuConfiguration config;
                        auto action = collect_game_menu_config(p, &config);
                        if (action &&
                            action.value() == UserAction::CloseWindow) {
                                return action;
                        }
                } break;
                case Game::Clean2048: {
                        Game2048Configuration config;
                        auto action = collect_2048_config(p, &config, custom);
                        if (is_interrupting(action)) {
                                if (action.value() == UserAction::CloseWindow)
                                        return action;
                                continue;
                        }
                        if (!action) {
                                storage->put(offset, config);
                        }
                } break;
                default:
                        return std::nullopt;
                }
                LOG_DEBUG(TAG, "Re-entering the settings collecting loop.");
        }
}

static std::optional<UserAction>
reset_best_score_screen(Platform *p, UserInterfaceCustomization *custom)
{
        auto *confirm = ConfigurationOption::of_strings("Reset", {"No", "Yes"},
                                                        "No");
        Configuration *config =
            new Configuration("Best score", {confirm}, "Apply");

        auto maybe_interrupt = collect_configuration(p, config, custom);
        bool reset_requested =
            !maybe_interrupt &&
            extract_yes_or_no_option(config->options[0]->get_current_str_value());
        free_configuration(config);

        if (maybe_interrupt) {
                return maybe_interrupt;
        }
        if (!reset_requested) {
                return std::nullopt;
        }

        PersistentSaveStateStore store(p->persistent_storage,
                                       get_save_state_storage_offset());
        // The seed does not matter, the session is only used to rewrite the
        // saved record.
        Game2048Session session(&store, nullptr, nullptr, 0);
        session.start();
        session.reset_best_score();
        LOG_INFO(TAG, "Best score has been reset.");

        render_wrapped_help_text(p, custom,
                                 "The best score has been reset. It will be "
                                 "raised again by your current game.");
        return wait_until_confirm_pressed(p);
}

std::vector<int> get_settings_storage_offsets()
{
        std::vector<int> offsets(5);
        offsets[static_cast<int>(Game::MainMenu)] = 0;
        offsets[static_cast<int>(Game::Clean2048)] =
            offsets[static_cast<int>(Game::MainMenu)] +
            sizeof(GameMenuConfiguration);
        return offsets;
}

int get_settings_storage_offset(Game game)
{
        return get_settings_storage_offsets()[static_cast<int>(game)];
}

int get_save_state_storage_offset()
{
        return get_settings_storage_offset(Game::Clean2048) +
               sizeof(Game2048Configuration);
}

int get_achievements_storage_offset()
{
        return get_save_state_storage_offset() + sizeof(Game2048SaveRecord);
}

static Configuration *assemble_settings_menu_configuration()
{
        auto *menu = ConfigurationOption::of_strings(
            "Modify",
            {game_to_string(Game::MainMenu), game_to_string(Game::Clean2048),
             BEST_SCORE_SETTING},
            game_to_string(Game::MainMenu));

        return new Configuration("Settings", {menu}, "Open");
}

static const char *extract_menu_setting(Configuration *config)
{
        return config->options[0]->get_current_str_value();
}
