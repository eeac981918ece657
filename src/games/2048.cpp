#include <algorithm>
#include <cstdio>
#include <cstring>
#include <random>

#include "2048.hpp"
#include "2048_save_state.hpp"
#include "2048_session.hpp"
#include "achievements.hpp"

#include "../common/logging.hpp"
#include "../common/constants.hpp"
#include "../common/platform/interface/display.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../common/configuration.hpp"
#include "../common/user_interface.hpp"

#include "game_menu.hpp"
#include "common_transitions.hpp"
#include "settings.hpp"

#define TAG "2048"

const Game2048Configuration DEFAULT_2048_GAME_CONFIG = {
    .target_max_tile = 2048,
    .sound_enabled = false,
    .music_volume = 50,
    .effects_volume = 70,
};

static const std::vector<int> AVAILABLE_TARGETS = {512, 1024, 2048, 4096,
                                                   8192};
static const std::vector<int> AVAILABLE_VOLUMES = {0,  10, 20, 30, 40, 50,
                                                   60, 70, 80, 90, 100};

/**
 * Records which tile values and scores are currently on screen so that only
 * the parts that changed get redrawn. A value of -1 forces a redraw.
 */
typedef struct Game2048View {
        int rendered_cells[GRID_SIZE][GRID_SIZE];
        int rendered_score;
        int rendered_best_score;
} Game2048View;

/**
 * Class storing all dimensional information required to properly render
 * and space out the grid slots and the score boxes.
 */
class GridDimensions
{
      public:
        int cell_size;
        int cell_spacing;
        int grid_start_x;
        int grid_start_y;
        // Total width (and height) of the board including outer spacing.
        int grid_size_px;
        int score_box_width;
        int score_box_height;
        int score_start_x;
        int best_start_x;
        int score_start_y;
        int status_y;
        int hint_y;
};

static GridDimensions calculate_grid_dimensions(Display *display);

static void draw_game_canvas(Display *display, Game2048View *view,
                             UserInterfaceCustomization *customization);
static void update_game_view(Display *display, Game2048View *view,
                             const Game2048Session &session,
                             UserInterfaceCustomization *customization);
static void show_status(Display *display, const char *message, Color color);

/**
 * Returns the action that the user wants to take after leaving the game
 * screen. This can be a request to exit, to show the help screen or to close
 * the window, the caller needs to handle it appropriately.
 */
static UserAction enter_2048_loop(Platform *p,
                                  UserInterfaceCustomization *customization);

std::optional<UserAction>
Clean2048::game_loop(Platform *p, UserInterfaceCustomization *customization)
{
        const char *help_text =
            "Use the arrow keys, WASD or swipe to shift the tiles. Tiles with "
            "the same value merge into one when they collide. Press U to undo "
            "the last move, N to start a new game and Esc to go back to the "
            "menu. The game is saved after every move.";

        while (true) {
                UserAction action = enter_2048_loop(p, customization);
                if (p->audio_player) {
                        p->audio_player->stop_background_music();
                }

                switch (action) {
                case UserAction::PlayAgain:
                        LOG_INFO(TAG, "Re-entering the main 2048 game loop.");
                        continue;
                case UserAction::Exit:
                        return std::nullopt;
                case UserAction::ShowHelp: {
                        LOG_INFO(TAG, "User requested help screen for 2048.");
                        render_wrapped_help_text(p, customization, help_text);
                        auto closed = wait_until_confirm_pressed(p);
                        if (closed) {
                                return closed;
                        }
                } break;
                case UserAction::CloseWindow:
                        return action;
                }
        }
}

static void redraw_everything(Display *display, Game2048View *view,
                              const Game2048Session &session,
                              UserInterfaceCustomization *customization)
{
        draw_game_canvas(display, view, customization);
        update_game_view(display, view, session, customization);
}

static UserAction enter_2048_loop(Platform *p,
                                  UserInterfaceCustomization *customization)
{
        Game2048Configuration config = load_2048_config(p->persistent_storage);
        apply_audio_settings(p->audio_player, config);

        PersistentSaveStateStore store(p->persistent_storage,
                                       get_save_state_storage_offset());
        AchievementTracker achievements(p->persistent_storage,
                                        get_achievements_storage_offset());
        achievements.load();

        Game2048Session session(&store, &achievements, p->audio_player,
                                std::random_device{}(),
                                config.target_max_tile);
        session.start();

        Game2048View view;
        redraw_everything(p->display, &view, session, customization);
        if (!p->display->refresh()) {
                return UserAction::CloseWindow;
        }

        while (true) {
                if (session.is_over()) {
                        display_game_over(p->display, customization,
                                          session.get_score());
                        std::optional<Direction> dir;
                        std::optional<Action> act;
                        auto closed = pause_until_input(
                            p->directional_controllers, p->action_controllers,
                            &dir, &act, p->delay_provider, p->display);
                        if (closed) {
                                return closed.value();
                        }
                        if (act == Action::BACK) {
                                return UserAction::Exit;
                        }
                        if (act == Action::HELP) {
                                return UserAction::ShowHelp;
                        }
                        if (act == Action::UNDO && session.undo()) {
                                LOG_DEBUG(TAG, "Undid the game-ending move.");
                        } else {
                                session.new_game();
                        }
                        redraw_everything(p->display, &view, session,
                                          customization);
                        continue;
                }

                Direction dir;
                Action act;
                if (poll_directional_input(p->directional_controllers, &dir)) {
                        LOG_DEBUG(TAG, "Input received: %s",
                                  direction_to_str(dir));
                        TurnOutcome outcome = session.play_turn(dir);
                        if (outcome.result.moved) {
                                update_game_view(p->display, &view, session,
                                                 customization);
                                show_status(p->display,
                                            outcome.new_best_score
                                                ? "New best score!"
                                                : "",
                                            DarkText);
                        }
                        for (Achievement achievement : outcome.unlocked) {
                                char message[48];
                                snprintf(message, sizeof(message),
                                         "Unlocked: %s",
                                         achievement_title(achievement));
                                show_status(p->display, message,
                                            customization->accent_color);
                        }
                        if (outcome.reached_target) {
                                display_game_won(p->display, customization,
                                                 session.get_target_max_tile());
                                std::optional<Direction> next_dir;
                                std::optional<Action> next_act;
                                auto closed = pause_until_input(
                                    p->directional_controllers,
                                    p->action_controllers, &next_dir,
                                    &next_act, p->delay_provider, p->display);
                                if (closed) {
                                        return closed.value();
                                }
                                if (next_act == Action::BACK) {
                                        return UserAction::Exit;
                                }
                                redraw_everything(p->display, &view, session,
                                                  customization);
                        }
                        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
                } else if (poll_action_input(p->action_controllers, &act)) {
                        LOG_DEBUG(TAG, "Action received: %s",
                                  action_to_str(act));
                        switch (act) {
                        case Action::UNDO:
                                if (session.undo()) {
                                        update_game_view(p->display, &view,
                                                         session,
                                                         customization);
                                        show_status(p->display, "Move undone.",
                                                    DarkText);
                                } else {
                                        show_status(p->display,
                                                    "Nothing to undo.",
                                                    DarkText);
                                }
                                break;
                        case Action::RESTART:
                                LOG_INFO(TAG, "User requested a new game.");
                                session.new_game();
                                redraw_everything(p->display, &view, session,
                                                  customization);
                                break;
                        case Action::HELP:
                                return UserAction::ShowHelp;
                        case Action::BACK:
                                LOG_DEBUG(TAG, "User requested to exit game.");
                                p->delay_provider->delay_ms(
                                    MOVE_REGISTERED_DELAY);
                                return UserAction::Exit;
                        case Action::CONFIRM:
                                break;
                        }
                        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
                }
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
}

/* Configuration */

bool is_valid_2048_config(const Game2048Configuration &config)
{
        bool known_target =
            std::find(AVAILABLE_TARGETS.begin(), AVAILABLE_TARGETS.end(),
                      config.target_max_tile) != AVAILABLE_TARGETS.end();
        return known_target && config.sound_enabled <= 1 &&
               config.music_volume >= 0 &&
               config.music_volume <= 100 && config.effects_volume >= 0 &&
               config.effects_volume <= 100;
}

Game2048Configuration load_2048_config(PersistentStorage *storage)
{
        int storage_offset = get_settings_storage_offset(Clean2048);

        Game2048Configuration config;
        LOG_DEBUG(TAG,
                  "Trying to load initial settings from the persistent storage "
                  "at offset %d",
                  storage_offset);
        bool loaded = storage->get(storage_offset, config);

        if (!loaded || !is_valid_2048_config(config)) {
                LOG_DEBUG(TAG, "The storage does not contain a valid "
                               "2048 game configuration, using default values.");
                storage->put(storage_offset, DEFAULT_2048_GAME_CONFIG);
                return DEFAULT_2048_GAME_CONFIG;
        }

        LOG_DEBUG(TAG,
                  "Loaded 2048 game configuration: target_max_tile=%d, "
                  "sound_enabled=%d, music_volume=%d, effects_volume=%d",
                  config.target_max_tile, config.sound_enabled,
                  config.music_volume, config.effects_volume);
        return config;
}

Configuration *
assemble_2048_configuration(const Game2048Configuration &initial_config)
{
        auto *game_target = ConfigurationOption::of_integers(
            "Target", AVAILABLE_TARGETS, initial_config.target_max_tile);

        auto *sound = ConfigurationOption::of_strings(
            "Sound", {"Yes", "No"},
            map_boolean_to_yes_or_no(initial_config.sound_enabled));

        auto *music_volume = ConfigurationOption::of_integers(
            "Music", AVAILABLE_VOLUMES, initial_config.music_volume);

        auto *effects_volume = ConfigurationOption::of_integers(
            "Effects", AVAILABLE_VOLUMES, initial_config.effects_volume);

        return new Configuration(
            "2048", {game_target, sound, music_volume, effects_volume}, "Save");
}

void extract_2048_config(Game2048Configuration *game_config,
                         Configuration *config)
{
        ConfigurationOption *game_target = config->options[0];
        ConfigurationOption *sound = config->options[1];
        ConfigurationOption *music_volume = config->options[2];
        ConfigurationOption *effects_volume = config->options[3];

        game_config->target_max_tile = game_target->get_curr_int_value();
        game_config->sound_enabled =
            extract_yes_or_no_option(sound->get_current_str_value());
        game_config->music_volume = music_volume->get_curr_int_value();
        game_config->effects_volume = effects_volume->get_curr_int_value();
}

std::optional<UserAction>
collect_2048_config(Platform *p, Game2048Configuration *game_config,
                    UserInterfaceCustomization *customization)
{
        Game2048Configuration initial_config =
            load_2048_config(p->persistent_storage);
        Configuration *config = assemble_2048_configuration(initial_config);

        auto maybe_interrupt_action =
            collect_configuration(p, config, customization);
        if (maybe_interrupt_action) {
                free_configuration(config);
                return maybe_interrupt_action;
        }

        extract_2048_config(game_config, config);
        free_configuration(config);
        return std::nullopt;
}

void apply_audio_settings(AudioPlayer *audio,
                          const Game2048Configuration &config)
{
        if (!audio) {
                return;
        }
        audio->set_music_volume(config.music_volume);
        audio->set_effects_volume(config.effects_volume);
        audio->set_muted(!config.sound_enabled);
        if (config.sound_enabled) {
                audio->start_background_music();
        } else {
                audio->stop_background_music();
        }
}

/* Rendering */

static GridDimensions calculate_grid_dimensions(Display *display)
{
        int width = display->get_width();
        int corner_radius = display->get_display_corner_radius();
        int margin = SCREEN_BORDER_WIDTH + 2 * FONT_WIDTH;

        GridDimensions gd;
        gd.cell_spacing = FONT_WIDTH;
        gd.cell_size = (width - 2 * margin - (GRID_SIZE + 1) * gd.cell_spacing) /
                       GRID_SIZE;
        gd.grid_size_px =
            GRID_SIZE * gd.cell_size + (GRID_SIZE + 1) * gd.cell_spacing;
        gd.grid_start_x = (width - gd.grid_size_px) / 2;

        // Fits a six digit score in the heading font.
        gd.score_box_width = 6 * HEADING_FONT_WIDTH + FONT_WIDTH;
        gd.score_box_height = FONT_SIZE + HEADING_FONT_SIZE + 12;
        gd.best_start_x = gd.grid_start_x + gd.grid_size_px - gd.score_box_width;
        gd.score_start_x =
            gd.best_start_x - gd.cell_spacing - gd.score_box_width;
        gd.score_start_y = corner_radius;

        gd.grid_start_y = gd.score_start_y + gd.score_box_height + 2 * FONT_SIZE;
        gd.status_y = gd.grid_start_y + gd.grid_size_px + FONT_SIZE;
        gd.hint_y = gd.status_y + 2 * FONT_SIZE;
        return gd;
}

static void draw_box(Display *display, Point start, int width, int height,
                     Color color, UserInterfaceCustomization *customization)
{
        if (customization->rendering_mode == Minimalistic) {
                display->draw_rectangle(start, width, height, color, 1, true);
        } else {
                display->draw_rounded_rectangle(start, width, height,
                                                FONT_WIDTH / 2, color);
        }
}

static int number_string_length(int number)
{
        char buffer[16];
        return snprintf(buffer, sizeof(buffer), "%d", number);
}

static void draw_tile(Display *display, const GridDimensions &gd, int row,
                      int col, int value,
                      UserInterfaceCustomization *customization)
{
        Point start = {
            .x = gd.grid_start_x + gd.cell_spacing +
                 col * (gd.cell_size + gd.cell_spacing),
            .y = gd.grid_start_y + gd.cell_spacing +
                 row * (gd.cell_size + gd.cell_spacing)};

        Color background = tile_color(value);
        draw_box(display, start, gd.cell_size, gd.cell_size, background,
                 customization);
        if (value == 0) {
                return;
        }

        // Long numbers get a smaller font so that they fit into the tile.
        int digits = number_string_length(value);
        FontSize font_size = Size32;
        int font_width = LARGE_FONT_WIDTH;
        if (digits == 4) {
                font_size = Size24;
                font_width = HEADING_FONT_WIDTH;
        } else if (digits > 4) {
                font_size = Size16;
                font_width = FONT_WIDTH;
        }

        char buffer[16];
        snprintf(buffer, sizeof(buffer), "%d", value);
        Point text_start = {
            .x = start.x + (gd.cell_size - digits * font_width) / 2,
            .y = start.y + (gd.cell_size - (int)font_size) / 2};
        display->draw_string(text_start, buffer, font_size, background,
                             tile_text_color(value));
}

static void draw_score_box(Display *display, const GridDimensions &gd, int x,
                           const char *label, int value,
                           UserInterfaceCustomization *customization)
{
        Point start = {.x = x, .y = gd.score_start_y};
        draw_box(display, start, gd.score_box_width, gd.score_box_height,
                 BoardBackground, customization);

        Point label_start = {
            .x = x + (gd.score_box_width - (int)strlen(label) * FONT_WIDTH) / 2,
            .y = gd.score_start_y + 4};
        display->draw_string(label_start, label, Size16, BoardBackground,
                             EmptyCell);

        char buffer[16];
        int len = snprintf(buffer, sizeof(buffer), "%d", value);
        Point value_start = {
            .x = x + (gd.score_box_width - len * HEADING_FONT_WIDTH) / 2,
            .y = gd.score_start_y + 4 + FONT_SIZE + 4};
        display->draw_string(value_start, buffer, Size24, BoardBackground,
                             White);
}

static void draw_game_canvas(Display *display, Game2048View *view,
                             UserInterfaceCustomization *customization)
{
        display->initialize();
        display->clear(PageBackground);

        if (customization->rendering_mode == Detailed)
                display->draw_rounded_border(customization->accent_color);

        GridDimensions gd = calculate_grid_dimensions(display);

        Point title_start = {
            .x = gd.grid_start_x,
            .y = gd.score_start_y + (gd.score_box_height - LARGE_FONT_SIZE) / 2};
        display->draw_string(title_start, "2048", Size32, PageBackground,
                             DarkText);

        Point grid_start = {.x = gd.grid_start_x, .y = gd.grid_start_y};
        draw_box(display, grid_start, gd.grid_size_px, gd.grid_size_px,
                 BoardBackground, customization);

        if (customization->show_help_text) {
                const char *hint = "Arrows/swipe: move U: undo N: new";
                render_wrapped_text(display, hint, gd.hint_y, DarkText,
                                    PageBackground);
        }

        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        view->rendered_cells[i][j] = -1;
                }
        }
        view->rendered_score = -1;
        view->rendered_best_score = -1;
}

static void update_game_view(Display *display, Game2048View *view,
                             const Game2048Session &session,
                             UserInterfaceCustomization *customization)
{
        GridDimensions gd = calculate_grid_dimensions(display);

        if (view->rendered_score != session.get_score()) {
                draw_score_box(display, gd, gd.score_start_x, "SCORE",
                               session.get_score(), customization);
                view->rendered_score = session.get_score();
        }
        if (view->rendered_best_score != session.get_best_score()) {
                draw_score_box(display, gd, gd.best_start_x, "BEST",
                               session.get_best_score(), customization);
                view->rendered_best_score = session.get_best_score();
        }

        const Board &board = session.get_state().board;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (board.cells[i][j] != view->rendered_cells[i][j]) {
                                draw_tile(display, gd, i, j, board.cells[i][j],
                                          customization);
                                view->rendered_cells[i][j] = board.cells[i][j];
                        }
                }
        }
}

static void show_status(Display *display, const char *message, Color color)
{
        GridDimensions gd = calculate_grid_dimensions(display);
        Point clear_start = {.x = gd.grid_start_x, .y = gd.status_y};
        Point clear_end = {.x = gd.grid_start_x + gd.grid_size_px,
                           .y = gd.status_y + FONT_SIZE};
        display->clear_region(clear_start, clear_end, PageBackground);

        int len = strlen(message);
        if (len == 0) {
                return;
        }
        Point start = {.x = get_centering_margin(display->get_width(),
                                                 FONT_WIDTH, len),
                       .y = gd.status_y};
        display->draw_string(start, message, Size16, PageBackground, color);
}
