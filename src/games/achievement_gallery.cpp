#include <cstdio>
#include <cstring>

#include "achievement_gallery.hpp"
#include "achievements.hpp"
#include "settings.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include "../common/user_interface.hpp"

#define TAG "achievement_gallery"

#define ENTRY_HEIGHT (FONT_SIZE * 2 + FONT_SIZE / 2)

static void render_gallery(Display *display, const AchievementTracker &tracker,
                           UserInterfaceCustomization *customization)
{
        display->initialize();
        display->clear(Black);
        if (customization->rendering_mode == Detailed) {
                display->draw_rounded_border(customization->accent_color);
        }

        char heading[32];
        snprintf(heading, sizeof(heading), "Achievements %d/%d",
                 tracker.unlocked_count(), ACHIEVEMENT_COUNT);
        int heading_x = get_centering_margin(
            display->get_width(), HEADING_FONT_WIDTH, strlen(heading));
        display->draw_string({.x = heading_x, .y = HEADING_FONT_SIZE}, heading,
                             Size24, Black, White);

        int margin = 2 * FONT_WIDTH;
        int y = 3 * HEADING_FONT_SIZE;
        for (int i = 0; i < ACHIEVEMENT_COUNT; i++) {
                Achievement achievement = static_cast<Achievement>(i);
                bool unlocked = tracker.is_unlocked(achievement);
                bool hidden = is_easter_egg(achievement) && !unlocked;

                Point marker_center = {.x = margin + FONT_WIDTH / 2,
                                       .y = y + FONT_SIZE / 2};
                display->draw_circle(marker_center, FONT_WIDTH / 2,
                                     unlocked ? customization->accent_color
                                              : Gray,
                                     1, unlocked);

                const char *title = hidden ? "???" : achievement_title(achievement);
                const char *description = hidden
                                              ? "Secret, keep playing."
                                              : achievement_description(
                                                    achievement);

                display->draw_string({.x = margin + 2 * FONT_WIDTH, .y = y},
                                     title, Size16, Black,
                                     unlocked ? White : Gray);
                display->draw_string(
                    {.x = margin + 2 * FONT_WIDTH, .y = y + FONT_SIZE + 2},
                    description, Size16, Black, Gray);
                y += ENTRY_HEIGHT;
        }

        if (customization->show_help_text) {
                const char *hint = "Press Enter to go back.";
                int hint_x = get_centering_margin(display->get_width(),
                                                  FONT_WIDTH, strlen(hint));
                display->draw_string(
                    {.x = hint_x, .y = display->get_height() - 2 * FONT_SIZE},
                    hint, Size16, Black, customization->accent_color);
        }
}

std::optional<UserAction>
AchievementGallery::game_loop(Platform *p,
                              UserInterfaceCustomization *customization)
{
        AchievementTracker tracker(p->persistent_storage,
                                   get_achievements_storage_offset());
        tracker.load();
        LOG_DEBUG(TAG, "Rendering %d unlocked achievements.",
                  tracker.unlocked_count());

        render_gallery(p->display, tracker, customization);

        Action act;
        while (true) {
                if (poll_action_input(p->action_controllers, &act) &&
                    (act == Action::CONFIRM || act == Action::BACK)) {
                        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
                        return std::nullopt;
                }
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
}
