#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "tilebox_config.h"

#include "src/common/platform/interface/platform.hpp"
#include "src/common/platform/interface/persistent_storage.hpp"
#include "src/common/constants.hpp"
#include "src/common/platform/sfml/sfml_audio.hpp"
#include "src/common/platform/sfml/sfml_controllers.hpp"
#include "src/common/platform/sfml/sfml_delay.hpp"
#include "src/common/platform/sfml/sfml_display.hpp"

#include "src/common/logging.hpp"

#include "src/games/game_menu.hpp"

#define TAG "tilebox_entrypoint"

void print_version(char *argv[]);
int main(int argc, char *argv[])
{
        print_version(argv);

        if (std::getenv("TILEBOX_VERBOSE")) {
                set_log_level(LogLevel::Debug);
        }

        std::string storage_path = argc > 1 ? argv[1] : "tilebox_storage.bin";
        LOG_INFO(TAG, "Using persistent storage file %s",
                 storage_path.c_str());

        sf::RenderWindow window(sf::VideoMode({DISPLAY_WIDTH, DISPLAY_HEIGHT}),
                                "tilebox");

        // Rendering straight to the window would require redrawing everything
        // every frame. The games only redraw what changed, so they draw into
        // a RenderTexture that keeps its contents, and the texture is then
        // copied into the window on every refresh.
        sf::RenderTexture texture({DISPLAY_WIDTH, DISPLAY_HEIGHT});

        LOG_DEBUG(TAG, "Initializing the display...");
        SfmlDisplay display(&window, &texture, TILEBOX_FONT_PATH);
        display.setup();
        LOG_DEBUG(TAG, "Display initialized!");

        SfmlDelay delay;
        SfmlArrowInputController arrow_controller;
        SfmlWasdInputController wasd_controller;
        SfmlSwipeController swipe_controller(&window);
        SfmlActionInputController action_controller;

        std::vector<DirectionalController *> controllers = {
            &arrow_controller,
            &wasd_controller,
            &swipe_controller,
        };
        for (DirectionalController *controller : controllers) {
                controller->setup();
        }

        std::vector<ActionController *> action_controllers = {
            &action_controller,
        };
        action_controller.setup();

        PersistentStorage persistent_storage(storage_path);

        SfmlAudioPlayer audio_player(TILEBOX_ASSETS_DIR);
        audio_player.setup();

        Platform platform = {.display = &display,
                             .directional_controllers = &controllers,
                             .action_controllers = &action_controllers,
                             .delay_provider = &delay,
                             .persistent_storage = &persistent_storage,
                             .audio_player = &audio_player};

        LOG_DEBUG(TAG, "Entering game loop...");
        while (window.isOpen()) {
                auto maybe_action = select_game(&platform);
                if (maybe_action.has_value() &&
                    maybe_action.value() == UserAction::CloseWindow) {
                        LOG_DEBUG(TAG, "User requested to close the "
                                       "window. Exiting...");
                        break;
                }
        }
        audio_player.stop_background_music();
        return 0;
}

void print_version(char *argv[])
{
        std::cout << argv[0] << " version: " << TILEBOX_VERSION_MAJOR << "."
                  << TILEBOX_VERSION_MINOR << std::endl;
}
