#pragma once

#include "../common/platform/interface/display.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../common/configuration.hpp"

#include "2048_engine.hpp"
#include "common_transitions.hpp"
#include "game_executor.hpp"

typedef struct Game2048Configuration {
        int target_max_tile;
        // Stored as a byte, 0 or 1.
        unsigned char sound_enabled;
        // Volumes are in the 0-100 range.
        int music_volume;
        int effects_volume;
} Game2048Configuration;

extern const Game2048Configuration DEFAULT_2048_GAME_CONFIG;

bool is_valid_2048_config(const Game2048Configuration &config);

/**
 * Reads the 2048 settings from the persistent storage. If the storage does
 * not hold a valid configuration, the defaults are written back and
 * returned.
 */
Game2048Configuration load_2048_config(PersistentStorage *storage);

/**
 * Assembles the generic configuration struct that is needed to collect the
 * 2048 settings from the user.
 *
 * WARNING: This is tightly coupled with `extract_2048_config`. If you change
 * the order of the options, make sure to update that function as well.
 */
Configuration *
assemble_2048_configuration(const Game2048Configuration &initial_config);

void extract_2048_config(Game2048Configuration *game_config,
                         Configuration *config);

/**
 * Similar to `collect_configuration` from `configuration.hpp`, it returns
 * `std::nullopt` if the configuration was successfully collected. Otherwise
 * the user interrupted the collection and the returned action needs to be
 * handled by the caller.
 */
std::optional<UserAction>
collect_2048_config(Platform *p, Game2048Configuration *game_config,
                    UserInterfaceCustomization *customization);

/**
 * Pushes the sound settings to the audio player and starts or stops the
 * background music accordingly.
 */
void apply_audio_settings(AudioPlayer *audio,
                          const Game2048Configuration &config);

class Clean2048 : public GameExecutor
{
      public:
        virtual std::optional<UserAction>
        game_loop(Platform *p,
                  UserInterfaceCustomization *customization) override;

        Clean2048() {}
};
