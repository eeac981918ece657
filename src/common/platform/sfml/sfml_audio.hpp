#pragma once
#include <SFML/Audio.hpp>
#include <map>
#include <memory>
#include <string>

#include "../interface/audio.hpp"

/**
 * Plays the sound effects and the background music with SFML. The files are
 * looked up in `<assets_dir>/sounds/`: one `<effect>.wav` per sound effect
 * (see `sound_effect_to_str`) and `background.wav` for the music. Missing
 * files are logged and the corresponding sound stays silent.
 *
 * The player starts muted.
 */
class SfmlAudioPlayer : public AudioPlayer
{
      public:
        explicit SfmlAudioPlayer(std::string assets_dir)
            : assets_dir(assets_dir), music_loaded(false), muted(true),
              music_volume(50), effects_volume(70)
        {
        }

        /**
         * Loads all sound files. Must be called once before anything is
         * played.
         */
        void setup();

        void play(SoundEffect effect) override;
        void start_background_music() override;
        void stop_background_music() override;

        void set_muted(bool muted) override;
        bool is_muted() override { return muted; }
        void set_music_volume(int volume) override;
        void set_effects_volume(int volume) override;

      private:
        std::string assets_dir;
        std::map<SoundEffect, sf::SoundBuffer> buffers;
        std::map<SoundEffect, std::unique_ptr<sf::Sound>> sounds;
        sf::Music music;
        bool music_loaded;

        bool muted;
        int music_volume;
        int effects_volume;
};
