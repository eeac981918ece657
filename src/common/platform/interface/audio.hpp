#pragma once

/**
 * Sound effects that the games can request. Playback is fire-and-forget:
 * the games never wait for a sound to finish and never learn whether it
 * was actually played.
 */
typedef enum SoundEffect {
        MoveSound = 0,
        MergeSound = 1,
        GameOverSound = 2,
        AchievementSound = 3,
} SoundEffect;

const char *sound_effect_to_str(SoundEffect effect);

class AudioPlayer
{
      public:
        virtual ~AudioPlayer() = default;

        virtual void play(SoundEffect effect) = 0;
        virtual void start_background_music() = 0;
        virtual void stop_background_music() = 0;

        virtual void set_muted(bool muted) = 0;
        virtual bool is_muted() = 0;
        /**
         * Volumes are in the 0-100 range, values outside of it are clamped.
         */
        virtual void set_music_volume(int volume) = 0;
        virtual void set_effects_volume(int volume) = 0;
};
