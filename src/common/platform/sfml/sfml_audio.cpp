#include <algorithm>

#include "sfml_audio.hpp"
#include "../../logging.hpp"

#define TAG "sfml_audio"

static const SoundEffect ALL_EFFECTS[] = {MoveSound, MergeSound,
                                          GameOverSound, AchievementSound};

void SfmlAudioPlayer::setup()
{
        std::string sounds_dir = assets_dir + "/sounds/";

        for (SoundEffect effect : ALL_EFFECTS) {
                std::string path =
                    sounds_dir + sound_effect_to_str(effect) + ".wav";
                sf::SoundBuffer buffer;
                if (!buffer.loadFromFile(path)) {
                        LOG_WARN(TAG, "Unable to load sound effect %s.",
                                 path.c_str());
                        continue;
                }
                // The sound keeps a reference to the buffer, so the buffer
                // has to be in its final place before the sound is created.
                buffers[effect] = std::move(buffer);
                sounds[effect] = std::make_unique<sf::Sound>(buffers[effect]);
                sounds[effect]->setVolume((float)effects_volume);
        }

        std::string music_path = sounds_dir + "background.wav";
        music_loaded = music.openFromFile(music_path);
        if (!music_loaded) {
                LOG_WARN(TAG, "Unable to open background music %s.",
                         music_path.c_str());
                return;
        }
        music.setLooping(true);
        music.setVolume((float)music_volume);
        LOG_DEBUG(TAG, "Loaded %zu sound effects and background music.",
                  sounds.size());
}

void SfmlAudioPlayer::play(SoundEffect effect)
{
        if (muted) {
                return;
        }
        auto it = sounds.find(effect);
        if (it == sounds.end()) {
                return;
        }
        it->second->play();
}

void SfmlAudioPlayer::start_background_music()
{
        if (muted || !music_loaded ||
            music.getStatus() == sf::SoundSource::Status::Playing) {
                return;
        }
        music.play();
}

void SfmlAudioPlayer::stop_background_music()
{
        if (music_loaded) {
                music.stop();
        }
}

void SfmlAudioPlayer::set_muted(bool muted)
{
        this->muted = muted;
        if (muted) {
                stop_background_music();
        }
}

void SfmlAudioPlayer::set_music_volume(int volume)
{
        music_volume = std::clamp(volume, 0, 100);
        music.setVolume((float)music_volume);
}

void SfmlAudioPlayer::set_effects_volume(int volume)
{
        effects_volume = std::clamp(volume, 0, 100);
        for (auto &entry : sounds) {
                entry.second->setVolume((float)effects_volume);
        }
}
