#include "audio.hpp"

const char *sound_effect_to_str(SoundEffect effect)
{
        switch (effect) {
        case MoveSound:
                return "move";
        case MergeSound:
                return "merge";
        case GameOverSound:
                return "game_over";
        case AchievementSound:
                return "achievement";
        default:
                return "unknown";
        }
}
