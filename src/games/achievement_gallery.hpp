#pragma once
#include "game_executor.hpp"

/**
 * Read-only screen listing all achievements together with their unlock
 * status. Easter eggs stay hidden until they are unlocked.
 */
class AchievementGallery : public GameExecutor
{
      public:
        virtual std::optional<UserAction>
        game_loop(Platform *p,
                  UserInterfaceCustomization *customization) override;
};
