#pragma once
#include "../common/platform/interface/platform.hpp"
#include "../common/user_interface_customization.hpp"
#include "../common/configuration.hpp"

/**
 * A screen that can be launched from the main menu. `game_loop` returns
 * `std::nullopt` when the user navigated back to the menu and
 * `UserAction::CloseWindow` when the whole application should exit.
 */
class GameExecutor
{
      public:
        virtual ~GameExecutor() = default;
        virtual std::optional<UserAction>
        game_loop(Platform *p, UserInterfaceCustomization *customization) = 0;
};
