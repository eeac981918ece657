#pragma once
#include <SFML/Graphics.hpp>
#include <optional>

#include "../interface/controller.hpp"

/**
 * Arrow keys.
 */
class SfmlArrowInputController : public DirectionalController
{
      public:
        bool poll_for_input(Direction *input) override;
        void setup() override {}
};

class SfmlWasdInputController : public DirectionalController
{
      public:
        bool poll_for_input(Direction *input) override;
        void setup() override {}
};

/**
 * Key bindings of the actions:
 *   F1 - help, U/Backspace - undo, Enter - confirm, Escape - back,
 *   N - restart.
 */
class SfmlActionInputController : public ActionController
{
      public:
        bool poll_for_input(Action *input) override;
        void setup() override {}
};

/**
 * Recognises swipes made by dragging with the left mouse button or with the
 * first finger on a touch screen. The pointer velocity is sampled every time
 * the controller is polled; once the pointer is released, the last velocity
 * is mapped onto a direction with `direction_from_swipe`. Slow drags and
 * plain clicks are ignored.
 */
class SfmlSwipeController : public DirectionalController
{
      public:
        explicit SfmlSwipeController(const sf::WindowBase *window)
            : window(window), dragging(false), last_position(), velocity()
        {
        }

        bool poll_for_input(Direction *input) override;
        void setup() override {}

      private:
        const sf::WindowBase *window;
        bool dragging;
        sf::Vector2i last_position;
        sf::Vector2f velocity;
        sf::Clock sample_clock;

        std::optional<sf::Vector2i> pointer_position();
};
