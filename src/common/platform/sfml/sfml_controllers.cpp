#include "sfml_controllers.hpp"
#include "../../logging.hpp"

#define TAG "sfml_controllers"

// Weight of the newest velocity sample, older samples decay geometrically.
#define VELOCITY_SMOOTHING 0.6f

using Key = sf::Keyboard::Key;

bool SfmlArrowInputController::poll_for_input(Direction *input)
{
        if (sf::Keyboard::isKeyPressed(Key::Up)) {
                *input = Direction::UP;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::Down)) {
                *input = Direction::DOWN;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::Left)) {
                *input = Direction::LEFT;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::Right)) {
                *input = Direction::RIGHT;
                return true;
        }
        return false;
}

bool SfmlWasdInputController::poll_for_input(Direction *input)
{
        if (sf::Keyboard::isKeyPressed(Key::W)) {
                *input = Direction::UP;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::S)) {
                *input = Direction::DOWN;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::A)) {
                *input = Direction::LEFT;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::D)) {
                *input = Direction::RIGHT;
                return true;
        }
        return false;
}

bool SfmlActionInputController::poll_for_input(Action *input)
{
        if (sf::Keyboard::isKeyPressed(Key::F1)) {
                *input = Action::HELP;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::U) ||
            sf::Keyboard::isKeyPressed(Key::Backspace)) {
                *input = Action::UNDO;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::Enter)) {
                *input = Action::CONFIRM;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::Escape)) {
                *input = Action::BACK;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(Key::N)) {
                *input = Action::RESTART;
                return true;
        }
        return false;
}

std::optional<sf::Vector2i> SfmlSwipeController::pointer_position()
{
        if (sf::Touch::isDown(0)) {
                return sf::Touch::getPosition(0, *window);
        }
        if (!sf::Mouse::isButtonPressed(sf::Mouse::Button::Left)) {
                return std::nullopt;
        }

        sf::Vector2i position = sf::Mouse::getPosition(*window);
        sf::Vector2u size = window->getSize();
        bool inside = position.x >= 0 && position.y >= 0 &&
                      position.x < (int)size.x && position.y < (int)size.y;
        // Drags that leave the window keep being tracked.
        if (!inside && !dragging) {
                return std::nullopt;
        }
        return position;
}

bool SfmlSwipeController::poll_for_input(Direction *input)
{
        std::optional<sf::Vector2i> position = pointer_position();

        if (position) {
                float elapsed = sample_clock.restart().asSeconds();
                if (!dragging) {
                        dragging = true;
                        velocity = {0.0f, 0.0f};
                } else if (elapsed > 0.0f) {
                        sf::Vector2f sample =
                            sf::Vector2f(*position - last_position) / elapsed;
                        velocity = VELOCITY_SMOOTHING * sample +
                                   (1.0f - VELOCITY_SMOOTHING) * velocity;
                }
                last_position = *position;
                return false;
        }

        if (!dragging) {
                return false;
        }
        dragging = false;

        std::optional<Direction> direction =
            direction_from_swipe(velocity.x, velocity.y);
        if (!direction) {
                LOG_DEBUG(TAG, "Drag released too slowly (%.0f, %.0f px/s).",
                          velocity.x, velocity.y);
                return false;
        }
        LOG_DEBUG(TAG, "Swipe %s detected.", direction_to_str(*direction));
        *input = *direction;
        return true;
}
