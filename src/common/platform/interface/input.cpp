#include "input.hpp"

#include <cmath>

const char *direction_to_str(Direction direction)
{
        switch (direction) {
        case UP:
                return "Up";
        case LEFT:
                return "Left";
        case RIGHT:
                return "Right";
        case DOWN:
                return "Down";
        default:
                return "Unknown";
        };
};

const char *action_to_str(Action action)
{
        switch (action) {
        case HELP:
                return "Help";
        case UNDO:
                return "Undo";
        case CONFIRM:
                return "Confirm";
        case BACK:
                return "Back";
        case RESTART:
                return "Restart";
        default:
                return "Unknown";
        };
};

std::optional<Direction> direction_from_swipe(float velocity_x,
                                              float velocity_y,
                                              float min_velocity)
{
        float abs_x = std::fabs(velocity_x);
        float abs_y = std::fabs(velocity_y);

        if (abs_x >= abs_y) {
                if (abs_x < min_velocity) {
                        return std::nullopt;
                }
                return velocity_x < 0 ? LEFT : RIGHT;
        }

        if (abs_y < min_velocity) {
                return std::nullopt;
        }
        return velocity_y < 0 ? UP : DOWN;
}
