#pragma once
#include <optional>

/**
 * Enum modeling the four possible directions of user input.
 */
typedef enum Direction { UP = 0, RIGHT = 1, DOWN = 2, LEFT = 3 } Direction;

/**
 * Enum for the discrete 'user actions' that are not directional. On the
 * desktop platform each of them is bound to a keyboard key.
 */
typedef enum Action {
        HELP = 0,
        UNDO = 1,
        CONFIRM = 2,
        BACK = 3,
        RESTART = 4,
} Action;

const char *direction_to_str(Direction direction);
const char *action_to_str(Action action);

/**
 * Minimum release velocity (in pixels per second) for a drag to be recognised
 * as a swipe.
 */
constexpr float SWIPE_VELOCITY_THRESHOLD = 250.0f;

/**
 * Maps the release velocity of a drag gesture onto a direction. The dominant
 * axis wins and its sign decides between the two directions on that axis.
 * Screen coordinates grow downwards, hence a negative vertical velocity is a
 * swipe up. Returns `std::nullopt` if the velocity along the dominant axis is
 * below `min_velocity`.
 */
std::optional<Direction>
direction_from_swipe(float velocity_x, float velocity_y,
                     float min_velocity = SWIPE_VELOCITY_THRESHOLD);
