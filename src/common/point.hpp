#pragma once

/**
 * A point on the screen (in pixels) or a cell of a game grid. For grid cells
 * `x` is the column and `y` is the row.
 */
typedef struct Point {
        int x;
        int y;

        bool operator==(const Point &other) const
        {
                return x == other.x && y == other.y;
        }
} Point;
