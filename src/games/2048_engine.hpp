#pragma once

#include <optional>
#include <random>

#include "../common/point.hpp"
#include "../common/platform/interface/input.hpp"

#define GRID_SIZE 4

/**
 * The 4x4 playing field. A cell holds 0 if it is empty, otherwise it holds
 * a power of two (2, 4, 8, ...). Cells are addressed as `cells[row][col]`.
 */
typedef struct Board {
        int cells[GRID_SIZE][GRID_SIZE];
} Board;

/**
 * Copy of the board and score taken right before the most recent
 * board-changing move. Only one level of history is kept, `valid` is
 * cleared once the snapshot has been restored.
 */
typedef struct UndoSnapshot {
        Board board;
        int score;
        bool valid;
} UndoSnapshot;

typedef struct MoveResult {
        // True if at least one tile slid or merged.
        bool moved;
        // Board after sliding and merging but before the new tile was spawned.
        Board shifted_board;
        // Final board, including the spawned tile.
        Board board;
        int score;
        int score_delta;
        // Number of merged pairs.
        int merges;
        std::optional<Point> spawned_at;
        int spawned_value;
        // Only evaluated when `moved` is true.
        bool game_over;
} MoveResult;

/**
 * Engine-owned state of a single game: the board, the score, the undo
 * snapshot and the random source used for spawning tiles.
 */
class GameState
{
      public:
        Board board;
        int score;
        UndoSnapshot undo_snapshot;
        std::mt19937 rng;

        explicit GameState(unsigned int seed)
            : board(), score(0), undo_snapshot(), rng(seed)
        {
        }
};

Board create_empty_board();
Board board_from_rows(const int rows[GRID_SIZE][GRID_SIZE]);
bool boards_equal(const Board &a, const Board &b);
int count_empty_cells(const Board &board);
int sum_of_tiles(const Board &board);
int max_tile(const Board &board);
/**
 * Checks that every cell is either empty or a power of two greater than one.
 */
bool is_valid_board(const Board &board);

/**
 * Slides and merges a single line of cells towards index 0. Zeros are
 * dropped first, then equal neighbours are merged left to right, a merged
 * tile never takes part in another merge during the same pass. The line is
 * padded with zeros at the end.
 *
 * Returns the score gained. If `merges` is not null, the number of merged
 * pairs is added to it.
 */
int merge_line(int line[GRID_SIZE], int *merges);

/**
 * Applies the slide/merge step of a move without spawning a new tile. The
 * returned result has `board == shifted_board` and `game_over == false`.
 */
MoveResult shift_board(const Board &board, int score, Direction direction);

/**
 * Places a 2 (90% of the time) or a 4 into a uniformly chosen empty cell.
 * Returns the chosen cell, or `std::nullopt` if the board is full, in which
 * case the board is left untouched.
 */
std::optional<Point> spawn_tile(Board *board, std::mt19937 *rng,
                                int *spawned_value = nullptr);

/**
 * Performs a full move: slide and merge along `direction`, then, if
 * anything changed, spawn a new tile and evaluate whether the game is over.
 * A move that changes nothing returns the input board and score unchanged.
 */
MoveResult move_board(const Board &board, int score, Direction direction,
                      std::mt19937 *rng);

/**
 * True iff there are no empty cells and no two horizontally or vertically
 * adjacent cells hold the same value.
 */
bool is_terminal(const Board &board);

UndoSnapshot snapshot_for_undo(const Board &board, int score);

/* Operations on the engine-owned game state */

/**
 * Clears the board, spawns the two starting tiles, resets the score and
 * drops the undo snapshot.
 */
void reset_game(GameState *gs);

/**
 * Executes a move on the game state. The undo snapshot is only replaced when
 * the move changed the board.
 */
MoveResult take_turn(GameState *gs, Direction direction);

/**
 * Restores the board and score from the undo snapshot and invalidates it.
 * Returns false (and leaves the state untouched) if there is nothing to undo.
 */
bool undo_last_move(GameState *gs);

bool can_undo(const GameState *gs);
