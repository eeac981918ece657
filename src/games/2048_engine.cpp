#include <cassert>
#include <vector>

#include "2048_engine.hpp"

/* Board helpers */

Board create_empty_board()
{
        Board board = {};
        return board;
}

Board board_from_rows(const int rows[GRID_SIZE][GRID_SIZE])
{
        Board board;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        board.cells[i][j] = rows[i][j];
                }
        }
        return board;
}

bool boards_equal(const Board &a, const Board &b)
{
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (a.cells[i][j] != b.cells[i][j]) {
                                return false;
                        }
                }
        }
        return true;
}

int count_empty_cells(const Board &board)
{
        int empty = 0;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (board.cells[i][j] == 0) {
                                empty++;
                        }
                }
        }
        return empty;
}

int sum_of_tiles(const Board &board)
{
        int sum = 0;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        sum += board.cells[i][j];
                }
        }
        return sum;
}

int max_tile(const Board &board)
{
        int max = 0;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (board.cells[i][j] > max) {
                                max = board.cells[i][j];
                        }
                }
        }
        return max;
}

bool is_valid_board(const Board &board)
{
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        int value = board.cells[i][j];
                        if (value == 0) {
                                continue;
                        }
                        // A power of two has exactly one bit set.
                        if (value < 2 || (value & (value - 1)) != 0) {
                                return false;
                        }
                }
        }
        return true;
}

/* Tile Merging Logic */

int merge_line(int line[GRID_SIZE], int *merges)
{
        int non_zero[GRID_SIZE];
        int non_zero_count = 0;
        for (int k = 0; k < GRID_SIZE; k++) {
                if (line[k] != 0) {
                        non_zero[non_zero_count++] = line[k];
                }
        }

        int gained = 0;
        int emitted = 0;
        int i = 0;
        while (i < non_zero_count) {
                if (i + 1 < non_zero_count && non_zero[i] == non_zero[i + 1]) {
                        int merged = 2 * non_zero[i];
                        line[emitted++] = merged;
                        gained += merged;
                        if (merges) {
                                (*merges)++;
                        }
                        // Both tiles of the pair are consumed so that the
                        // merged tile cannot merge again in this pass.
                        i += 2;
                } else {
                        line[emitted++] = non_zero[i];
                        i++;
                }
        }

        while (emitted < GRID_SIZE) {
                line[emitted++] = 0;
        }
        return gained;
}

/**
 * Returns the k-th cell of the given line, counting from the edge the tiles
 * slide towards. Lines are rows for horizontal moves and columns for
 * vertical ones. Addressing cells this way lets every direction reuse the
 * same 'merge towards index 0' logic without copying the board around.
 */
static int *line_cell(Board *board, int line, int k, Direction direction)
{
        switch (direction) {
        case LEFT:
                return &board->cells[line][k];
        case RIGHT:
                return &board->cells[line][GRID_SIZE - 1 - k];
        case UP:
                return &board->cells[k][line];
        case DOWN:
                return &board->cells[GRID_SIZE - 1 - k][line];
        }
        assert(false && "unknown direction");
        return &board->cells[line][k];
}

MoveResult shift_board(const Board &board, int score, Direction direction)
{
        assert(is_valid_board(board));

        MoveResult result = {};
        result.shifted_board = board;
        result.score = score;

        for (int line = 0; line < GRID_SIZE; line++) {
                int cells[GRID_SIZE];
                for (int k = 0; k < GRID_SIZE; k++) {
                        cells[k] = *line_cell(&result.shifted_board, line, k,
                                              direction);
                }

                result.score_delta += merge_line(cells, &result.merges);

                for (int k = 0; k < GRID_SIZE; k++) {
                        int *cell = line_cell(&result.shifted_board, line, k,
                                              direction);
                        if (*cell != cells[k]) {
                                result.moved = true;
                        }
                        *cell = cells[k];
                }
        }

        result.score += result.score_delta;
        result.board = result.shifted_board;
        return result;
}

/* Tile Spawning */

std::optional<Point> spawn_tile(Board *board, std::mt19937 *rng,
                                int *spawned_value)
{
        std::vector<Point> empty_cells;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (board->cells[i][j] == 0) {
                                empty_cells.push_back({.x = j, .y = i});
                        }
                }
        }

        if (empty_cells.empty()) {
                return std::nullopt;
        }

        std::uniform_int_distribution<int> cell_distribution(
            0, (int)empty_cells.size() - 1);
        Point cell = empty_cells[cell_distribution(*rng)];

        // One in ten spawned tiles is a 4.
        std::uniform_int_distribution<int> value_distribution(0, 9);
        int value = value_distribution(*rng) == 0 ? 4 : 2;

        board->cells[cell.y][cell.x] = value;
        if (spawned_value) {
                *spawned_value = value;
        }
        return cell;
}

/* Game Loop Logic */

bool is_terminal(const Board &board)
{
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        int value = board.cells[i][j];
                        if (value == 0) {
                                return false;
                        }
                        // Checking the right and lower neighbour of every
                        // cell covers each adjacent pair exactly once.
                        if (j + 1 < GRID_SIZE &&
                            value == board.cells[i][j + 1]) {
                                return false;
                        }
                        if (i + 1 < GRID_SIZE &&
                            value == board.cells[i + 1][j]) {
                                return false;
                        }
                }
        }
        return true;
}

MoveResult move_board(const Board &board, int score, Direction direction,
                      std::mt19937 *rng)
{
        MoveResult result = shift_board(board, score, direction);
        if (!result.moved) {
                return result;
        }

        result.spawned_at =
            spawn_tile(&result.board, rng, &result.spawned_value);
        result.game_over = is_terminal(result.board);
        return result;
}

UndoSnapshot snapshot_for_undo(const Board &board, int score)
{
        UndoSnapshot snapshot;
        snapshot.board = board;
        snapshot.score = score;
        snapshot.valid = true;
        return snapshot;
}

/* Game state operations */

void reset_game(GameState *gs)
{
        gs->board = create_empty_board();
        spawn_tile(&gs->board, &gs->rng);
        spawn_tile(&gs->board, &gs->rng);
        gs->score = 0;
        gs->undo_snapshot.valid = false;
}

MoveResult take_turn(GameState *gs, Direction direction)
{
        MoveResult result =
            move_board(gs->board, gs->score, direction, &gs->rng);
        if (!result.moved) {
                return result;
        }

        gs->undo_snapshot = snapshot_for_undo(gs->board, gs->score);
        gs->board = result.board;
        gs->score = result.score;
        return result;
}

bool undo_last_move(GameState *gs)
{
        if (!gs->undo_snapshot.valid) {
                return false;
        }

        gs->board = gs->undo_snapshot.board;
        gs->score = gs->undo_snapshot.score;
        gs->undo_snapshot.valid = false;
        return true;
}

bool can_undo(const GameState *gs) { return gs->undo_snapshot.valid; }
