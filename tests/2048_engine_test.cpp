#include <random>
#include <vector>

#include <gtest/gtest.h>

#include "src/games/2048_engine.hpp"

namespace
{

const Direction ALL_DIRECTIONS[] = {UP, RIGHT, DOWN, LEFT};

std::vector<int> line_of(int a, int b, int c, int d) { return {a, b, c, d}; }

std::vector<int> merged(std::vector<int> line, int *gained, int *merges)
{
        int cells[GRID_SIZE] = {line[0], line[1], line[2], line[3]};
        *gained = merge_line(cells, merges);
        return {cells[0], cells[1], cells[2], cells[3]};
}

Board board_with_first_row(int a, int b, int c, int d)
{
        Board board = create_empty_board();
        board.cells[0][0] = a;
        board.cells[0][1] = b;
        board.cells[0][2] = c;
        board.cells[0][3] = d;
        return board;
}

/**
 * Random valid board, roughly `fill_percent` of the cells hold a tile
 * between 2 and 2^max_exponent.
 */
Board random_board(std::mt19937 *rng, int fill_percent, int max_exponent)
{
        std::uniform_int_distribution<int> percent(0, 99);
        std::uniform_int_distribution<int> exponent(1, max_exponent);
        Board board = create_empty_board();
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (percent(*rng) < fill_percent) {
                                board.cells[i][j] = 1 << exponent(*rng);
                        }
                }
        }
        return board;
}

// Full board where no two neighbours are equal.
const int CHECKERBOARD[GRID_SIZE][GRID_SIZE] = {
    {2, 4, 2, 4},
    {4, 2, 4, 2},
    {2, 4, 2, 4},
    {4, 2, 4, 2},
};

} // namespace

TEST(MergeLineTest, FourEqualTilesMergeInPairs)
{
        int gained = 0;
        int merges = 0;
        EXPECT_EQ(merged(line_of(2, 2, 2, 2), &gained, &merges),
                  line_of(4, 4, 0, 0));
        EXPECT_EQ(gained, 8);
        EXPECT_EQ(merges, 2);
}

TEST(MergeLineTest, ThirdEqualTileStaysUnmerged)
{
        int gained = 0;
        int merges = 0;
        EXPECT_EQ(merged(line_of(2, 2, 2, 0), &gained, &merges),
                  line_of(4, 2, 0, 0));
        EXPECT_EQ(gained, 4);
        EXPECT_EQ(merges, 1);
}

TEST(MergeLineTest, MergedTileDoesNotMergeAgain)
{
        int gained = 0;
        int merges = 0;
        EXPECT_EQ(merged(line_of(4, 4, 8, 0), &gained, &merges),
                  line_of(8, 8, 0, 0));
        EXPECT_EQ(gained, 8);
        EXPECT_EQ(merges, 1);
}

TEST(MergeLineTest, CompactsAcrossGaps)
{
        int gained = 0;
        int merges = 0;
        EXPECT_EQ(merged(line_of(0, 2, 0, 2), &gained, &merges),
                  line_of(4, 0, 0, 0));
        EXPECT_EQ(gained, 4);

        merges = 0;
        EXPECT_EQ(merged(line_of(0, 0, 4, 2), &gained, &merges),
                  line_of(4, 2, 0, 0));
        EXPECT_EQ(gained, 0);
        EXPECT_EQ(merges, 0);
}

TEST(MergeLineTest, AcceptsNullMergeCounter)
{
        int cells[GRID_SIZE] = {8, 8, 0, 0};
        EXPECT_EQ(merge_line(cells, nullptr), 16);
        EXPECT_EQ(cells[0], 16);
}

TEST(ShiftBoardTest, LeftMergesPair)
{
        Board board = board_with_first_row(2, 2, 0, 0);
        MoveResult result = shift_board(board, 0, LEFT);

        EXPECT_TRUE(result.moved);
        EXPECT_TRUE(boards_equal(result.shifted_board,
                                 board_with_first_row(4, 0, 0, 0)));
        EXPECT_EQ(result.score_delta, 4);
        EXPECT_EQ(result.score, 4);
        EXPECT_FALSE(result.spawned_at.has_value());
}

TEST(ShiftBoardTest, RightMergesAcrossGap)
{
        Board board = board_with_first_row(2, 0, 2, 0);
        MoveResult result = shift_board(board, 10, RIGHT);

        EXPECT_TRUE(result.moved);
        EXPECT_TRUE(boards_equal(result.shifted_board,
                                 board_with_first_row(0, 0, 0, 4)));
        EXPECT_EQ(result.score_delta, 4);
        EXPECT_EQ(result.score, 14);
}

TEST(ShiftBoardTest, FullRowOfTwosScoresEight)
{
        Board board = board_with_first_row(2, 2, 2, 2);

        MoveResult left = shift_board(board, 0, LEFT);
        EXPECT_TRUE(boards_equal(left.shifted_board,
                                 board_with_first_row(4, 4, 0, 0)));
        EXPECT_EQ(left.score_delta, 8);

        MoveResult right = shift_board(board, 0, RIGHT);
        EXPECT_TRUE(boards_equal(right.shifted_board,
                                 board_with_first_row(0, 0, 4, 4)));
        EXPECT_EQ(right.score_delta, 8);
}

TEST(ShiftBoardTest, VerticalMovesWorkOnColumns)
{
        const int rows[GRID_SIZE][GRID_SIZE] = {
            {2, 0, 0, 0},
            {2, 0, 0, 4},
            {4, 0, 0, 0},
            {0, 0, 0, 4},
        };
        Board board = board_from_rows(rows);

        MoveResult up = shift_board(board, 0, UP);
        const int expected_up[GRID_SIZE][GRID_SIZE] = {
            {4, 0, 0, 8},
            {4, 0, 0, 0},
            {0, 0, 0, 0},
            {0, 0, 0, 0},
        };
        EXPECT_TRUE(
            boards_equal(up.shifted_board, board_from_rows(expected_up)));
        EXPECT_EQ(up.score_delta, 12);

        MoveResult down = shift_board(board, 0, DOWN);
        const int expected_down[GRID_SIZE][GRID_SIZE] = {
            {0, 0, 0, 0},
            {0, 0, 0, 0},
            {4, 0, 0, 0},
            {4, 0, 0, 8},
        };
        EXPECT_TRUE(
            boards_equal(down.shifted_board, board_from_rows(expected_down)));
        EXPECT_EQ(down.score_delta, 12);
}

TEST(ShiftBoardTest, NoChangeIsNotAMove)
{
        Board board = board_with_first_row(2, 4, 8, 16);
        MoveResult result = shift_board(board, 32, LEFT);

        EXPECT_FALSE(result.moved);
        EXPECT_TRUE(boards_equal(result.board, board));
        EXPECT_EQ(result.score, 32);
        EXPECT_EQ(result.score_delta, 0);
}

TEST(MoveBoardTest, NoOpMoveDoesNotSpawn)
{
        std::mt19937 rng(1);
        Board board = board_with_first_row(2, 4, 0, 0);
        MoveResult result = move_board(board, 6, LEFT, &rng);

        EXPECT_FALSE(result.moved);
        EXPECT_FALSE(result.game_over);
        EXPECT_FALSE(result.spawned_at.has_value());
        EXPECT_TRUE(boards_equal(result.board, board));
        EXPECT_EQ(result.score, 6);
}

TEST(MoveBoardTest, MoveSpawnsExactlyOneTileIntoEmptyCell)
{
        std::mt19937 rng(7);
        Board board = board_with_first_row(0, 0, 2, 2);
        MoveResult result = move_board(board, 0, LEFT, &rng);

        ASSERT_TRUE(result.moved);
        ASSERT_TRUE(result.spawned_at.has_value());
        Point cell = result.spawned_at.value();
        EXPECT_EQ(result.shifted_board.cells[cell.y][cell.x], 0);
        EXPECT_EQ(result.board.cells[cell.y][cell.x], result.spawned_value);
        EXPECT_TRUE(result.spawned_value == 2 || result.spawned_value == 4);
        EXPECT_EQ(count_empty_cells(result.board),
                  count_empty_cells(result.shifted_board) - 1);
}

TEST(MoveBoardTest, FullBoardWithoutPairsIsTerminalAndCannotMove)
{
        std::mt19937 rng(3);
        Board board = board_from_rows(CHECKERBOARD);
        EXPECT_TRUE(is_terminal(board));

        for (Direction direction : ALL_DIRECTIONS) {
                MoveResult result = move_board(board, 100, direction, &rng);
                EXPECT_FALSE(result.moved) << direction_to_str(direction);
                EXPECT_FALSE(result.game_over);
                EXPECT_EQ(result.score, 100);
        }
}

TEST(MoveBoardTest, ReportsGameOverAfterFinalMove)
{
        const int rows[GRID_SIZE][GRID_SIZE] = {
            {2, 4, 2, 4},
            {4, 2, 4, 2},
            {2, 4, 2, 8},
            {0, 8, 16, 32},
        };
        std::mt19937 rng(11);
        MoveResult result = move_board(board_from_rows(rows), 0, LEFT, &rng);

        ASSERT_TRUE(result.moved);
        EXPECT_EQ(result.board.cells[3][0], 8);
        EXPECT_EQ(result.board.cells[3][2], 32);
        EXPECT_TRUE(result.game_over);
}

TEST(IsTerminalTest, EmptyCellOrEqualNeighboursAllowMoves)
{
        Board with_gap = board_from_rows(CHECKERBOARD);
        with_gap.cells[3][3] = 0;
        EXPECT_FALSE(is_terminal(with_gap));

        Board horizontal_pair = board_from_rows(CHECKERBOARD);
        horizontal_pair.cells[3][3] = 4;
        EXPECT_FALSE(is_terminal(horizontal_pair));

        Board vertical_pair = board_from_rows(CHECKERBOARD);
        vertical_pair.cells[0][0] = 4;
        vertical_pair.cells[0][1] = 8;
        vertical_pair.cells[0][2] = 16;
        vertical_pair.cells[0][3] = 32;
        vertical_pair.cells[1][0] = 4;
        EXPECT_FALSE(is_terminal(vertical_pair));
}

TEST(SpawnTileTest, FullBoardIsLeftUntouched)
{
        std::mt19937 rng(5);
        Board board = board_from_rows(CHECKERBOARD);
        int value = -1;
        EXPECT_FALSE(spawn_tile(&board, &rng, &value).has_value());
        EXPECT_TRUE(boards_equal(board, board_from_rows(CHECKERBOARD)));
        EXPECT_EQ(value, -1);
}

TEST(SpawnTileTest, SingleEmptyCellIsAlwaysChosen)
{
        std::mt19937 rng(5);
        for (int attempt = 0; attempt < 20; attempt++) {
                Board board = board_from_rows(CHECKERBOARD);
                board.cells[2][1] = 0;
                std::optional<Point> cell = spawn_tile(&board, &rng);
                ASSERT_TRUE(cell.has_value());
                EXPECT_EQ(cell->x, 1);
                EXPECT_EQ(cell->y, 2);
                EXPECT_NE(board.cells[2][1], 0);
        }
}

TEST(SpawnTileTest, FourAppearsRoughlyOneInTen)
{
        std::mt19937 rng(2024);
        const int spawns = 10000;
        int fours = 0;
        int hits[GRID_SIZE][GRID_SIZE] = {};
        for (int n = 0; n < spawns; n++) {
                Board board = create_empty_board();
                int value = 0;
                std::optional<Point> cell = spawn_tile(&board, &rng, &value);
                ASSERT_TRUE(cell.has_value());
                ASSERT_TRUE(value == 2 || value == 4);
                if (value == 4) {
                        fours++;
                }
                hits[cell->y][cell->x]++;
        }

        double ratio = (double)fours / spawns;
        EXPECT_GT(ratio, 0.07);
        EXPECT_LT(ratio, 0.13);

        // 625 expected per cell.
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        EXPECT_GT(hits[i][j], 450);
                        EXPECT_LT(hits[i][j], 800);
                }
        }
}

TEST(EnginePropertiesTest, RepeatingMoveSettlesAndStaysSettled)
{
        std::mt19937 rng(42);
        for (int n = 0; n < 500; n++) {
                Board board = random_board(&rng, 60, 4);
                for (Direction direction : ALL_DIRECTIONS) {
                        MoveResult result = shift_board(board, 0, direction);
                        // Each pass at least halves the number of tiles that
                        // can still merge, so a line settles quickly.
                        int passes = 0;
                        while (result.moved && passes < GRID_SIZE) {
                                result = shift_board(result.board,
                                                     result.score, direction);
                                passes++;
                        }
                        ASSERT_FALSE(result.moved);

                        MoveResult again =
                            shift_board(result.board, result.score, direction);
                        EXPECT_FALSE(again.moved);
                        EXPECT_TRUE(boards_equal(again.board, result.board));
                        EXPECT_EQ(again.score, result.score);
                }
        }
}

TEST(EnginePropertiesTest, MovePreservesTileSumPlusSpawn)
{
        std::mt19937 rng(1234);
        for (int n = 0; n < 500; n++) {
                Board board = random_board(&rng, 50, 6);
                for (Direction direction : ALL_DIRECTIONS) {
                        MoveResult result =
                            move_board(board, 0, direction, &rng);
                        EXPECT_EQ(sum_of_tiles(result.shifted_board),
                                  sum_of_tiles(board));
                        if (result.moved) {
                                EXPECT_EQ(sum_of_tiles(result.board),
                                          sum_of_tiles(board) +
                                              result.spawned_value);
                        } else {
                                EXPECT_TRUE(boards_equal(result.board, board));
                        }
                        EXPECT_TRUE(is_valid_board(result.board));
                        // Every merge gains at least 4 points.
                        EXPECT_GE(result.score_delta, 4 * result.merges);
                }
        }
}

TEST(EnginePropertiesTest, TerminalIffNoDirectionMoves)
{
        std::mt19937 rng(99);
        int terminal_boards = 0;
        for (int n = 0; n < 5000; n++) {
                // Full boards with few distinct values, so that both terminal
                // and non-terminal boards come up.
                Board board = random_board(&rng, n % 2 == 0 ? 100 : 90, 5);
                bool any_move = false;
                for (Direction direction : ALL_DIRECTIONS) {
                        if (shift_board(board, 0, direction).moved) {
                                any_move = true;
                        }
                }
                EXPECT_EQ(is_terminal(board), !any_move);
                if (!any_move) {
                        terminal_boards++;
                }
        }
        EXPECT_GT(terminal_boards, 0);
}

TEST(GameStateTest, ResetSpawnsTwoTiles)
{
        GameState gs(17);
        gs.score = 500;
        gs.undo_snapshot = snapshot_for_undo(gs.board, 10);

        reset_game(&gs);

        EXPECT_EQ(count_empty_cells(gs.board), GRID_SIZE * GRID_SIZE - 2);
        EXPECT_EQ(gs.score, 0);
        EXPECT_FALSE(can_undo(&gs));
}

TEST(GameStateTest, UndoRestoresPreviousBoardOnce)
{
        GameState gs(8);
        gs.board = board_with_first_row(2, 2, 4, 0);
        gs.score = 12;

        MoveResult result = take_turn(&gs, LEFT);
        ASSERT_TRUE(result.moved);
        EXPECT_EQ(gs.score, 16);
        EXPECT_TRUE(can_undo(&gs));

        EXPECT_TRUE(undo_last_move(&gs));
        EXPECT_TRUE(boards_equal(gs.board, board_with_first_row(2, 2, 4, 0)));
        EXPECT_EQ(gs.score, 12);

        EXPECT_FALSE(undo_last_move(&gs));
        EXPECT_TRUE(boards_equal(gs.board, board_with_first_row(2, 2, 4, 0)));
        EXPECT_EQ(gs.score, 12);
}

TEST(GameStateTest, NoOpMoveKeepsUndoSnapshot)
{
        GameState gs(8);
        Board earlier = board_with_first_row(2, 0, 0, 0);
        gs.board = board_with_first_row(2, 4, 0, 0);
        gs.score = 20;
        gs.undo_snapshot = snapshot_for_undo(earlier, 5);

        MoveResult noop = take_turn(&gs, LEFT);

        EXPECT_FALSE(noop.moved);
        EXPECT_TRUE(boards_equal(gs.board, board_with_first_row(2, 4, 0, 0)));
        EXPECT_EQ(gs.score, 20);
        ASSERT_TRUE(can_undo(&gs));
        EXPECT_TRUE(boards_equal(gs.undo_snapshot.board, earlier));
        EXPECT_EQ(gs.undo_snapshot.score, 5);
}

TEST(GameStateTest, SameSeedGivesSameGame)
{
        GameState first(123);
        GameState second(123);
        reset_game(&first);
        reset_game(&second);
        EXPECT_TRUE(boards_equal(first.board, second.board));

        for (Direction direction : {LEFT, UP, RIGHT, DOWN, LEFT}) {
                take_turn(&first, direction);
                take_turn(&second, direction);
        }
        EXPECT_TRUE(boards_equal(first.board, second.board));
        EXPECT_EQ(first.score, second.score);
}
