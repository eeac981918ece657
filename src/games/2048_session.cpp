#include <algorithm>

#include "2048_session.hpp"
#include "../common/logging.hpp"

#define TAG "2048_session"

Game2048Session::Game2048Session(SaveStateStore *store,
                                 AchievementObserver *achievements,
                                 AudioPlayer *audio, unsigned int seed,
                                 int target_max_tile)
    : state(seed), store(store), achievements(achievements), audio(audio),
      target_max_tile(target_max_tile), best_score(0), move_count(0),
      used_undo(false), target_reached(false), input_history(),
      started_at(std::chrono::steady_clock::now())
{
}

void Game2048Session::start()
{
        std::optional<SavedGame> saved =
            store ? store->load() : std::optional<SavedGame>();

        if (!saved.has_value()) {
                LOG_INFO(TAG, "Starting a new game.");
                new_game();
                return;
        }

        best_score = std::max(saved->best_score, saved->score);
        if (count_empty_cells(saved->board) == GRID_SIZE * GRID_SIZE) {
                LOG_INFO(TAG, "Saved board is empty, starting a new game.");
                new_game();
                return;
        }

        state.board = saved->board;
        state.score = saved->score;
        state.undo_snapshot.valid = false;
        reset_statistics();
        // A resumed game that already contains the target tile should not
        // celebrate the win again.
        target_reached = max_tile(state.board) >= target_max_tile;

        LOG_INFO(TAG, "Resumed saved game: score=%d, best_score=%d",
                 state.score, best_score);
}

void Game2048Session::new_game()
{
        reset_game(&state);
        reset_statistics();
        target_reached = false;
        save();
}

void Game2048Session::reset_statistics()
{
        move_count = 0;
        used_undo = false;
        input_history.clear();
        started_at = std::chrono::steady_clock::now();
}

TurnOutcome Game2048Session::play_turn(Direction direction)
{
        record_input(direction);

        TurnOutcome outcome = {};
        outcome.result = take_turn(&state, direction);
        if (!outcome.result.moved) {
                LOG_DEBUG(TAG, "Move %s did not change the board.",
                          direction_to_str(direction));
                if (achievements) {
                        outcome.unlocked =
                            achievements->on_input(input_history);
                        if (!outcome.unlocked.empty()) {
                                notify(AchievementSound);
                        }
                }
                return outcome;
        }

        move_count++;
        update_best_score(&outcome);
        notify(outcome.result.merges > 0 ? MergeSound : MoveSound);

        if (!target_reached && max_tile(state.board) >= target_max_tile) {
                target_reached = true;
                outcome.reached_target = true;
                LOG_INFO(TAG, "Target tile %d reached after %d moves.",
                         target_max_tile, move_count);
        }

        if (achievements) {
                AchievementContext context = {
                    .score = state.score,
                    .move_count = move_count,
                    .elapsed_seconds = elapsed_seconds(),
                    .used_undo = used_undo,
                    .board = state.board,
                    .input_history = input_history,
                };
                outcome.unlocked = achievements->on_move(context);
                if (!outcome.unlocked.empty()) {
                        notify(AchievementSound);
                }
        }

        if (outcome.result.game_over) {
                LOG_INFO(TAG, "Game over: score=%d, moves=%d", state.score,
                         move_count);
                notify(GameOverSound);
        }

        save();
        return outcome;
}

bool Game2048Session::undo()
{
        if (!undo_last_move(&state)) {
                LOG_DEBUG(TAG, "Nothing to undo.");
                return false;
        }
        used_undo = true;
        LOG_DEBUG(TAG, "Undo restored score %d.", state.score);
        save();
        return true;
}

void Game2048Session::reset_best_score()
{
        best_score = 0;
        save();
}

bool Game2048Session::can_undo() const { return ::can_undo(&state); }

bool Game2048Session::is_over() const { return is_terminal(state.board); }

bool Game2048Session::has_won() const
{
        return max_tile(state.board) >= target_max_tile;
}

double Game2048Session::elapsed_seconds() const
{
        std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - started_at;
        return elapsed.count();
}

void Game2048Session::record_input(Direction direction)
{
        input_history.push_back(direction);
        if (input_history.size() > INPUT_HISTORY_LIMIT) {
                input_history.erase(input_history.begin());
        }
}

void Game2048Session::update_best_score(TurnOutcome *outcome)
{
        if (state.score > best_score) {
                best_score = state.score;
                outcome->new_best_score = true;
        }
}

void Game2048Session::notify(SoundEffect effect)
{
        if (audio) {
                audio->play(effect);
        }
}

void Game2048Session::save()
{
        if (store) {
                store->save(state.board, state.score, best_score);
        }
}
