#pragma once

#include <chrono>
#include <vector>

#include "2048_engine.hpp"
#include "2048_save_state.hpp"
#include "achievements.hpp"
#include "../common/platform/interface/audio.hpp"

// Number of most recent inputs kept for the input-sequence easter eggs.
#define INPUT_HISTORY_LIMIT 32

typedef struct TurnOutcome {
        MoveResult result;
        // Achievements unlocked by this move.
        std::vector<Achievement> unlocked;
        bool new_best_score;
        // Set on the first move of the game that produced the target tile.
        bool reached_target;
} TurnOutcome;

/**
 * A single 2048 game session. It drives the engine-owned `GameState` and
 * keeps everything the engine deliberately knows nothing about: the best
 * score, move statistics and the collaborators that get notified about the
 * moves (persistence, achievements and audio).
 *
 * The collaborators are owned by the caller and must outlive the session.
 * Any of them may be null, in which case that notification is skipped.
 */
class Game2048Session
{
      public:
        Game2048Session(SaveStateStore *store,
                        AchievementObserver *achievements, AudioPlayer *audio,
                        unsigned int seed, int target_max_tile = 2048);

        /**
         * Resumes the saved game if there is one, otherwise starts a new
         * game.
         */
        void start();
        void new_game();

        /**
         * Handles one directional input. Moves that do not change the board
         * are recorded in the input history and can still complete an
         * input-sequence achievement, otherwise they are ignored: no undo
         * snapshot, no statistics and no saving.
         */
        TurnOutcome play_turn(Direction direction);

        /**
         * Reverts the last board-changing move. Only one level of undo is
         * supported, a second consecutive call returns false.
         */
        bool undo();

        void reset_best_score();

        const GameState &get_state() const { return state; }
        int get_score() const { return state.score; }
        int get_best_score() const { return best_score; }
        int get_move_count() const { return move_count; }
        int get_target_max_tile() const { return target_max_tile; }
        bool has_used_undo() const { return used_undo; }
        const std::vector<Direction> &get_input_history() const
        {
                return input_history;
        }

        bool can_undo() const;
        bool is_over() const;
        bool has_won() const;
        double elapsed_seconds() const;

      private:
        GameState state;
        SaveStateStore *store;
        AchievementObserver *achievements;
        AudioPlayer *audio;
        int target_max_tile;

        int best_score;
        int move_count;
        bool used_undo;
        bool target_reached;
        std::vector<Direction> input_history;
        std::chrono::steady_clock::time_point started_at;

        void reset_statistics();
        void record_input(Direction direction);
        void update_best_score(TurnOutcome *outcome);
        void notify(SoundEffect effect);
        void save();
};
