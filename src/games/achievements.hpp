#pragma once

#include <vector>

#include "2048_engine.hpp"
#include "../common/platform/interface/input.hpp"
#include "../common/platform/interface/persistent_storage.hpp"

typedef enum Achievement : int {
        Reach2048 = 0,
        Reach4096 = 1,
        Reach8192 = 2,
        PerfectGame = 3,
        Speedrun = 4,
        NoUndo = 5,
        /* Easter eggs */
        KonamiCode = 6,
        FibonacciTiles = 7,
        PalindromeTiles = 8,
} Achievement;

#define ACHIEVEMENT_COUNT 9

/**
 * Stable identifier of the achievement, e.g. `achieve_2048`.
 */
const char *achievement_id(Achievement achievement);
const char *achievement_title(Achievement achievement);
const char *achievement_description(Achievement achievement);
bool is_easter_egg(Achievement achievement);

/**
 * Snapshot of the game session handed over to the achievement observer after
 * every move that changed the board.
 */
typedef struct AchievementContext {
        int score;
        int move_count;
        double elapsed_seconds;
        bool used_undo;
        Board board;
        // Every direction the player entered, oldest first, including the
        // ones that did not move anything.
        std::vector<Direction> input_history;
} AchievementContext;

/**
 * Achievement collaborator of the game session. It only observes the game,
 * it must never modify it.
 */
class AchievementObserver
{
      public:
        virtual ~AchievementObserver() = default;
        /**
         * Returns the achievements that got unlocked by this move. Items that
         * were unlocked before are never reported again.
         */
        virtual std::vector<Achievement>
        on_move(const AchievementContext &context) = 0;
        /**
         * Called for directional inputs that did not change the board. Only
         * input-sequence achievements can be unlocked here.
         */
        virtual std::vector<Achievement>
        on_input(const std::vector<Direction> &input_history) = 0;
};

// Speedrun achievement deadline.
#define SPEEDRUN_SECONDS (5 * 60)

#define ACHIEVEMENTS_RECORD_MAGIC 0x41434856 // "ACHV"

typedef struct AchievementsRecord {
        int magic;
        unsigned int unlocked_mask;
} AchievementsRecord;

/**
 * Default achievement rules. Unlocked achievements are kept as a bitmask
 * (bit `i` for the achievement with value `i`) that is written to the
 * persistent storage every time something new gets unlocked. The storage is
 * optional, without it the progress only lives for the current run.
 */
class AchievementTracker : public AchievementObserver
{
      public:
        AchievementTracker(PersistentStorage *storage, int storage_offset);

        /**
         * Reads the previously unlocked achievements from storage. A missing
         * or corrupt record means nothing has been unlocked yet.
         */
        void load();

        std::vector<Achievement>
        on_move(const AchievementContext &context) override;
        std::vector<Achievement>
        on_input(const std::vector<Direction> &input_history) override;

        bool is_unlocked(Achievement achievement) const;
        int unlocked_count() const;

        /**
         * Marks the achievement as unlocked, returns true if it had not been
         * unlocked before.
         */
        bool unlock(Achievement achievement);

      private:
        PersistentStorage *storage;
        int storage_offset;
        unsigned int unlocked_mask;

        void persist();
};

/* Individual unlock conditions */

/**
 * A 2048 tile is on the board and there is no tile smaller than 128.
 */
bool is_perfect_game(const Board &board);
/**
 * The last eight inputs were Up Up Down Down Left Right Left Right.
 */
bool ends_with_konami_code(const std::vector<Direction> &history);
/**
 * Sorted tile values form a Fibonacci-like sequence of at least three
 * tiles, i.e. every value is the sum of the previous two.
 */
bool forms_fibonacci_sequence(const Board &board);
/**
 * Reading the non-empty tiles row by row gives the same sequence forwards
 * and backwards, with at least four tiles on the board.
 */
bool forms_palindrome(const Board &board);
