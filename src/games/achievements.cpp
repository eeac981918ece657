#include <algorithm>

#include "achievements.hpp"
#include "../common/logging.hpp"

#define TAG "achievements"

const char *achievement_id(Achievement achievement)
{
        switch (achievement) {
        case Reach2048:
                return "achieve_2048";
        case Reach4096:
                return "achieve_4096";
        case Reach8192:
                return "achieve_8192";
        case PerfectGame:
                return "achieve_perfect_game";
        case Speedrun:
                return "achieve_speedrun";
        case NoUndo:
                return "achieve_no_undo";
        case KonamiCode:
                return "easter_egg_konami";
        case FibonacciTiles:
                return "easter_egg_fibonacci";
        case PalindromeTiles:
                return "easter_egg_palindrome";
        default:
                return "unknown";
        }
}

const char *achievement_title(Achievement achievement)
{
        switch (achievement) {
        case Reach2048:
                return "2048!";
        case Reach4096:
                return "Double Joy";
        case Reach8192:
                return "Godlike";
        case PerfectGame:
                return "Perfect Game";
        case Speedrun:
                return "Speedrunner";
        case NoUndo:
                return "No Regrets";
        case KonamiCode:
                return "Konami Code";
        case FibonacciTiles:
                return "Fibonacci";
        case PalindromeTiles:
                return "Palindrome";
        default:
                return "Unknown";
        }
}

const char *achievement_description(Achievement achievement)
{
        switch (achievement) {
        case Reach2048:
                return "Score 2048 points.";
        case Reach4096:
                return "Score 4096 points.";
        case Reach8192:
                return "Score 8192 points.";
        case PerfectGame:
                return "Get 2048 with no tile below 128.";
        case Speedrun:
                return "Score 2048 points in 5 minutes.";
        case NoUndo:
                return "Score 2048 points without undo.";
        case KonamiCode:
                return "Enter the classic cheat code.";
        case FibonacciTiles:
                return "Tiles form a Fibonacci sequence.";
        case PalindromeTiles:
                return "Tiles read the same both ways.";
        default:
                return "";
        }
}

bool is_easter_egg(Achievement achievement)
{
        return achievement == KonamiCode || achievement == FibonacciTiles ||
               achievement == PalindromeTiles;
}

AchievementTracker::AchievementTracker(PersistentStorage *storage,
                                       int storage_offset)
    : storage(storage), storage_offset(storage_offset), unlocked_mask(0)
{
}

void AchievementTracker::load()
{
        unlocked_mask = 0;
        if (!storage) {
                return;
        }

        AchievementsRecord record;
        if (!storage->get(storage_offset, record) ||
            record.magic != ACHIEVEMENTS_RECORD_MAGIC) {
                LOG_DEBUG(TAG, "No achievements stored at offset %d.",
                          storage_offset);
                return;
        }

        // Drop bits that do not correspond to any known achievement.
        unlocked_mask = record.unlocked_mask & ((1u << ACHIEVEMENT_COUNT) - 1);
        LOG_DEBUG(TAG, "Loaded %d unlocked achievements.", unlocked_count());
}

bool AchievementTracker::is_unlocked(Achievement achievement) const
{
        return (unlocked_mask >> achievement) & 1u;
}

int AchievementTracker::unlocked_count() const
{
        int count = 0;
        for (int i = 0; i < ACHIEVEMENT_COUNT; i++) {
                if (is_unlocked((Achievement)i)) {
                        count++;
                }
        }
        return count;
}

bool AchievementTracker::unlock(Achievement achievement)
{
        if (is_unlocked(achievement)) {
                return false;
        }
        unlocked_mask |= 1u << achievement;
        LOG_INFO(TAG, "Achievement unlocked: %s", achievement_id(achievement));
        persist();
        return true;
}

void AchievementTracker::persist()
{
        if (!storage) {
                return;
        }
        AchievementsRecord record = {.magic = ACHIEVEMENTS_RECORD_MAGIC,
                                     .unlocked_mask = unlocked_mask};
        if (!storage->put(storage_offset, record)) {
                LOG_WARN(TAG, "Unable to persist unlocked achievements.");
        }
}

std::vector<Achievement>
AchievementTracker::on_move(const AchievementContext &context)
{
        std::vector<Achievement> unlocked;
        auto check = [&](bool condition, Achievement achievement) {
                if (condition && unlock(achievement)) {
                        unlocked.push_back(achievement);
                }
        };

        check(context.score >= 2048, Reach2048);
        check(context.score >= 4096, Reach4096);
        check(context.score >= 8192, Reach8192);
        check(is_perfect_game(context.board), PerfectGame);
        check(context.score >= 2048 &&
                  context.elapsed_seconds < SPEEDRUN_SECONDS,
              Speedrun);
        check(context.score >= 2048 && !context.used_undo, NoUndo);

        check(ends_with_konami_code(context.input_history), KonamiCode);
        check(forms_fibonacci_sequence(context.board), FibonacciTiles);
        check(forms_palindrome(context.board), PalindromeTiles);

        return unlocked;
}

std::vector<Achievement>
AchievementTracker::on_input(const std::vector<Direction> &input_history)
{
        std::vector<Achievement> unlocked;
        if (ends_with_konami_code(input_history) && unlock(KonamiCode)) {
                unlocked.push_back(KonamiCode);
        }
        return unlocked;
}

/* Unlock conditions */

static std::vector<int> tiles_row_major(const Board &board)
{
        std::vector<int> tiles;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        if (board.cells[i][j] > 0) {
                                tiles.push_back(board.cells[i][j]);
                        }
                }
        }
        return tiles;
}

bool is_perfect_game(const Board &board)
{
        bool has_2048 = false;
        for (int value : tiles_row_major(board)) {
                if (value == 2048) {
                        has_2048 = true;
                }
                if (value < 128) {
                        return false;
                }
        }
        return has_2048;
}

bool ends_with_konami_code(const std::vector<Direction> &history)
{
        const Direction code[] = {UP,   UP,    DOWN, DOWN,
                                  LEFT, RIGHT, LEFT, RIGHT};
        const int code_len = sizeof(code) / sizeof(code[0]);

        if ((int)history.size() < code_len) {
                return false;
        }

        int start = history.size() - code_len;
        for (int i = 0; i < code_len; i++) {
                if (history[start + i] != code[i]) {
                        return false;
                }
        }
        return true;
}

bool forms_fibonacci_sequence(const Board &board)
{
        std::vector<int> tiles = tiles_row_major(board);
        if (tiles.size() < 3) {
                return false;
        }
        std::sort(tiles.begin(), tiles.end());

        for (size_t i = 2; i < tiles.size(); i++) {
                if (tiles[i] != tiles[i - 1] + tiles[i - 2]) {
                        return false;
                }
        }
        return true;
}

bool forms_palindrome(const Board &board)
{
        std::vector<int> tiles = tiles_row_major(board);
        if (tiles.size() < 4) {
                return false;
        }

        size_t n = tiles.size();
        for (size_t i = 0; i < n / 2; i++) {
                if (tiles[i] != tiles[n - 1 - i]) {
                        return false;
                }
        }
        return true;
}
