#include "2048_save_state.hpp"
#include "../common/logging.hpp"

#define TAG "2048_save_state"

Game2048SaveRecord encode_save_record(const Board &board, int score,
                                      int best_score)
{
        Game2048SaveRecord record = {};
        record.magic = SAVE_RECORD_MAGIC;
        record.version = SAVE_RECORD_VERSION;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        record.cells[i * GRID_SIZE + j] = board.cells[i][j];
                }
        }
        record.score = score;
        record.best_score = best_score;
        return record;
}

std::optional<SavedGame> decode_save_record(const Game2048SaveRecord &record)
{
        if (record.magic != SAVE_RECORD_MAGIC) {
                LOG_DEBUG(TAG, "No saved game found (magic=%x).",
                          record.magic);
                return std::nullopt;
        }
        if (record.version != SAVE_RECORD_VERSION) {
                LOG_WARN(TAG, "Unsupported save record version %d.",
                         record.version);
                return std::nullopt;
        }
        if (record.score < 0 || record.best_score < 0) {
                LOG_WARN(TAG, "Save record contains a negative score.");
                return std::nullopt;
        }

        SavedGame saved;
        for (int i = 0; i < GRID_SIZE; i++) {
                for (int j = 0; j < GRID_SIZE; j++) {
                        saved.board.cells[i][j] =
                            record.cells[i * GRID_SIZE + j];
                }
        }
        if (!is_valid_board(saved.board)) {
                LOG_WARN(TAG, "Save record contains an invalid board.");
                return std::nullopt;
        }

        saved.score = record.score;
        saved.best_score = record.best_score;
        return saved;
}

void PersistentSaveStateStore::save(const Board &board, int score,
                                    int best_score)
{
        Game2048SaveRecord record = encode_save_record(board, score, best_score);
        if (!storage->put(offset, record)) {
                LOG_WARN(TAG, "Unable to save the game at offset %d.", offset);
                return;
        }
        LOG_DEBUG(TAG, "Saved game: score=%d, best_score=%d", score,
                  best_score);
}

std::optional<SavedGame> PersistentSaveStateStore::load()
{
        Game2048SaveRecord record;
        if (!storage->get(offset, record)) {
                LOG_INFO(TAG, "No saved game in storage, starting fresh.");
                return std::nullopt;
        }
        return decode_save_record(record);
}
