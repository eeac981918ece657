#pragma once

#include <optional>

#include "2048_engine.hpp"
#include "../common/platform/interface/persistent_storage.hpp"

/**
 * A game restored from persistent storage.
 */
typedef struct SavedGame {
        Board board;
        int score;
        int best_score;
} SavedGame;

/**
 * Persistence collaborator of the 2048 game session. Implementations must
 * not throw: a failed save is logged and dropped, a failed or missing load is
 * reported as `std::nullopt` so that the session starts a fresh game.
 */
class SaveStateStore
{
      public:
        virtual ~SaveStateStore() = default;
        virtual void save(const Board &board, int score, int best_score) = 0;
        virtual std::optional<SavedGame> load() = 0;
};

#define SAVE_RECORD_MAGIC 0x32303438 // "2048"
#define SAVE_RECORD_VERSION 1

/**
 * On-storage layout of a saved game. The board is stored row-major.
 */
typedef struct Game2048SaveRecord {
        int magic;
        int version;
        int cells[GRID_SIZE * GRID_SIZE];
        int score;
        int best_score;
} Game2048SaveRecord;

Game2048SaveRecord encode_save_record(const Board &board, int score,
                                      int best_score);
/**
 * Decodes a record read back from storage. Records with the wrong magic or
 * version, negative scores or cells that are not powers of two are rejected.
 */
std::optional<SavedGame> decode_save_record(const Game2048SaveRecord &record);

class PersistentSaveStateStore : public SaveStateStore
{
      public:
        PersistentSaveStateStore(PersistentStorage *storage, int offset)
            : storage(storage), offset(offset)
        {
        }

        void save(const Board &board, int score, int best_score) override;
        std::optional<SavedGame> load() override;

      private:
        PersistentStorage *storage;
        int offset;
};
