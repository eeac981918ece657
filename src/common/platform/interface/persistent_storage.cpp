#include "persistent_storage.hpp"

#define TAG "storage"

bool PersistentStorage::ensure_exists()
{
        std::ifstream existing(path, std::ios::in | std::ios::binary);
        if (existing.is_open()) {
                return true;
        }

        LOG_INFO(TAG, "Creating storage file %s.", path.c_str());
        std::ofstream created(path, std::ios::out | std::ios::binary);
        if (!created.is_open()) {
                LOG_ERROR(TAG, "Unable to create storage file %s.",
                          path.c_str());
                return false;
        }
        return true;
}
