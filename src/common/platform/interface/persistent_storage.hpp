#pragma once

#include <fstream>
#include <string>

#include "../../logging.hpp"

/**
 * Byte-addressed persistent storage. Games reserve a fixed offset each (see
 * `get_settings_storage_offsets`) and read/write plain structs at that
 * offset. The desktop implementation keeps everything in a single binary
 * file; regions that were never written read back as zeroes, which the
 * callers treat as 'nothing saved yet'.
 *
 * Both operations report failures by returning false and logging a warning,
 * they never throw.
 */
class PersistentStorage
{
      public:
        PersistentStorage() : path("tilebox_storage.bin") {}
        explicit PersistentStorage(std::string path) : path(path) {}

        template <typename T> bool get(int offset, T &value)
        {
                std::ifstream file(path, std::ios::in | std::ios::binary);
                if (!file.is_open()) {
                        LOG_DEBUG("storage", "Storage file %s does not exist.",
                                  path.c_str());
                        value = T{};
                        return false;
                }

                file.seekg(0, std::ios::end);
                std::streamoff file_size = file.tellg();
                if (file_size < offset + (std::streamoff)sizeof(T)) {
                        LOG_DEBUG("storage",
                                  "Nothing stored at offset %d (file size "
                                  "%lld).",
                                  offset, (long long)file_size);
                        value = T{};
                        return false;
                }

                file.seekg(offset, std::ios::beg);
                file.read(reinterpret_cast<char *>(&value), sizeof(T));
                if (!file) {
                        LOG_WARN("storage",
                                 "Failed to read %zu bytes at offset %d from "
                                 "%s.",
                                 sizeof(T), offset, path.c_str());
                        value = T{};
                        return false;
                }
                return true;
        }

        template <typename T> bool put(int offset, const T &value)
        {
                if (!ensure_exists()) {
                        return false;
                }

                std::fstream file(path, std::ios::in | std::ios::out |
                                            std::ios::binary);
                if (!file.is_open()) {
                        LOG_WARN("storage", "Unable to open %s for writing.",
                                 path.c_str());
                        return false;
                }

                // Writing past the end of the file would leave a hole that
                // some platforms do not zero-fill, pad it explicitly.
                file.seekp(0, std::ios::end);
                std::streamoff file_size = file.tellp();
                for (std::streamoff i = file_size; i < offset; i++) {
                        file.put(0);
                }

                file.seekp(offset, std::ios::beg);
                file.write(reinterpret_cast<const char *>(&value), sizeof(T));
                file.flush();
                if (!file) {
                        LOG_WARN("storage",
                                 "Failed to write %zu bytes at offset %d to "
                                 "%s.",
                                 sizeof(T), offset, path.c_str());
                        return false;
                }
                return true;
        }

        const std::string &get_path() const { return path; }

      private:
        std::string path;

        bool ensure_exists();
};
