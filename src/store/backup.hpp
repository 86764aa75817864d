#pragma once

#include "store/database.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace dashstore::store {

struct BackupInfo {
    std::string filename;
    std::string path;
    uint64_t size = 0;
    int64_t modified = 0;       // Unix seconds
};

// Pre-migration copies in <dir>/dashstore-v<version>-<timestamp>.db
class BackupManager {
public:
    static constexpr uint32_t DEFAULT_MAX_BACKUPS = 3;

    BackupManager(std::string directory, uint32_t max_backups = DEFAULT_MAX_BACKUPS)
        : directory_(std::move(directory)), max_backups_(max_backups) {}

    const std::string& directory() const { return directory_; }

    // Copy the database and prune; returns the backup path
    std::expected<std::string, DbError> create(Database& db, int version);

    // Backups in the directory, newest first
    std::vector<BackupInfo> list() const;

    // Delete all but the newest max_backups; returns how many were removed
    size_t prune() const;

    static std::string make_filename(int version, int64_t unix_ms);

private:
    std::string directory_;
    uint32_t max_backups_;
};

} // namespace dashstore::store
