#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace dashstore {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Migration host configuration
// ============================================================================

struct MigrateConfig {
    struct DatabaseConfig {
        std::string path = "dashstore.db";
        std::string backup_dir;         // Empty = "<db dir>/backups"
        bool backup = true;             // Copy the database before pending units run
        uint32_t max_backups = 3;       // Newest backups kept after pruning
    } database;

    struct EncryptionConfig {
        std::string mode = "encrypted"; // "encrypted" or "plaintext"
        std::string key;                // 64 hex chars; empty = plaintext fallback
    } encryption;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Resolved backup directory (backup_dir or "<db dir>/backups")
    std::string backup_directory() const;

    // Environment overrides:
    //   DASHSTORE_DB_PATH       database.path
    //   DASHSTORE_ENV           "development" forces plaintext mode
    //   SECRET_ENCRYPTION_KEY   encryption.key
    void apply_env();

    // Load from JSON file
    static std::expected<MigrateConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<MigrateConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace dashstore
