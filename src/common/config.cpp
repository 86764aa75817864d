#include "common/config.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace dashstore {

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::string MigrateConfig::backup_directory() const {
    if (!database.backup_dir.empty()) {
        return database.backup_dir;
    }
    auto parent = std::filesystem::path(database.path).parent_path();
    return (parent / "backups").string();
}

void MigrateConfig::apply_env() {
    if (const char* path = std::getenv("DASHSTORE_DB_PATH"); path && *path) {
        database.path = path;
    }
    if (const char* env = std::getenv("DASHSTORE_ENV"); env && std::string_view(env) == "development") {
        encryption.mode = "plaintext";
    }
    if (const char* key = std::getenv("SECRET_ENCRYPTION_KEY"); key && *key) {
        encryption.key = key;
    }
}

std::expected<MigrateConfig, ConfigError> MigrateConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<MigrateConfig, ConfigError> MigrateConfig::parse(const std::string& json_content) {
    boost::system::error_code ec;
    auto jv = json::parse(json_content, ec);
    if (ec || !jv.is_object()) {
        NLOG_ERROR(log::MAIN_LOGGER, "Config parse error: {}", ec ? ec.message() : "root is not an object");
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
    const auto& root = jv.as_object();

    MigrateConfig config;

    // database section
    if (auto* db = jsection(root, "database")) {
        config.database.path = jstr(*db, "path", config.database.path);
        config.database.backup_dir = jstr(*db, "backup_dir", config.database.backup_dir);
        config.database.backup = jbool(*db, "backup", config.database.backup);

        auto max_backups = jint(*db, "max_backups", config.database.max_backups);
        if (max_backups < 1 || max_backups > static_cast<int64_t>(UINT32_MAX)) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        config.database.max_backups = static_cast<uint32_t>(max_backups);
    }

    if (config.database.path.empty()) {
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }

    // encryption section
    if (auto* enc = jsection(root, "encryption")) {
        config.encryption.mode = jstr(*enc, "mode", config.encryption.mode);
        config.encryption.key = jstr(*enc, "key", config.encryption.key);
    }
    if (config.encryption.mode != "encrypted" && config.encryption.mode != "plaintext") {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    // log section
    if (auto* log_sec = jsection(root, "log")) {
        config.log_level = jstr(*log_sec, "level", config.log_level);
        config.log_file = jstr(*log_sec, "file", config.log_file);
    }

    return config;
}

} // namespace dashstore
