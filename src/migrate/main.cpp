#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"
#include "store/backup.hpp"
#include "store/config_cipher.hpp"
#include "store/database.hpp"
#include "store/migrations/units.hpp"
#include "store/runner.hpp"
#include <charconv>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace dashstore;
using namespace dashstore::store;

void print_usage(const char* prog) {
    std::cout << "Dashstore schema migrations\n\n"
              << "Usage:\n"
              << "  " << prog << " [options] [command]\n\n"
              << "Commands:\n"
              << "  run [--to <version>]      Apply pending migrations (default)\n"
              << "  status                    Show current and pending versions\n"
              << "  history                   List applied migrations\n"
              << "  backups                   List pre-migration backups\n"
              << "  rollback --to <version>   Revert migrations above version\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file\n"
              << "  -d, --database <file> Database path (overrides config)\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Environment:\n"
              << "  DASHSTORE_DB_PATH, DASHSTORE_ENV, SECRET_ENCRYPTION_KEY,\n"
              << "  DASHSTORE_LOG_LEVEL, DASHSTORE_LOG_FILE\n"
              << std::endl;
}

static std::optional<int> parse_version(const std::string& text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

static std::string format_time(int64_t unix_seconds) {
    std::time_t secs = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static int report_error(const MigrationError& error) {
    NLOG_ERROR(log::MAIN_LOGGER, "{}", error.to_string());
    std::cerr << "Error: " << error.to_string() << "\n";
    return 1;
}

static int cmd_run(MigrationRunner& runner, Database& db, std::optional<int> target) {
    auto summary = target ? runner.run_to(db, *target) : runner.run(db);
    if (!summary) {
        return report_error(summary.error());
    }

    if (summary->applied == 0) {
        std::cout << "Database is up to date (version " << summary->to_version << ")\n";
        return 0;
    }
    std::cout << "Applied " << summary->applied << " migrations: v" << summary->from_version
              << " -> v" << summary->to_version << "\n"
              << "  rows changed: " << summary->rows_changed << "\n"
              << "  rows skipped: " << summary->rows_skipped << "\n";
    if (summary->backup_path) {
        std::cout << "  backup: " << *summary->backup_path << "\n";
    }
    return 0;
}

static int cmd_status(MigrationRunner& runner, Database& db) {
    auto status = runner.status(db);
    if (!status) {
        return report_error(status.error());
    }

    std::cout << "Current version: " << status->current_version << "\n"
              << "Latest version:  " << status->latest_version << "\n";
    if (status->downgrade) {
        std::cout << "Database is newer than this build; restore a backup or upgrade\n";
    }
    if (status->pending.empty()) {
        std::cout << "No pending migrations\n";
    } else {
        std::cout << "Pending:";
        for (int v : status->pending) {
            std::cout << " " << v;
        }
        std::cout << "\n";
    }
    for (const auto& warning : status->warnings) {
        std::cout << "Warning: " << warning << "\n";
    }
    return status->downgrade ? 1 : 0;
}

static int cmd_history(MigrationRunner& runner, Database& db) {
    auto history = runner.history(db);
    if (!history) {
        return report_error(history.error());
    }
    if (history->empty()) {
        std::cout << "No migrations applied\n";
        return 0;
    }
    for (const auto& entry : *history) {
        std::cout << fmt::format("{:>4}  {:<40}  {}\n", entry.version, entry.name, format_time(entry.applied_at));
    }
    return 0;
}

static int cmd_backups(const MigrateConfig& config) {
    BackupManager backups(config.backup_directory(), config.database.max_backups);
    auto list = backups.list();
    if (list.empty()) {
        std::cout << "No backups in " << backups.directory() << "\n";
        return 0;
    }
    for (const auto& info : list) {
        std::cout << fmt::format("{:<50}  {:>10}  {}\n", info.filename, info.size, format_time(info.modified));
    }
    return 0;
}

static int cmd_rollback(MigrationRunner& runner, Database& db, std::optional<int> target) {
    if (!target) {
        std::cerr << "Error: rollback requires --to <version>\n";
        return 1;
    }
    auto reverted = runner.rollback_to(db, *target);
    if (!reverted) {
        return report_error(reverted.error());
    }
    std::cout << "Reverted " << *reverted << " migrations, now at version " << *target << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string db_override;
    bool quiet = false;
    std::string command = "run";
    std::optional<int> target;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) config_file = argv[++i];
        } else if (arg == "-d" || arg == "--database") {
            if (i + 1 < argc) db_override = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--to") {
            if (i + 1 >= argc || !(target = parse_version(argv[++i]))) {
                std::cerr << "Error: --to expects a non-negative version number\n";
                return 1;
            }
        } else if (arg[0] != '-') {
            command = arg;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    MigrateConfig config;
    if (!config_file.empty()) {
        auto loaded = MigrateConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: Failed to load configuration from '" << config_file
                      << "': " << config_error_message(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);

        // Relative database path is relative to the config file
        std::filesystem::path db_path = config.database.path;
        if (db_path.is_relative()) {
            db_path = std::filesystem::absolute(config_file).parent_path() / db_path;
            config.database.path = db_path.string();
        }
    }
    config.apply_env();
    if (!db_override.empty()) {
        config.database.path = db_override;
    }

    // Initialize logging
    log::LogConfig log_config;
    log_config.level = quiet ? log::Level::Off : log::parse_level(config.log_level);
    log_config.file_path = config.log_file;
    if (!quiet) {
        log::apply_env(log_config);
    }
    log::init(log_config);

    if (command == "backups") {
        return cmd_backups(config);
    }
    if (command != "run" && command != "status" && command != "history" && command != "rollback") {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!crypto::init()) {
        std::cerr << "Error: Failed to initialize crypto library\n";
        return 1;
    }

    auto registry = migrations::builtin_registry();
    if (!registry) {
        return report_error(registry.error());
    }

    Database db;
    if (auto opened = db.open(config.database.path); !opened) {
        NLOG_ERROR(log::MAIN_LOGGER, "{}", opened.error().to_string());
        std::cerr << "Error: Failed to open database '" << config.database.path
                  << "': " << opened.error().to_string() << "\n";
        return 1;
    }
    NLOG_INFO(log::MAIN_LOGGER, "Database: {}", config.database.path);

    auto cipher = ConfigCipher::from_config(config);

    RunnerOptions options;
    if (config.database.backup) {
        options.backup_dir = config.backup_directory();
    }
    options.max_backups = config.database.max_backups;

    MigrationRunner runner(*registry, cipher, options);

    int rc = 0;
    if (command == "run") {
        rc = cmd_run(runner, db, target);
    } else if (command == "status") {
        rc = cmd_status(runner, db);
    } else if (command == "history") {
        rc = cmd_history(runner, db);
    } else {
        rc = cmd_rollback(runner, db, target);
    }

    log::flush();
    return rc;
}
