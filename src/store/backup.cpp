#include "store/backup.hpp"
#include "common/log.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string_view>

namespace fs = std::filesystem;

namespace dashstore::store {

namespace {

constexpr std::string_view BACKUP_PREFIX = "dashstore-";
constexpr std::string_view BACKUP_SUFFIX = ".db";

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// "dashstore-v<N>-<stamp>.db" -> "<stamp>"; nullopt for any other name
std::optional<std::string_view> backup_stamp(std::string_view name) {
    if (!name.starts_with(BACKUP_PREFIX) || !name.ends_with(BACKUP_SUFFIX)) {
        return std::nullopt;
    }
    name.remove_prefix(BACKUP_PREFIX.size());
    name.remove_suffix(BACKUP_SUFFIX.size());
    if (!name.starts_with('v')) {
        return std::nullopt;
    }
    name.remove_prefix(1);

    auto dash = name.find('-');
    if (dash == 0 || dash == std::string_view::npos || dash + 1 == name.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < dash; ++i) {
        if (name[i] < '0' || name[i] > '9') {
            return std::nullopt;
        }
    }
    return name.substr(dash + 1);
}

int64_t to_unix_seconds(fs::file_time_type t) {
    auto sys = fs::file_time_type::clock::to_sys(t);
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

}  // anonymous namespace

std::string BackupManager::make_filename(int version, int64_t unix_ms) {
    std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%S", &tm);
    return fmt::format("{}v{}-{}-{:03}Z{}", BACKUP_PREFIX, version, stamp, unix_ms % 1000, BACKUP_SUFFIX);
}

std::expected<std::string, DbError> BackupManager::create(Database& db, int version) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(DbError{DbErrorCode::BACKUP_FAILED,
            "cannot create " + directory_ + ": " + ec.message()});
    }

    auto path = (fs::path(directory_) / make_filename(version, now_ms())).string();
    if (auto result = db.backup_to(path); !result) {
        fs::remove(path, ec);
        return std::unexpected(result.error());
    }

    NLOG_INFO(log::MIGRATE_LOGGER, "Backup created: {}", path);
    prune();
    return path;
}

std::vector<BackupInfo> BackupManager::list() const {
    std::vector<BackupInfo> backups;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return backups;
    }

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        auto name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !backup_stamp(name)) {
            continue;
        }

        BackupInfo info;
        info.filename = name;
        info.path = entry.path().string();
        info.size = entry.file_size(ec);
        info.modified = to_unix_seconds(entry.last_write_time(ec));
        backups.push_back(std::move(info));
    }

    // Newest first; names carry a sortable timestamp for equal mtimes
    std::sort(backups.begin(), backups.end(), [](const BackupInfo& a, const BackupInfo& b) {
        if (a.modified != b.modified) return a.modified > b.modified;
        auto stamp_a = backup_stamp(a.filename).value_or(std::string_view{});
        auto stamp_b = backup_stamp(b.filename).value_or(std::string_view{});
        if (stamp_a != stamp_b) return stamp_a > stamp_b;
        return a.filename > b.filename;
    });
    return backups;
}

size_t BackupManager::prune() const {
    auto backups = list();
    size_t removed = 0;

    for (size_t i = max_backups_; i < backups.size(); ++i) {
        std::error_code ec;
        if (fs::remove(backups[i].path, ec)) {
            NLOG_DEBUG(log::MIGRATE_LOGGER, "Deleted old backup: {}", backups[i].filename);
            ++removed;
        } else {
            NLOG_WARN(log::MIGRATE_LOGGER, "Failed to delete old backup {}: {}",
                      backups[i].filename, ec ? ec.message() : "not found");
        }
    }
    return removed;
}

} // namespace dashstore::store
