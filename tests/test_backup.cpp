#include <gtest/gtest.h>
#include "store/backup.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

using namespace dashstore;
using namespace dashstore::store;
namespace fs = std::filesystem;

class BackupTest : public ::testing::Test {
protected:
    // Backup-named file with an explicit mtime offset (seconds)
    std::string make_backup_file(int version, int64_t unix_ms, int age_seconds) {
        auto path = dir_.path() / BackupManager::make_filename(version, unix_ms);
        std::ofstream(path) << "backup " << version;
        fs::last_write_time(path, fs::file_time_type::clock::now() - std::chrono::seconds(age_seconds));
        return path.filename().string();
    }

    test::TempDir dir_;
};

TEST_F(BackupTest, MakeFilename) {
    EXPECT_EQ(BackupManager::make_filename(7, 0), "dashstore-v7-1970-01-01T00-00-00-000Z.db");
    EXPECT_EQ(BackupManager::make_filename(12, 1700000000123), "dashstore-v12-2023-11-14T22-13-20-123Z.db");
}

TEST_F(BackupTest, ListMissingDirectory) {
    BackupManager backups(dir_.file("nowhere"));
    EXPECT_TRUE(backups.list().empty());
}

TEST_F(BackupTest, ListNewestFirstAndIgnoresOtherFiles) {
    auto oldest = make_backup_file(1, 1000, 300);
    auto middle = make_backup_file(2, 2000, 200);
    auto newest = make_backup_file(3, 3000, 100);
    std::ofstream(dir_.path() / "notes.txt") << "x";
    std::ofstream(dir_.path() / "other.db") << "x";

    BackupManager backups(dir_.path().string());
    auto list = backups.list();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].filename, newest);
    EXPECT_EQ(list[1].filename, middle);
    EXPECT_EQ(list[2].filename, oldest);
    EXPECT_GT(list[0].size, 0u);
}

TEST_F(BackupTest, ListSkipsHandCopiedFilesWithEqualMtime) {
    auto same_time = fs::file_time_type::clock::now() - std::chrono::seconds(60);
    std::vector<std::string> names = {
        BackupManager::make_filename(3, 1704067200000),
        BackupManager::make_filename(4, 1704067201000),
        "dashstore-manual.db",
        "dashstore-vX-2024.db",
        "dashstore-v5-.db",
    };
    for (const auto& name : names) {
        std::ofstream(dir_.path() / name) << "x";
        fs::last_write_time(dir_.path() / name, same_time);
    }

    BackupManager backups(dir_.path().string(), 1);
    auto list = backups.list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].filename, names[1]);
    EXPECT_EQ(list[1].filename, names[0]);

    EXPECT_EQ(backups.prune(), 1u);
    EXPECT_TRUE(fs::exists(dir_.path() / names[1]));
    EXPECT_FALSE(fs::exists(dir_.path() / names[0]));
    EXPECT_TRUE(fs::exists(dir_.path() / "dashstore-manual.db"));
}

TEST_F(BackupTest, PruneKeepsNewest) {
    for (int i = 0; i < 5; ++i) {
        make_backup_file(i, 1000 * (i + 1), 500 - 100 * i);
    }

    BackupManager backups(dir_.path().string(), 3);
    EXPECT_EQ(backups.prune(), 2u);

    auto list = backups.list();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].filename, BackupManager::make_filename(4, 5000));
    EXPECT_EQ(list[2].filename, BackupManager::make_filename(2, 3000));
}

TEST_F(BackupTest, CreateCopiesDatabase) {
    Database db;
    ASSERT_TRUE(db.open(dir_.file("app.db")).has_value());
    test::exec(db, "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT); "
                   "INSERT INTO items (name) VALUES ('a'), ('b');");

    BackupManager backups(dir_.file("backups"));
    auto path = backups.create(db, 4);
    ASSERT_TRUE(path.has_value()) << path.error().to_string();
    EXPECT_TRUE(fs::exists(*path));
    EXPECT_NE(path->find("dashstore-v4-"), std::string::npos);

    Database copy;
    ASSERT_TRUE(copy.open(*path).has_value());
    EXPECT_EQ(copy.count_rows("items").value(), 2);
}

TEST_F(BackupTest, CreatePrunesOldBackups) {
    Database db;
    ASSERT_TRUE(db.open(dir_.file("app.db")).has_value());

    auto backup_dir = dir_.path() / "backups";
    fs::create_directories(backup_dir);
    for (int i = 0; i < 3; ++i) {
        auto path = backup_dir / BackupManager::make_filename(i, 1000 * (i + 1));
        std::ofstream(path) << "old";
        fs::last_write_time(path, fs::file_time_type::clock::now() - std::chrono::hours(1 + i));
    }

    BackupManager backups(backup_dir.string(), 2);
    auto path = backups.create(db, 9);
    ASSERT_TRUE(path.has_value());

    auto list = backups.list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].path, *path);
}

TEST_F(BackupTest, CreateFailsWhenDirectoryUnusable) {
    Database db;
    ASSERT_TRUE(db.open(dir_.file("app.db")).has_value());
    std::ofstream(dir_.path() / "plain") << "not a directory";

    BackupManager backups((dir_.path() / "plain" / "backups").string());
    auto path = backups.create(db, 1);
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, DbErrorCode::BACKUP_FAILED);
}
