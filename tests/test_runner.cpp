#include <gtest/gtest.h>
#include "store/runner.hpp"
#include "store/backup.hpp"
#include "store/migrations/units.hpp"
#include "test_helpers.hpp"
#include <fstream>

using namespace dashstore;
using namespace dashstore::store;

namespace {

// Unit running fixed SQL; reversible when down_sql is given
Migration sql_unit(int version, std::string name, std::string up_sql, std::string down_sql = {}) {
    Migration unit{version, std::move(name),
        [up_sql](MigrationContext& ctx) -> std::expected<UnitReport, MigrationError> {
            if (auto result = ctx.exec(up_sql); !result) {
                return std::unexpected(result.error());
            }
            return UnitReport{};
        },
        {}};
    if (!down_sql.empty()) {
        unit.down = [down_sql](MigrationContext& ctx) -> std::expected<UnitReport, MigrationError> {
            if (auto result = ctx.exec(down_sql); !result) {
                return std::unexpected(result.error());
            }
            return UnitReport{};
        };
    }
    return unit;
}

std::vector<Migration> three_tables() {
    return {
        sql_unit(1, "create_a", "CREATE TABLE IF NOT EXISTS a (id INTEGER PRIMARY KEY)", "DROP TABLE IF EXISTS a"),
        sql_unit(2, "create_b", "CREATE TABLE IF NOT EXISTS b (id INTEGER PRIMARY KEY)", "DROP TABLE IF EXISTS b"),
        sql_unit(3, "create_c", "CREATE TABLE IF NOT EXISTS c (id INTEGER PRIMARY KEY)", "DROP TABLE IF EXISTS c"),
    };
}

Registry make_registry(std::vector<Migration> units) {
    auto registry = Registry::create(std::move(units));
    EXPECT_TRUE(registry.has_value());
    return std::move(*registry);
}

}  // anonymous namespace

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:").has_value());
    }

    bool has_table(const std::string& name) {
        return db_.table_exists(name).value_or(false);
    }

    Database db_;
    ConfigCipher cipher_ = ConfigCipher::plaintext();
};

TEST_F(RunnerTest, AppliesPendingInVersionOrder) {
    std::vector<int> order;
    auto recording = [&order](int version, std::string name) {
        return Migration{version, std::move(name),
            [&order, version](MigrationContext& ctx) -> std::expected<UnitReport, MigrationError> {
                EXPECT_EQ(ctx.version(), version);
                order.push_back(version);
                return UnitReport{};
            },
            {}};
    };

    auto registry = make_registry({recording(3, "third"), recording(1, "first"), recording(2, "second")});
    MigrationRunner runner(registry, cipher_);

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value()) << summary.error().to_string();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(summary->applied, 3);
    EXPECT_EQ(summary->from_version, 0);
    EXPECT_EQ(summary->to_version, 3);

    auto history = runner.history(db_);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 3u);
    EXPECT_EQ((*history)[0].name, "first");
    EXPECT_EQ((*history)[2].name, "third");
}

TEST_F(RunnerTest, RerunChangesNothing) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    ASSERT_TRUE(runner.run(db_).has_value());
    auto before = test::dump(db_);

    auto again = runner.run(db_);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->applied, 0);
    EXPECT_EQ(again->from_version, 3);
    EXPECT_EQ(again->to_version, 3);
    EXPECT_EQ(test::dump(db_), before);
}

TEST_F(RunnerTest, LedgerRecordsApplyTime) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto start = Ledger::now_seconds();
    ASSERT_TRUE(runner.run(db_).has_value());
    auto end = Ledger::now_seconds();

    for (const auto& entry : runner.history(db_).value()) {
        EXPECT_GE(entry.applied_at, start);
        EXPECT_LE(entry.applied_at, end);
    }
}

TEST_F(RunnerTest, StatusOnEmptyDatabase) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto status = runner.status(db_);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->current_version, 0);
    EXPECT_EQ(status->latest_version, 3);
    EXPECT_EQ(status->pending, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(status->needs_migration());
    EXPECT_FALSE(status->downgrade);

    // Status is read only
    EXPECT_FALSE(has_table(Ledger::TABLE));
}

TEST_F(RunnerTest, RunToStopsAtTarget) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto partial = runner.run_to(db_, 2);
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->applied, 2);
    EXPECT_TRUE(has_table("b"));
    EXPECT_FALSE(has_table("c"));
    EXPECT_EQ(runner.status(db_)->pending, std::vector<int>{3});

    auto rest = runner.run(db_);
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->applied, 1);
    EXPECT_EQ(rest->from_version, 2);
    EXPECT_TRUE(has_table("c"));
}

TEST_F(RunnerTest, RunToRejectsOutOfRangeTarget) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto above = runner.run_to(db_, 4);
    ASSERT_FALSE(above.has_value());
    EXPECT_EQ(above.error().kind, MigrationErrorKind::InvalidTarget);

    auto below = runner.run_to(db_, -1);
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().kind, MigrationErrorKind::InvalidTarget);

    EXPECT_FALSE(has_table(Ledger::TABLE));
}

TEST_F(RunnerTest, RunToZeroOnlyCreatesLedger) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto summary = runner.run_to(db_, 0);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 0);
    EXPECT_TRUE(has_table(Ledger::TABLE));
    EXPECT_FALSE(has_table("a"));
}

TEST_F(RunnerTest, DowngradeIsFatal) {
    Ledger ledger(db_);
    ASSERT_TRUE(ledger.ensure_table().has_value());
    ASSERT_TRUE(ledger.record(7, "from_the_future", 0).has_value());

    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_, RunnerOptions{"/srv/dashstore/backups", 3});

    auto summary = runner.run(db_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().kind, MigrationErrorKind::Downgrade);
    EXPECT_EQ(summary.error().version, 7);
    EXPECT_NE(summary.error().message.find("v7"), std::string::npos);
    EXPECT_NE(summary.error().message.find("v3"), std::string::npos);
    EXPECT_NE(summary.error().message.find("/srv/dashstore/backups"), std::string::npos);

    // Nothing ran
    EXPECT_FALSE(has_table("a"));
    EXPECT_TRUE(runner.status(db_)->downgrade);
}

TEST_F(RunnerTest, FailureStopsTheRun) {
    auto units = three_tables();
    units[1] = sql_unit(2, "broken", "CREATE TABLE b (id INTEGER PRIMARY KEY");

    auto broken = make_registry(units);
    MigrationRunner runner(broken, cipher_);

    auto summary = runner.run(db_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().kind, MigrationErrorKind::Structural);
    EXPECT_EQ(summary.error().version, 2);

    Ledger ledger(db_);
    EXPECT_EQ(ledger.applied_versions().value(), std::set<int>{1});
    EXPECT_FALSE(has_table("c"));

    // A fixed build picks up where the failed run stopped
    auto fixed = make_registry(three_tables());
    MigrationRunner retry(fixed, cipher_);
    auto resumed = retry.run(db_);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->applied, 2);
    EXPECT_EQ(resumed->from_version, 1);
    EXPECT_TRUE(has_table("c"));
}

TEST_F(RunnerTest, GapBelowCurrentVersionIsApplied) {
    auto registry = make_registry(three_tables());
    Ledger ledger(db_);
    ASSERT_TRUE(ledger.ensure_table().has_value());
    ASSERT_TRUE(ledger.record(1, "create_a", 0).has_value());
    ASSERT_TRUE(ledger.record(3, "create_c", 0).has_value());

    MigrationRunner runner(registry, cipher_);
    auto status = runner.status(db_);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->current_version, 3);
    EXPECT_EQ(status->pending, std::vector<int>{2});
    ASSERT_EQ(status->warnings.size(), 1u);
    EXPECT_NE(status->warnings[0].find("pending below"), std::string::npos);

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 1);
    EXPECT_TRUE(has_table("b"));
    EXPECT_FALSE(has_table("c"));
}

TEST_F(RunnerTest, NameMismatchIsWarningOnly) {
    Ledger ledger(db_);
    ASSERT_TRUE(ledger.ensure_table().has_value());
    ASSERT_TRUE(ledger.record(1, "old_name", 0).has_value());

    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);

    auto status = runner.status(db_);
    ASSERT_TRUE(status.has_value());
    ASSERT_EQ(status->warnings.size(), 1u);
    EXPECT_NE(status->warnings[0].find("'old_name'"), std::string::npos);
    EXPECT_NE(status->warnings[0].find("'create_a'"), std::string::npos);

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 2);
    EXPECT_FALSE(has_table("a"));
}

TEST_F(RunnerTest, UnknownLedgerVersionIsWarningOnly) {
    Ledger ledger(db_);
    ASSERT_TRUE(ledger.ensure_table().has_value());
    ASSERT_TRUE(ledger.record(2, "retired", 0).has_value());

    auto registry = make_registry({three_tables()[0], three_tables()[2]});
    MigrationRunner runner(registry, cipher_);

    auto status = runner.status(db_);
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->downgrade);
    bool found = false;
    for (const auto& warning : status->warnings) {
        found = found || warning.find("not registered") != std::string::npos;
    }
    EXPECT_TRUE(found);

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 2);
}

TEST_F(RunnerTest, SummaryAggregatesRowCounts) {
    auto counting = Migration{1, "counting",
        [](MigrationContext&) -> std::expected<UnitReport, MigrationError> {
            UnitReport report;
            report.record({"t", "1", RowStatus::Changed, {}});
            report.record({"t", "2", RowStatus::Changed, {}});
            report.record({"t", "3", RowStatus::Skipped, "bad payload"});
            report.record({"t", "4", RowStatus::Unchanged, {}});
            return report;
        },
        {}};

    auto registry = make_registry({counting});
    MigrationRunner runner(registry, cipher_);
    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->rows_changed, 2);
    EXPECT_EQ(summary->rows_skipped, 1);
}

TEST_F(RunnerTest, InMemoryDatabaseTakesNoBackup) {
    test::TempDir dir;
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_, RunnerOptions{dir.file("backups"), 3});

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_FALSE(summary->backup_path.has_value());
    EXPECT_TRUE(BackupManager(dir.file("backups")).list().empty());
}

TEST_F(RunnerTest, FileDatabaseBackedUpBeforePendingUnits) {
    test::TempDir dir;
    Database db;
    ASSERT_TRUE(db.open(dir.file("dashstore.db")).has_value());

    auto first = make_registry({three_tables()[0]});
    MigrationRunner first_runner(first, cipher_, RunnerOptions{dir.file("backups"), 3});
    auto summary = first_runner.run(db);
    ASSERT_TRUE(summary.has_value());
    ASSERT_TRUE(summary->backup_path.has_value());
    EXPECT_NE(summary->backup_path->find("dashstore-v0-"), std::string::npos);

    // Backup holds the pre-migration state
    {
        Database copy;
        ASSERT_TRUE(copy.open(*summary->backup_path).has_value());
        EXPECT_FALSE(copy.table_exists("a").value());
    }

    // Nothing pending, no backup
    auto idle = first_runner.run(db);
    ASSERT_TRUE(idle.has_value());
    EXPECT_FALSE(idle->backup_path.has_value());

    auto second = make_registry(three_tables());
    MigrationRunner second_runner(second, cipher_, RunnerOptions{dir.file("backups"), 3});
    auto upgrade = second_runner.run(db);
    ASSERT_TRUE(upgrade.has_value());
    ASSERT_TRUE(upgrade->backup_path.has_value());
    EXPECT_NE(upgrade->backup_path->find("dashstore-v1-"), std::string::npos);
    EXPECT_EQ(BackupManager(dir.file("backups")).list().size(), 2u);
}

TEST_F(RunnerTest, BackupFailureDoesNotBlockRun) {
    test::TempDir dir;
    Database db;
    ASSERT_TRUE(db.open(dir.file("dashstore.db")).has_value());
    std::ofstream(dir.path() / "blocked") << "file in the way";

    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_, RunnerOptions{(dir.path() / "blocked" / "backups").string(), 3});
    auto summary = runner.run(db);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 3);
    EXPECT_FALSE(summary->backup_path.has_value());
}

TEST_F(RunnerTest, RollbackRevertsNewestFirst) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);
    ASSERT_TRUE(runner.run(db_).has_value());

    auto reverted = runner.rollback_to(db_, 1);
    ASSERT_TRUE(reverted.has_value());
    EXPECT_EQ(*reverted, 2);
    EXPECT_TRUE(has_table("a"));
    EXPECT_FALSE(has_table("b"));
    EXPECT_FALSE(has_table("c"));
    EXPECT_EQ(Ledger(db_).current_version().value(), 1);

    // Forward again restores the same schema
    ASSERT_TRUE(runner.run(db_).has_value());
    EXPECT_TRUE(has_table("c"));
}

TEST_F(RunnerTest, RollbackRefusesForwardOnlyUnits) {
    auto units = three_tables();
    units[1].down = nullptr;
    auto registry = make_registry(units);
    MigrationRunner runner(registry, cipher_);
    ASSERT_TRUE(runner.run(db_).has_value());
    auto before = test::dump(db_);

    auto reverted = runner.rollback_to(db_, 0);
    ASSERT_FALSE(reverted.has_value());
    EXPECT_EQ(reverted.error().kind, MigrationErrorKind::Unsupported);
    EXPECT_EQ(reverted.error().version, 2);

    // Checked before anything is reverted
    EXPECT_EQ(test::dump(db_), before);
}

TEST_F(RunnerTest, RollbackRejectsOutOfRangeTarget) {
    auto registry = make_registry(three_tables());
    MigrationRunner runner(registry, cipher_);
    EXPECT_EQ(runner.rollback_to(db_, 9).error().kind, MigrationErrorKind::InvalidTarget);
    EXPECT_EQ(runner.rollback_to(db_, -2).error().kind, MigrationErrorKind::InvalidTarget);
}

// ============================================================================
// Shipped units
// ============================================================================

class BuiltinRunTest : public RunnerTest {
protected:
    void SetUp() override {
        RunnerTest::SetUp();
        auto registry = migrations::builtin_registry();
        ASSERT_TRUE(registry.has_value());
        registry_.emplace(std::move(*registry));
    }

    std::optional<Registry> registry_;
};

TEST_F(BuiltinRunTest, FreshDatabaseReachesLatest) {
    MigrationRunner runner(*registry_, cipher_);
    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value()) << summary.error().to_string();
    EXPECT_EQ(summary->applied, 18);
    EXPECT_EQ(summary->to_version, 18);
    EXPECT_EQ(summary->rows_skipped, 0);

    for (const char* table : {"users", "sessions", "user_preferences", "system_config", "custom_icons",
                              "dashboard_templates", "dashboard_backups", "integration_instances",
                              "integration_shares", "service_monitors", "service_monitor_history",
                              "media_library", "library_sync_status", "media_library_fts"}) {
        EXPECT_TRUE(has_table(table)) << table;
    }
    EXPECT_TRUE(db_.column_exists("users", "has_local_password").value());
    EXPECT_TRUE(db_.column_exists("integration_shares", "integration_instance_id").value());
    EXPECT_FALSE(db_.index_exists("idx_integration_shares_unique").value());
    EXPECT_TRUE(db_.index_exists("idx_integration_shares_instance_unique").value());
    EXPECT_EQ(test::query_text(db_, "SELECT value FROM system_config WHERE key = 'appName'"), "\"Dashstore\"");

    auto status = runner.status(db_);
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->needs_migration());
    EXPECT_TRUE(status->warnings.empty());
}

TEST_F(BuiltinRunTest, SecondRunIsByteIdentical) {
    MigrationRunner runner(*registry_, cipher_);
    ASSERT_TRUE(runner.run(db_).has_value());
    auto before = test::dump(db_);

    auto again = runner.run(db_);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->applied, 0);
    EXPECT_EQ(test::dump(db_), before);
}

TEST_F(BuiltinRunTest, MediaLibraryRollsBack) {
    MigrationRunner runner(*registry_, cipher_);
    ASSERT_TRUE(runner.run_to(db_, 17).has_value());
    ASSERT_TRUE(has_table("media_library"));

    auto reverted = runner.rollback_to(db_, 16);
    ASSERT_TRUE(reverted.has_value()) << reverted.error().to_string();
    EXPECT_EQ(*reverted, 1);
    EXPECT_FALSE(has_table("media_library"));
    EXPECT_FALSE(has_table("media_library_fts"));
    EXPECT_FALSE(has_table("library_sync_status"));

    auto summary = runner.run(db_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->applied, 2);
    EXPECT_TRUE(has_table("media_library"));
}

TEST_F(BuiltinRunTest, ForwardOnlyUnitsBlockRollback) {
    MigrationRunner runner(*registry_, cipher_);
    ASSERT_TRUE(runner.run(db_).has_value());

    auto reverted = runner.rollback_to(db_, 16);
    ASSERT_FALSE(reverted.has_value());
    EXPECT_EQ(reverted.error().kind, MigrationErrorKind::Unsupported);
    EXPECT_EQ(reverted.error().version, 18);
    EXPECT_TRUE(has_table("media_library"));
}
