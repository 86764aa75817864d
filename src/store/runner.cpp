#include "store/runner.hpp"
#include "store/backup.hpp"
#include "common/log.hpp"
#include <algorithm>

namespace dashstore::store {

MigrationRunner::MigrationRunner(const Registry& registry, const ConfigCipher& cipher, RunnerOptions options)
    : registry_(registry), cipher_(cipher), options_(std::move(options)) {}

std::expected<RunSummary, MigrationError> MigrationRunner::run(Database& db) {
    return apply(db, registry_.latest_version());
}

std::expected<RunSummary, MigrationError> MigrationRunner::run_to(Database& db, int target) {
    if (target < 0 || target > registry_.latest_version()) {
        return std::unexpected(MigrationError{MigrationErrorKind::InvalidTarget, 0,
            "target version " + std::to_string(target) + " is outside 0.." +
            std::to_string(registry_.latest_version())});
    }
    return apply(db, target);
}

std::expected<MigrationStatus, MigrationError> MigrationRunner::status(Database& db) {
    Ledger ledger(db);
    auto entries = ledger.entries();
    if (!entries) {
        return std::unexpected(MigrationError::ledger(entries.error()));
    }

    MigrationStatus st;
    st.latest_version = registry_.latest_version();

    std::set<int> applied;
    for (const auto& entry : *entries) {
        applied.insert(entry.version);
        st.current_version = std::max(st.current_version, entry.version);

        const Migration* unit = registry_.find(entry.version);
        if (!unit) {
            if (entry.version <= st.latest_version) {
                st.warnings.push_back("ledger lists version " + std::to_string(entry.version) +
                                      " ('" + entry.name + "') which is not registered");
            }
        } else if (unit->name != entry.name) {
            st.warnings.push_back("version " + std::to_string(entry.version) + " recorded as '" +
                                  entry.name + "' but registered as '" + unit->name + "'");
        }
    }

    for (const auto& unit : registry_.units()) {
        if (!applied.contains(unit.version)) {
            st.pending.push_back(unit.version);
            if (unit.version < st.current_version) {
                st.warnings.push_back("version " + std::to_string(unit.version) +
                                      " is pending below applied version " +
                                      std::to_string(st.current_version));
            }
        }
    }

    st.downgrade = st.current_version > st.latest_version;
    return st;
}

std::expected<std::vector<LedgerEntry>, MigrationError> MigrationRunner::history(Database& db) {
    Ledger ledger(db);
    auto entries = ledger.entries();
    if (!entries) {
        return std::unexpected(MigrationError::ledger(entries.error()));
    }
    return std::move(*entries);
}

std::expected<void, MigrationError> MigrationRunner::check_downgrade(const MigrationStatus& st) const {
    if (!st.downgrade) {
        return {};
    }

    std::string message = "database schema (v" + std::to_string(st.current_version) +
                          ") is newer than this build expects (v" + std::to_string(st.latest_version) +
                          "). Upgrade or restore from a backup.";
    if (!options_.backup_dir.empty()) {
        message += " Backups are stored in: " + options_.backup_dir;
    }
    NLOG_ERROR(log::MIGRATE_LOGGER, "{}", message);
    return std::unexpected(MigrationError{MigrationErrorKind::Downgrade, st.current_version, message});
}

std::optional<std::string> MigrationRunner::take_backup(Database& db, int current_version) {
    if (options_.backup_dir.empty()) {
        return std::nullopt;
    }
    if (db.file_path().empty()) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "In-memory database, no backup taken");
        return std::nullopt;
    }

    BackupManager backups(options_.backup_dir, options_.max_backups);
    auto path = backups.create(db, current_version);
    if (!path) {
        NLOG_WARN(log::MIGRATE_LOGGER, "Failed to create backup ({}), proceeding anyway",
                  path.error().to_string());
        return std::nullopt;
    }
    return *path;
}

std::expected<RunSummary, MigrationError> MigrationRunner::apply(Database& db, int target) {
    Ledger ledger(db);
    if (auto created = ledger.ensure_table(); !created) {
        NLOG_ERROR(log::MIGRATE_LOGGER, "Cannot create ledger: {}", created.error().to_string());
        return std::unexpected(MigrationError::ledger(created.error()));
    }

    auto st = status(db);
    if (!st) {
        return std::unexpected(st.error());
    }
    if (auto ok = check_downgrade(*st); !ok) {
        return std::unexpected(ok.error());
    }
    for (const auto& warning : st->warnings) {
        NLOG_WARN(log::MIGRATE_LOGGER, "Ledger: {}", warning);
    }

    RunSummary summary;
    summary.from_version = st->current_version;
    summary.to_version = st->current_version;

    std::vector<const Migration*> pending;
    for (int version : st->pending) {
        if (version <= target) {
            pending.push_back(registry_.find(version));
        }
    }

    if (pending.empty()) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "Database at version {}, no migration needed", st->current_version);
        return summary;
    }

    NLOG_INFO(log::MIGRATE_LOGGER, "Running {} migrations (v{} -> v{})",
              pending.size(), st->current_version, pending.back()->version);

    summary.backup_path = take_backup(db, st->current_version);

    for (const Migration* unit : pending) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "Running migration {}: {}", unit->version, unit->name);

        MigrationContext ctx(db, ledger, cipher_, unit->version, Ledger::now_seconds());
        auto report = unit->up(ctx);
        if (!report) {
            NLOG_ERROR(log::MIGRATE_LOGGER, "Migration {} ({}) failed: {}",
                       unit->version, unit->name, report.error().message);
            return std::unexpected(report.error());
        }

        // Ledger row is the last write for a unit
        if (auto recorded = ledger.record(unit->version, unit->name, Ledger::now_seconds()); !recorded) {
            NLOG_ERROR(log::MIGRATE_LOGGER, "Cannot record migration {}: {}",
                       unit->version, recorded.error().to_string());
            auto error = MigrationError::ledger(recorded.error());
            error.version = unit->version;
            return std::unexpected(error);
        }

        ++summary.applied;
        summary.to_version = std::max(summary.to_version, unit->version);
        summary.rows_changed += report->rows_changed;
        summary.rows_skipped += report->rows_skipped();

        if (report->rows_skipped() > 0) {
            NLOG_WARN(log::MIGRATE_LOGGER, "Migration {} complete: {} rows changed, {} rows skipped",
                      unit->version, report->rows_changed, report->rows_skipped());
        } else {
            NLOG_DEBUG(log::MIGRATE_LOGGER, "Migration {} complete: {} rows changed",
                       unit->version, report->rows_changed);
        }
    }

    NLOG_INFO(log::MIGRATE_LOGGER, "All migrations complete (v{} -> v{})",
              summary.from_version, summary.to_version);
    return summary;
}

std::expected<int, MigrationError> MigrationRunner::rollback_to(Database& db, int target) {
    if (target < 0 || target > registry_.latest_version()) {
        return std::unexpected(MigrationError{MigrationErrorKind::InvalidTarget, 0,
            "rollback target " + std::to_string(target) + " is outside 0.." +
            std::to_string(registry_.latest_version())});
    }

    Ledger ledger(db);
    if (auto created = ledger.ensure_table(); !created) {
        return std::unexpected(MigrationError::ledger(created.error()));
    }

    auto st = status(db);
    if (!st) {
        return std::unexpected(st.error());
    }
    if (auto ok = check_downgrade(*st); !ok) {
        return std::unexpected(ok.error());
    }

    auto applied = ledger.applied_versions();
    if (!applied) {
        return std::unexpected(MigrationError::ledger(applied.error()));
    }

    // Newest first; every unit must be reversible before anything runs
    std::vector<const Migration*> to_revert;
    for (auto it = applied->rbegin(); it != applied->rend() && *it > target; ++it) {
        const Migration* unit = registry_.find(*it);
        if (!unit || !unit->reversible()) {
            return std::unexpected(MigrationError{MigrationErrorKind::Unsupported, *it,
                "migration " + std::to_string(*it) + " is forward only; restore from a backup instead"});
        }
        to_revert.push_back(unit);
    }

    for (const Migration* unit : to_revert) {
        NLOG_INFO(log::MIGRATE_LOGGER, "Reverting migration {}: {}", unit->version, unit->name);

        MigrationContext ctx(db, ledger, cipher_, unit->version, Ledger::now_seconds());
        if (auto report = unit->down(ctx); !report) {
            NLOG_ERROR(log::MIGRATE_LOGGER, "Reverting migration {} failed: {}",
                       unit->version, report.error().message);
            return std::unexpected(report.error());
        }
        if (auto removed = ledger.remove(unit->version); !removed) {
            auto error = MigrationError::ledger(removed.error());
            error.version = unit->version;
            return std::unexpected(error);
        }
    }

    return static_cast<int>(to_revert.size());
}

} // namespace dashstore::store
