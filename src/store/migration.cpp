#include "store/migration.hpp"
#include "common/log.hpp"

namespace dashstore::store {

std::string migration_error_kind_name(MigrationErrorKind kind) {
    switch (kind) {
        case MigrationErrorKind::Structural: return "structural";
        case MigrationErrorKind::Ledger: return "ledger";
        case MigrationErrorKind::Downgrade: return "downgrade";
        case MigrationErrorKind::InvalidTarget: return "invalid target";
        case MigrationErrorKind::Unsupported: return "unsupported";
        default: return "unknown";
    }
}

std::string MigrationError::to_string() const {
    std::string out = migration_error_kind_name(kind) + " error";
    if (version > 0) {
        out += " in migration " + std::to_string(version);
    }
    return out + ": " + message;
}

MigrationError MigrationError::structural(int version, const DbError& error) {
    return MigrationError{MigrationErrorKind::Structural, version, error.to_string()};
}

MigrationError MigrationError::ledger(const DbError& error) {
    return MigrationError{MigrationErrorKind::Ledger, 0, error.to_string()};
}

void UnitReport::record(RowOutcome outcome) {
    switch (outcome.status) {
        case RowStatus::Changed:
            ++rows_changed;
            break;
        case RowStatus::Unchanged:
            ++rows_unchanged;
            break;
        case RowStatus::Skipped:
            NLOG_WARN(log::MIGRATE_LOGGER, "Skipped {} row {}: {}",
                      outcome.table, outcome.key, outcome.reason);
            skipped.push_back(std::move(outcome));
            break;
    }
}

void UnitReport::merge(UnitReport other) {
    rows_changed += other.rows_changed;
    rows_unchanged += other.rows_unchanged;
    for (auto& outcome : other.skipped) {
        skipped.push_back(std::move(outcome));
    }
}

// ============================================================================
// MigrationContext
// ============================================================================

MigrationError MigrationContext::fail(const DbError& error) const {
    return MigrationError::structural(version_, error);
}

MigrationError MigrationContext::fail(std::string message) const {
    return MigrationError{MigrationErrorKind::Structural, version_, std::move(message)};
}

std::expected<void, MigrationError> MigrationContext::exec(std::string_view sql) {
    if (auto result = db_.execute(sql); !result) {
        return std::unexpected(fail(result.error()));
    }
    return {};
}

std::expected<bool, MigrationError> MigrationContext::add_column(std::string_view table,
                                                                 std::string_view column,
                                                                 std::string_view definition) {
    auto exists = column_exists(table, column);
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (*exists) {
        return false;
    }

    std::string sql = "ALTER TABLE ";
    sql.append(table).append(" ADD COLUMN ").append(column).append(" ").append(definition);
    if (auto result = exec(sql); !result) {
        return std::unexpected(result.error());
    }
    return true;
}

std::expected<bool, MigrationError> MigrationContext::drop_index(std::string_view index) {
    auto exists = index_exists(index);
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (!*exists) {
        return false;
    }

    std::string sql = "DROP INDEX IF EXISTS ";
    sql.append(index);
    if (auto result = exec(sql); !result) {
        return std::unexpected(result.error());
    }
    return true;
}

std::expected<bool, MigrationError> MigrationContext::table_exists(std::string_view table) {
    auto result = db_.table_exists(table);
    if (!result) return std::unexpected(fail(result.error()));
    return *result;
}

std::expected<bool, MigrationError> MigrationContext::column_exists(std::string_view table,
                                                                    std::string_view column) {
    auto result = db_.column_exists(table, column);
    if (!result) return std::unexpected(fail(result.error()));
    return *result;
}

std::expected<bool, MigrationError> MigrationContext::index_exists(std::string_view index) {
    auto result = db_.index_exists(index);
    if (!result) return std::unexpected(fail(result.error()));
    return *result;
}

std::expected<int64_t, MigrationError> MigrationContext::count_rows(std::string_view table) {
    auto result = db_.count_rows(table);
    if (!result) return std::unexpected(fail(result.error()));
    return *result;
}

std::expected<Statement, MigrationError> MigrationContext::prepare(std::string_view sql) {
    auto result = db_.prepare(sql);
    if (!result) return std::unexpected(fail(result.error()));
    return std::move(*result);
}

std::expected<void, MigrationError> MigrationContext::run(Statement& stmt) {
    auto result = db_.run(stmt);
    if (!result) return std::unexpected(fail(result.error()));
    return {};
}

} // namespace dashstore::store
