#include "store/ledger.hpp"
#include <sqlite3.h>
#include <chrono>

namespace dashstore::store {

std::expected<void, DbError> Ledger::ensure_table() {
    return db_.execute(R"SQL(
CREATE TABLE IF NOT EXISTS schema_migrations (
    version INTEGER PRIMARY KEY,
    name TEXT NOT NULL,
    applied_at INTEGER NOT NULL
);
    )SQL");
}

std::expected<std::vector<LedgerEntry>, DbError> Ledger::entries() {
    auto exists = db_.table_exists(TABLE);
    if (!exists) {
        return std::unexpected(exists.error());
    }

    std::vector<LedgerEntry> rows;
    if (!*exists) {
        return rows;
    }

    auto stmt = db_.prepare("SELECT version, name, applied_at FROM schema_migrations ORDER BY version");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    int rc;
    while ((rc = stmt->step()) == SQLITE_ROW) {
        LedgerEntry entry;
        entry.version = stmt->column_int(0);
        entry.name = stmt->column_text(1);
        entry.applied_at = stmt->column_int64(2);
        rows.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(db_.last_error(DbErrorCode::QUERY_FAILED));
    }
    return rows;
}

std::expected<std::set<int>, DbError> Ledger::applied_versions() {
    auto rows = entries();
    if (!rows) {
        return std::unexpected(rows.error());
    }

    std::set<int> versions;
    for (const auto& entry : *rows) {
        versions.insert(entry.version);
    }
    return versions;
}

std::expected<int, DbError> Ledger::current_version() {
    auto versions = applied_versions();
    if (!versions) {
        return std::unexpected(versions.error());
    }
    return versions->empty() ? 0 : *versions->rbegin();
}

std::expected<bool, DbError> Ledger::contains(int version) {
    auto versions = applied_versions();
    if (!versions) {
        return std::unexpected(versions.error());
    }
    return versions->contains(version);
}

std::expected<void, DbError> Ledger::record(int version, std::string_view name, int64_t applied_at) {
    auto stmt = db_.prepare("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_int(1, version);
    stmt->bind_text(2, name);
    stmt->bind_int64(3, applied_at);
    return db_.run(*stmt);
}

std::expected<void, DbError> Ledger::remove(int version) {
    auto stmt = db_.prepare("DELETE FROM schema_migrations WHERE version = ?");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_int(1, version);
    return db_.run(*stmt);
}

int64_t Ledger::now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace dashstore::store
