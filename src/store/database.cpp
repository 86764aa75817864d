#include "store/database.hpp"
#include "common/log.hpp"
#include <sqlite3.h>

namespace dashstore::store {

std::string db_error_message(DbErrorCode code) {
    switch (code) {
        case DbErrorCode::OPEN_FAILED: return "Failed to open database";
        case DbErrorCode::QUERY_FAILED: return "Query execution failed";
        case DbErrorCode::NOT_FOUND: return "Record not found";
        case DbErrorCode::CONSTRAINT_VIOLATION: return "Constraint violation";
        case DbErrorCode::BACKUP_FAILED: return "Database backup failed";
        case DbErrorCode::INTERNAL_ERROR: return "Internal database error";
        default: return "Unknown database error";
    }
}

std::string DbError::to_string() const {
    if (message.empty()) {
        return db_error_message(code);
    }
    return db_error_message(code) + ": " + message;
}

// ============================================================================
// Statement implementation
// ============================================================================

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

bool Statement::bind_int(int index, int value) {
    return sqlite3_bind_int(stmt_, index, value) == SQLITE_OK;
}

bool Statement::bind_int64(int index, int64_t value) {
    return sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
}

bool Statement::bind_text(int index, std::string_view text) {
    return sqlite3_bind_text(stmt_, index, text.data(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

bool Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

bool Statement::bind_null(int index) {
    return sqlite3_bind_null(stmt_, index) == SQLITE_OK;
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::column_int(int index) {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::column_int64(int index) {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::column_text(int index) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    if (!text) {
        return "";
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::column_optional_text(int index) {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_text(index);
}

bool Statement::column_is_null(int index) {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

std::expected<void, DbError> Database::open(const std::string& path) {
    close();

    int rc = sqlite3_open_v2(path.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    if (rc != SQLITE_OK) {
        DbError error{DbErrorCode::OPEN_FAILED, db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)};
        NLOG_ERROR(log::STORE_LOGGER, "Failed to open database {}: {}", path, error.message);
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(error);
    }

    // WAL is refused for in-memory databases; the pragma then reports "memory"
    for (const char* pragma : {"PRAGMA journal_mode=WAL",
                               "PRAGMA synchronous=NORMAL",
                               "PRAGMA foreign_keys=ON",
                               "PRAGMA busy_timeout=5000"}) {
        if (auto result = execute(pragma); !result) {
            NLOG_WARN(log::STORE_LOGGER, "{} failed: {}", pragma, result.error().message);
        }
    }

    NLOG_DEBUG(log::STORE_LOGGER, "Database opened: {}", path);
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string Database::file_path() const {
    if (!db_) {
        return {};
    }
    const char* name = sqlite3_db_filename(db_, "main");
    return name ? name : "";
}

DbError Database::last_error(DbErrorCode code) const {
    if (!db_) {
        return DbError{code, "database is not open"};
    }
    int extended = sqlite3_extended_errcode(db_);
    if ((extended & 0xff) == SQLITE_CONSTRAINT) {
        code = DbErrorCode::CONSTRAINT_VIOLATION;
    }
    return DbError{code, sqlite3_errmsg(db_)};
}

std::expected<Statement, DbError> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = last_error(DbErrorCode::QUERY_FAILED);
        NLOG_DEBUG(log::STORE_LOGGER, "Failed to prepare statement: {}", error.message);
        return std::unexpected(error);
    }
    return Statement(stmt);
}

std::expected<void, DbError> Database::execute(std::string_view sql) {
    // sqlite3_exec needs a terminated string
    std::string text(sql);
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        DbError error{(rc & 0xff) == SQLITE_CONSTRAINT ? DbErrorCode::CONSTRAINT_VIOLATION
                                                       : DbErrorCode::QUERY_FAILED,
                      errmsg ? errmsg : sqlite3_errstr(rc)};
        sqlite3_free(errmsg);
        NLOG_DEBUG(log::STORE_LOGGER, "Failed to execute SQL: {}", error.message);
        return std::unexpected(error);
    }
    return {};
}

std::expected<void, DbError> Database::run(Statement& stmt) {
    int rc = stmt.step();
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        return std::unexpected(last_error(DbErrorCode::QUERY_FAILED));
    }
    return {};
}

int64_t Database::changes() const {
    return sqlite3_changes64(db_);
}

std::expected<bool, DbError> Database::table_exists(std::string_view table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, table);

    int rc = stmt->step();
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return std::unexpected(last_error(DbErrorCode::QUERY_FAILED));
}

std::expected<bool, DbError> Database::column_exists(std::string_view table, std::string_view column) {
    auto stmt = prepare("SELECT 1 FROM pragma_table_info(?) WHERE name = ?");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, table);
    stmt->bind_text(2, column);

    int rc = stmt->step();
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return std::unexpected(last_error(DbErrorCode::QUERY_FAILED));
}

std::expected<bool, DbError> Database::index_exists(std::string_view index) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'index' AND name = ?");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, index);

    int rc = stmt->step();
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return std::unexpected(last_error(DbErrorCode::QUERY_FAILED));
}

std::expected<int64_t, DbError> Database::count_rows(std::string_view table) {
    // Identifier cannot be bound; quote it
    std::string quoted = "\"";
    for (char c : table) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';

    auto stmt = prepare("SELECT COUNT(*) FROM " + quoted);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (stmt->step() != SQLITE_ROW) {
        return std::unexpected(last_error(DbErrorCode::QUERY_FAILED));
    }
    return stmt->column_int64(0);
}

std::expected<void, DbError> Database::backup_to(const std::string& dest_path) {
    sqlite3* dest = nullptr;
    int rc = sqlite3_open_v2(dest_path.c_str(), &dest,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        DbError error{DbErrorCode::BACKUP_FAILED, dest ? sqlite3_errmsg(dest) : sqlite3_errstr(rc)};
        sqlite3_close(dest);
        return std::unexpected(error);
    }

    sqlite3_backup* backup = sqlite3_backup_init(dest, "main", db_, "main");
    if (!backup) {
        DbError error{DbErrorCode::BACKUP_FAILED, sqlite3_errmsg(dest)};
        sqlite3_close(dest);
        return std::unexpected(error);
    }

    rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);

    std::expected<void, DbError> result;
    if (rc != SQLITE_DONE) {
        result = std::unexpected(DbError{DbErrorCode::BACKUP_FAILED, sqlite3_errstr(rc)});
    }
    sqlite3_close(dest);
    return result;
}

// ============================================================================
// Transaction
// ============================================================================

std::expected<Database::Transaction, DbError> Database::Transaction::begin(Database& db) {
    if (auto result = db.execute("BEGIN IMMEDIATE"); !result) {
        return std::unexpected(result.error());
    }
    return Transaction(db);
}

Database::Transaction::Transaction(Transaction&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database::Transaction::~Transaction() {
    if (db_) {
        if (auto result = db_->execute("ROLLBACK"); !result) {
            NLOG_ERROR(log::STORE_LOGGER, "Rollback failed: {}", result.error().message);
        }
    }
}

std::expected<void, DbError> Database::Transaction::commit() {
    if (!db_) {
        return std::unexpected(DbError{DbErrorCode::INTERNAL_ERROR, "transaction is not active"});
    }
    auto result = db_->execute("COMMIT");
    if (result) {
        db_ = nullptr;
    }
    return result;
}

} // namespace dashstore::store
