#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace dashstore::store {

// Database error codes
enum class DbErrorCode {
    OPEN_FAILED,
    QUERY_FAILED,
    NOT_FOUND,
    CONSTRAINT_VIOLATION,
    BACKUP_FAILED,
    INTERNAL_ERROR,
};

std::string db_error_message(DbErrorCode code);

// Error code plus the message SQLite reported
struct DbError {
    DbErrorCode code = DbErrorCode::INTERNAL_ERROR;
    std::string message;

    std::string to_string() const;
};

// RAII wrapper for SQLite statement
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

    // Binding helpers (1-based index)
    bool bind_int(int index, int value);
    bool bind_int64(int index, int64_t value);
    bool bind_text(int index, std::string_view text);
    bool bind_optional_text(int index, const std::optional<std::string>& text);
    bool bind_null(int index);

    // Step and reset
    int step();
    void reset();

    // Column getters (0-based index)
    int column_int(int index);
    int64_t column_int64(int index);
    std::string column_text(int index);
    std::optional<std::string> column_optional_text(int index);
    bool column_is_null(int index);

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Open SQLite connection with the helpers migration units rely on
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Open (or create) a database file; ":memory:" opens a private in-memory db
    std::expected<void, DbError> open(const std::string& path);

    // Close database
    void close();

    // Check if database is open
    bool is_open() const { return db_ != nullptr; }

    // Path of the main database file; empty for in-memory databases
    std::string file_path() const;

    sqlite3* handle() const { return db_; }

    // Run one or more statements with no result rows
    std::expected<void, DbError> execute(std::string_view sql);

    // Compile a single statement
    std::expected<Statement, DbError> prepare(std::string_view sql);

    // Step a statement expected to finish without rows (INSERT/UPDATE/DELETE)
    std::expected<void, DbError> run(Statement& stmt);

    // Rows changed by the most recent INSERT/UPDATE/DELETE
    int64_t changes() const;

    // ========================================================================
    // Catalog queries
    // ========================================================================
    std::expected<bool, DbError> table_exists(std::string_view table);
    std::expected<bool, DbError> column_exists(std::string_view table, std::string_view column);
    std::expected<bool, DbError> index_exists(std::string_view index);
    std::expected<int64_t, DbError> count_rows(std::string_view table);

    // Consistent copy of the whole database (online backup API)
    std::expected<void, DbError> backup_to(const std::string& dest_path);

    // Error value built from the connection's last SQLite message
    DbError last_error(DbErrorCode code) const;

    // Scoped transaction; rolls back on destruction unless committed
    class Transaction {
    public:
        static std::expected<Transaction, DbError> begin(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;

        std::expected<void, DbError> commit();
        bool active() const { return db_ != nullptr; }

    private:
        explicit Transaction(Database& db) : db_(&db) {}

        Database* db_ = nullptr;
    };

private:
    sqlite3* db_ = nullptr;
};

} // namespace dashstore::store
