#pragma once

#include "store/database.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dashstore::store {

class Ledger;
class ConfigCipher;

// ============================================================================
// Errors
// ============================================================================

enum class MigrationErrorKind {
    Structural,     // DDL/DML failed; aborts startup
    Ledger,         // Ledger table cannot be created, read or written
    Downgrade,      // Ledger is ahead of the registry
    InvalidTarget,  // run_to/rollback_to target outside the registry
    Unsupported,    // rollback requested through a forward-only unit
};

std::string migration_error_kind_name(MigrationErrorKind kind);

struct MigrationError {
    MigrationErrorKind kind = MigrationErrorKind::Structural;
    int version = 0;            // Unit that failed; 0 when not unit specific
    std::string message;

    std::string to_string() const;

    static MigrationError structural(int version, const DbError& error);
    static MigrationError ledger(const DbError& error);
};

// ============================================================================
// Per-row outcomes
// ============================================================================

enum class RowStatus {
    Changed,
    Unchanged,
    Skipped,        // Payload could not be transformed; row left as it was
};

struct RowOutcome {
    std::string table;
    std::string key;
    RowStatus status = RowStatus::Unchanged;
    std::string reason;
};

// What a unit did; skipped rows are kept with their reasons
struct UnitReport {
    int64_t rows_changed = 0;
    int64_t rows_unchanged = 0;
    std::vector<RowOutcome> skipped;

    void record(RowOutcome outcome);
    void merge(UnitReport other);
    int64_t rows_skipped() const { return static_cast<int64_t>(skipped.size()); }
};

// ============================================================================
// Unit context
// ============================================================================

// Everything a unit may touch, passed explicitly
class MigrationContext {
public:
    MigrationContext(Database& db, Ledger& ledger, const ConfigCipher& cipher,
                     int version, int64_t now)
        : db_(db), ledger_(ledger), cipher_(cipher), version_(version), now_(now) {}

    Database& db() { return db_; }
    Ledger& ledger() { return ledger_; }
    const ConfigCipher& cipher() const { return cipher_; }
    int version() const { return version_; }

    // Unix seconds captured when the unit started
    int64_t now() const { return now_; }

    // Execute statements; failures become Structural errors for this unit
    std::expected<void, MigrationError> exec(std::string_view sql);

    // ALTER TABLE ... ADD COLUMN unless the column is already there.
    // Returns true when the column was added.
    std::expected<bool, MigrationError> add_column(std::string_view table,
                                                   std::string_view column,
                                                   std::string_view definition);

    // DROP INDEX guarded by an existence check. Returns true when dropped.
    std::expected<bool, MigrationError> drop_index(std::string_view index);

    std::expected<bool, MigrationError> table_exists(std::string_view table);
    std::expected<bool, MigrationError> column_exists(std::string_view table, std::string_view column);
    std::expected<bool, MigrationError> index_exists(std::string_view index);
    std::expected<int64_t, MigrationError> count_rows(std::string_view table);
    std::expected<Statement, MigrationError> prepare(std::string_view sql);

    // Step a write statement
    std::expected<void, MigrationError> run(Statement& stmt);

    MigrationError fail(const DbError& error) const;
    MigrationError fail(std::string message) const;

private:
    Database& db_;
    Ledger& ledger_;
    const ConfigCipher& cipher_;
    int version_;
    int64_t now_;
};

// ============================================================================
// Migration unit
// ============================================================================

using UpFn = std::function<std::expected<UnitReport, MigrationError>(MigrationContext&)>;
using DownFn = std::function<std::expected<UnitReport, MigrationError>(MigrationContext&)>;

struct Migration {
    int version = 0;
    std::string name;
    UpFn up;
    DownFn down;        // Empty = forward only

    bool reversible() const { return static_cast<bool>(down); }
};

} // namespace dashstore::store
