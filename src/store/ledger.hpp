#pragma once

#include "store/database.hpp"
#include <cstdint>
#include <expected>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dashstore::store {

// One applied migration
struct LedgerEntry {
    int version = 0;
    std::string name;
    int64_t applied_at = 0;     // Unix seconds
};

// Durable record of applied versions (schema_migrations table)
class Ledger {
public:
    static constexpr const char* TABLE = "schema_migrations";

    explicit Ledger(Database& db) : db_(db) {}

    // Create the table if absent; safe on an empty database
    std::expected<void, DbError> ensure_table();

    // All rows, ascending by version. Empty when the table does not exist.
    std::expected<std::vector<LedgerEntry>, DbError> entries();

    std::expected<std::set<int>, DbError> applied_versions();

    // Highest applied version, 0 when nothing is applied
    std::expected<int, DbError> current_version();

    std::expected<bool, DbError> contains(int version);

    std::expected<void, DbError> record(int version, std::string_view name, int64_t applied_at);

    std::expected<void, DbError> remove(int version);

    static int64_t now_seconds();

private:
    Database& db_;
};

} // namespace dashstore::store
