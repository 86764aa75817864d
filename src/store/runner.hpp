#pragma once

#include "store/config_cipher.hpp"
#include "store/ledger.hpp"
#include "store/registry.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace dashstore::store {

struct RunnerOptions {
    std::string backup_dir;     // Empty = no pre-migration backups
    uint32_t max_backups = 3;
};

struct RunSummary {
    int applied = 0;            // Units applied by this run
    int from_version = 0;
    int to_version = 0;
    int64_t rows_changed = 0;
    int64_t rows_skipped = 0;
    std::optional<std::string> backup_path;
};

struct MigrationStatus {
    int current_version = 0;    // Highest version in the ledger
    int latest_version = 0;     // Highest version in the registry
    std::vector<int> pending;   // Registered versions not in the ledger
    bool downgrade = false;     // Ledger is ahead of the registry
    std::vector<std::string> warnings;  // Name mismatches, unknown versions, gaps

    bool needs_migration() const { return !pending.empty(); }
};

// Applies registry units that the ledger does not list, in ascending order
class MigrationRunner {
public:
    MigrationRunner(const Registry& registry, const ConfigCipher& cipher, RunnerOptions options = {});

    // Apply every pending unit
    std::expected<RunSummary, MigrationError> run(Database& db);

    // Apply pending units with version <= target
    std::expected<RunSummary, MigrationError> run_to(Database& db, int target);

    // Read-only view of what run() would do
    std::expected<MigrationStatus, MigrationError> status(Database& db);

    std::expected<std::vector<LedgerEntry>, MigrationError> history(Database& db);

    // Run `down` of every applied unit above target, newest first.
    // Fails without changes if any of them is forward only.
    std::expected<int, MigrationError> rollback_to(Database& db, int target);

private:
    std::expected<RunSummary, MigrationError> apply(Database& db, int target);
    std::expected<void, MigrationError> check_downgrade(const MigrationStatus& status) const;
    std::optional<std::string> take_backup(Database& db, int current_version);

    const Registry& registry_;
    const ConfigCipher& cipher_;
    RunnerOptions options_;
};

} // namespace dashstore::store
