#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

// idx_integration_shares_unique is keyed by integration type and later turned
// out to reject one share per instance; v14 removes it.
constexpr const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS integration_shares (
    id TEXT PRIMARY KEY,
    integration_name TEXT NOT NULL,
    share_type TEXT NOT NULL CHECK(share_type IN ('everyone', 'user', 'group')),
    share_target TEXT,
    shared_by TEXT NOT NULL,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
);
CREATE INDEX IF NOT EXISTS idx_integration_shares_name ON integration_shares(integration_name);
CREATE INDEX IF NOT EXISTS idx_integration_shares_target ON integration_shares(share_type, share_target);
CREATE UNIQUE INDEX IF NOT EXISTS idx_integration_shares_unique
    ON integration_shares(integration_name, share_type, share_target);
)SQL";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    if (auto result = ctx.exec(SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Created integration_shares");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_integration_shares() {
    return Migration{7, "add_integration_shares", up, {}};
}

} // namespace dashstore::store::migrations
