#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

constexpr const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS integration_instances (
    id TEXT PRIMARY KEY,
    type TEXT NOT NULL,
    display_name TEXT NOT NULL,
    config_encrypted TEXT NOT NULL DEFAULT '{}',
    enabled INTEGER DEFAULT 1,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    updated_at INTEGER
);
CREATE INDEX IF NOT EXISTS idx_integration_instances_type ON integration_instances(type);
)SQL";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    if (auto result = ctx.exec(SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Created integration_instances");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_integration_instances() {
    return Migration{5, "add_integration_instances", up, {}};
}

} // namespace dashstore::store::migrations
