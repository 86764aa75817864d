#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

constexpr const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS dashboard_templates (
    id TEXT PRIMARY KEY,
    owner_id TEXT NOT NULL,
    name TEXT NOT NULL,
    description TEXT,
    category TEXT,
    widgets TEXT NOT NULL DEFAULT '[]',
    mobile_widgets TEXT,
    thumbnail TEXT,
    is_default INTEGER DEFAULT 0,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    updated_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    FOREIGN KEY (owner_id) REFERENCES users(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_dashboard_templates_owner ON dashboard_templates(owner_id);

CREATE TABLE IF NOT EXISTS dashboard_backups (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    widgets TEXT NOT NULL DEFAULT '[]',
    mobile_widgets TEXT,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_dashboard_backups_user ON dashboard_backups(user_id);
)SQL";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    if (auto result = ctx.exec(SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Created dashboard_templates and dashboard_backups");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_dashboard_templates() {
    return Migration{4, "add_dashboard_templates", up, {}};
}

} // namespace dashstore::store::migrations
