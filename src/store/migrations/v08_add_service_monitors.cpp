#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

constexpr const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS service_monitors (
    id TEXT PRIMARY KEY,
    owner_id TEXT NOT NULL,
    name TEXT NOT NULL,
    icon_id TEXT,
    type TEXT NOT NULL DEFAULT 'http',
    url TEXT,
    port INTEGER,
    interval_seconds INTEGER DEFAULT 60,
    timeout_seconds INTEGER DEFAULT 10,
    retries INTEGER DEFAULT 3,
    degraded_threshold_ms INTEGER DEFAULT 2000,
    expected_status_codes TEXT DEFAULT '["200-299"]',
    enabled INTEGER DEFAULT 1,
    maintenance INTEGER DEFAULT 0,
    uptime_kuma_id INTEGER,
    order_index INTEGER DEFAULT 0,
    notify_down INTEGER DEFAULT 1,
    notify_up INTEGER DEFAULT 1,
    notify_degraded INTEGER DEFAULT 0,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    updated_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    FOREIGN KEY (owner_id) REFERENCES users(id) ON DELETE CASCADE,
    FOREIGN KEY (icon_id) REFERENCES custom_icons(id) ON DELETE SET NULL
);
CREATE INDEX IF NOT EXISTS idx_service_monitors_owner ON service_monitors(owner_id);
CREATE INDEX IF NOT EXISTS idx_service_monitors_enabled ON service_monitors(enabled);
CREATE INDEX IF NOT EXISTS idx_service_monitors_uk_id ON service_monitors(uptime_kuma_id);

CREATE TABLE IF NOT EXISTS service_monitor_shares (
    id TEXT PRIMARY KEY,
    monitor_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    notify INTEGER DEFAULT 0,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    FOREIGN KEY (monitor_id) REFERENCES service_monitors(id) ON DELETE CASCADE,
    FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_monitor_shares_monitor ON service_monitor_shares(monitor_id);
CREATE INDEX IF NOT EXISTS idx_monitor_shares_user ON service_monitor_shares(user_id);
CREATE UNIQUE INDEX IF NOT EXISTS idx_monitor_shares_unique ON service_monitor_shares(monitor_id, user_id);

CREATE TABLE IF NOT EXISTS service_monitor_history (
    id TEXT PRIMARY KEY,
    monitor_id TEXT NOT NULL,
    status TEXT NOT NULL,
    response_time_ms INTEGER,
    status_code INTEGER,
    error_message TEXT,
    checked_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
    FOREIGN KEY (monitor_id) REFERENCES service_monitors(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_monitor_history_monitor ON service_monitor_history(monitor_id);
CREATE INDEX IF NOT EXISTS idx_monitor_history_checked ON service_monitor_history(checked_at);
CREATE INDEX IF NOT EXISTS idx_monitor_history_recent ON service_monitor_history(monitor_id, checked_at DESC);

CREATE TABLE IF NOT EXISTS service_monitor_aggregates (
    id TEXT PRIMARY KEY,
    monitor_id TEXT NOT NULL,
    hour_start INTEGER NOT NULL,
    checks_total INTEGER DEFAULT 0,
    checks_up INTEGER DEFAULT 0,
    checks_degraded INTEGER DEFAULT 0,
    checks_down INTEGER DEFAULT 0,
    avg_response_ms INTEGER,
    FOREIGN KEY (monitor_id) REFERENCES service_monitors(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_monitor_aggregates_monitor ON service_monitor_aggregates(monitor_id);
CREATE UNIQUE INDEX IF NOT EXISTS idx_monitor_aggregates_unique ON service_monitor_aggregates(monitor_id, hour_start);

CREATE TRIGGER IF NOT EXISTS update_service_monitors_timestamp
AFTER UPDATE ON service_monitors
BEGIN
    UPDATE service_monitors SET updated_at = strftime('%s', 'now') WHERE id = NEW.id;
END;
)SQL";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    if (auto result = ctx.exec(SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Created service monitoring tables");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_service_monitors() {
    return Migration{8, "add_service_monitors", up, {}};
}

} // namespace dashstore::store::migrations
