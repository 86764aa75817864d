#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t HISTORY_RETENTION_DAYS = 30;
constexpr int64_t AGGREGATE_RETENTION_DAYS = 90;

// Cutoffs are relative to the time the unit runs, so a later re-run prunes again
std::expected<int64_t, MigrationError> prune(MigrationContext& ctx, std::string_view sql, int64_t cutoff) {
    auto stmt = ctx.prepare(sql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    stmt->bind_int64(1, cutoff);
    if (auto result = ctx.run(*stmt); !result) {
        return std::unexpected(result.error());
    }
    return ctx.db().changes();
}

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    auto history = prune(ctx, "DELETE FROM service_monitor_history WHERE checked_at < ?",
                         ctx.now() - HISTORY_RETENTION_DAYS * SECONDS_PER_DAY);
    if (!history) {
        return std::unexpected(history.error());
    }

    auto aggregates = prune(ctx, "DELETE FROM service_monitor_aggregates WHERE hour_start < ?",
                            ctx.now() - AGGREGATE_RETENTION_DAYS * SECONDS_PER_DAY);
    if (!aggregates) {
        return std::unexpected(aggregates.error());
    }

    report.rows_changed = *history + *aggregates;
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Pruned {} history rows and {} aggregate rows", *history, *aggregates);
    return report;
}

}  // anonymous namespace

Migration prune_monitor_history() {
    return Migration{9, "prune_monitor_history", up, {}};
}

} // namespace dashstore::store::migrations
