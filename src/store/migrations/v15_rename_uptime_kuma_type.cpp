#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    auto share_instances = ctx.column_exists("integration_shares", "integration_instance_id");
    if (!share_instances) {
        return std::unexpected(share_instances.error());
    }
    auto monitor_instances = ctx.column_exists("service_monitors", "integration_instance_id");
    if (!monitor_instances) {
        return std::unexpected(monitor_instances.error());
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto step = [&](std::string_view sql) -> std::expected<int64_t, MigrationError> {
        if (auto result = ctx.exec(sql); !result) {
            return std::unexpected(result.error());
        }
        return ctx.db().changes();
    };

    // 'uptime-kuma-' is 12 characters; substr is 1-based
    const std::vector<std::string_view> statements = {
        "UPDATE integration_instances SET type = 'uptimekuma' WHERE type = 'uptime-kuma'",
        "UPDATE integration_instances SET id = 'uptimekuma-' || substr(id, 13) "
        "WHERE type = 'uptimekuma' AND id LIKE 'uptime-kuma-%'",
        "UPDATE integration_shares SET integration_name = 'uptimekuma' WHERE integration_name = 'uptime-kuma'",
    };
    for (auto sql : statements) {
        auto changed = step(sql);
        if (!changed) {
            return std::unexpected(changed.error());
        }
        report.rows_changed += *changed;
    }

    if (*share_instances) {
        auto changed = step("UPDATE integration_shares SET integration_instance_id = "
                            "'uptimekuma-' || substr(integration_instance_id, 13) "
                            "WHERE integration_instance_id LIKE 'uptime-kuma-%'");
        if (!changed) {
            return std::unexpected(changed.error());
        }
        report.rows_changed += *changed;
    }
    if (*monitor_instances) {
        auto changed = step("UPDATE service_monitors SET integration_instance_id = "
                            "'uptimekuma-' || substr(integration_instance_id, 13) "
                            "WHERE integration_instance_id LIKE 'uptime-kuma-%'");
        if (!changed) {
            return std::unexpected(changed.error());
        }
        report.rows_changed += *changed;
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    NLOG_DEBUG(log::MIGRATE_LOGGER, "Renamed uptime-kuma references in {} rows", report.rows_changed);
    return report;
}

}  // anonymous namespace

Migration rename_uptime_kuma_type() {
    return Migration{15, "rename_uptime_kuma_type", up, {}};
}

} // namespace dashstore::store::migrations
