#include "store/migrations/units.hpp"
#include "store/config_cipher.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <sqlite3.h>

namespace json = boost::json;

namespace dashstore::store::migrations {

namespace {

constexpr const char* GLANCES_ID = "glances-primary";
constexpr const char* MONITOR_ID = "monitor-primary";

// { backend, glances: {url, password} } / { backend, custom: {url, token} } -> flat
json::object flatten_system_status(const json::object& old_config) {
    json::object flat;
    auto backend = jstr(old_config, "backend");
    if (backend == "glances") {
        if (auto* glances = jsection(old_config, "glances")) {
            flat["url"] = jstr(*glances, "url");
            flat["password"] = jstr(*glances, "password");
        }
    } else if (backend == "custom") {
        if (auto* custom = jsection(old_config, "custom")) {
            flat["url"] = jstr(*custom, "url");
            flat["token"] = jstr(*custom, "token");
        }
    }
    return flat;
}

std::expected<void, MigrationError> convert_system_status(MigrationContext& ctx, UnitReport& report) {
    std::string id;
    std::string stored;
    int enabled = 1;
    {
        auto select = ctx.prepare(
            "SELECT id, config_encrypted, enabled FROM integration_instances WHERE type = 'systemstatus' LIMIT 1");
        if (!select) {
            return std::unexpected(select.error());
        }
        int rc = select->step();
        if (rc == SQLITE_DONE) {
            return {};
        }
        if (rc != SQLITE_ROW) {
            return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
        }
        id = select->column_text(0);
        stored = select->column_text(1);
        enabled = select->column_int(2);
    }

    json::object old_config;
    if (auto opened = ctx.cipher().open(stored); opened) {
        old_config = std::move(*opened);
    } else {
        report.record({"integration_instances", id, RowStatus::Skipped,
                       "config unreadable (" + cipher_error_message(opened.error()) + "), starting empty"});
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto insert = ctx.prepare(R"SQL(
        INSERT OR IGNORE INTO integration_instances (id, type, display_name, config_encrypted, enabled, created_at, updated_at)
        VALUES (?, 'glances', 'Glances', ?, ?, ?, NULL)
    )SQL");
    if (!insert) {
        return std::unexpected(insert.error());
    }
    insert->bind_text(1, GLANCES_ID);
    insert->bind_text(2, ctx.cipher().seal(flatten_system_status(old_config)));
    insert->bind_int(3, enabled);
    insert->bind_int64(4, ctx.now());
    if (auto result = ctx.run(*insert); !result) {
        return std::unexpected(result.error());
    }
    if (ctx.db().changes() == 0) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "{} already exists", GLANCES_ID);
    }

    auto remove = ctx.prepare("DELETE FROM integration_instances WHERE id = ?");
    if (!remove) {
        return std::unexpected(remove.error());
    }
    remove->bind_text(1, id);
    if (auto result = ctx.run(*remove); !result) {
        return std::unexpected(result.error());
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    report.record({"integration_instances", id, RowStatus::Changed, {}});
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Replaced {} with {}", id, GLANCES_ID);
    return {};
}

std::expected<void, MigrationError> create_monitor_instance(MigrationContext& ctx, UnitReport& report) {
    std::optional<int> legacy_enabled;
    {
        auto existing = ctx.prepare("SELECT 1 FROM integration_instances WHERE id = ?");
        if (!existing) {
            return std::unexpected(existing.error());
        }
        existing->bind_text(1, MONITOR_ID);
        if (existing->step() == SQLITE_ROW) {
            return {};
        }

        auto legacy = ctx.prepare("SELECT enabled FROM integration_instances WHERE type = 'servicemonitoring' LIMIT 1");
        if (!legacy) {
            return std::unexpected(legacy.error());
        }
        if (legacy->step() == SQLITE_ROW) {
            legacy_enabled = legacy->column_int(0);
        }
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto insert = ctx.prepare(R"SQL(
        INSERT INTO integration_instances (id, type, display_name, config_encrypted, enabled, created_at, updated_at)
        VALUES (?, 'monitor', 'Service Monitor', ?, ?, ?, NULL)
    )SQL");
    if (!insert) {
        return std::unexpected(insert.error());
    }
    json::object config;
    config["label"] = "Primary Monitors";
    insert->bind_text(1, MONITOR_ID);
    insert->bind_text(2, ctx.cipher().seal(config));
    insert->bind_int(3, legacy_enabled.value_or(1));
    insert->bind_int64(4, ctx.now());
    if (auto result = ctx.run(*insert); !result) {
        return std::unexpected(result.error());
    }

    if (legacy_enabled) {
        if (auto result = ctx.exec("DELETE FROM integration_instances WHERE type = 'servicemonitoring'"); !result) {
            return std::unexpected(result.error());
        }
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    report.record({"integration_instances", MONITOR_ID, RowStatus::Changed, {}});
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Created {}", MONITOR_ID);
    return {};
}

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    if (auto result = convert_system_status(ctx, report); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = create_monitor_instance(ctx, report); !result) {
        return std::unexpected(result.error());
    }

    if (auto result = ctx.exec("UPDATE service_monitors SET integration_instance_id = 'monitor-primary' "
                               "WHERE integration_instance_id IS NULL");
        !result) {
        return std::unexpected(result.error());
    }
    int64_t assigned = ctx.db().changes();
    report.rows_changed += assigned;

    NLOG_DEBUG(log::MIGRATE_LOGGER, "Assigned {} monitors to {}", assigned, MONITOR_ID);
    return report;
}

}  // anonymous namespace

Migration migrate_monitoring_types() {
    return Migration{12, "migrate_monitoring_types", up, {}};
}

} // namespace dashstore::store::migrations
