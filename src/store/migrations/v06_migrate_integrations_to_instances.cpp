#include "store/migrations/units.hpp"
#include "store/config_cipher.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <cctype>
#include <sqlite3.h>

namespace json = boost::json;

namespace dashstore::store::migrations {

namespace {

struct InstanceRow {
    std::string id;
    std::string type;
    std::string display_name;
    std::string config;
    bool enabled = false;
};

std::string display_name_for(std::string_view type) {
    std::string name(type);
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    // Whole unit is skipped once any instance exists
    auto existing = ctx.count_rows("integration_instances");
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (*existing > 0) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "integration_instances already has {} rows, skipping", *existing);
        return report;
    }

    auto select = ctx.prepare("SELECT value FROM system_config WHERE key = 'integrations'");
    if (!select) {
        return std::unexpected(select.error());
    }
    int rc = select->step();
    if (rc == SQLITE_DONE) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "No legacy integrations config to migrate");
        return report;
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
    }
    std::string raw = select->column_text(0);
    select->reset();

    boost::system::error_code ec;
    auto parsed = json::parse(raw, ec);
    if (ec || !parsed.is_object()) {
        report.record({"system_config", "integrations", RowStatus::Skipped,
                       ec ? "invalid JSON: " + ec.message() : "not a JSON object"});
        return report;
    }

    std::vector<InstanceRow> rows;
    for (const auto& entry : parsed.as_object()) {
        std::string type(entry.key());
        const json::value& value = entry.value();
        if (!value.is_object()) {
            report.record({"system_config", "integrations." + type, RowStatus::Skipped,
                           "integration config is not an object"});
            continue;
        }

        json::object config = value.as_object();
        bool enabled = false;
        if (auto it = config.find("enabled"); it != config.end() && it->value().is_bool()) {
            enabled = it->value().as_bool();
        }
        // Sharing moved to its own table; enabled moved to a column
        config.erase("sharing");
        config.erase("enabled");

        if (config.empty()) {
            NLOG_DEBUG(log::MIGRATE_LOGGER, "Integration '{}' has no settings, not migrated", type);
            report.record({"system_config", "integrations." + type, RowStatus::Unchanged, {}});
            continue;
        }

        InstanceRow row;
        row.id = type + "-primary";
        row.display_name = display_name_for(type);
        row.type = std::move(type);
        row.config = ctx.cipher().seal(config);
        row.enabled = enabled;
        rows.push_back(std::move(row));
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto insert = ctx.prepare(R"SQL(
        INSERT INTO integration_instances (id, type, display_name, config_encrypted, enabled, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, NULL)
    )SQL");
    if (!insert) {
        return std::unexpected(insert.error());
    }

    for (const auto& row : rows) {
        insert->reset();
        insert->bind_text(1, row.id);
        insert->bind_text(2, row.type);
        insert->bind_text(3, row.display_name);
        insert->bind_text(4, row.config);
        insert->bind_int(5, row.enabled ? 1 : 0);
        insert->bind_int64(6, ctx.now());
        if (auto result = ctx.run(*insert); !result) {
            return std::unexpected(result.error());
        }
        report.record({"integration_instances", row.id, RowStatus::Changed, {}});
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    NLOG_DEBUG(log::MIGRATE_LOGGER, "Migrated {} integrations to instances ({} skipped)",
               report.rows_changed, report.rows_skipped());
    return report;
}

}  // anonymous namespace

Migration migrate_integrations_to_instances() {
    return Migration{6, "migrate_integrations_to_instances", up, {}};
}

} // namespace dashstore::store::migrations
