#include "store/migrations/units.hpp"
#include "store/config_cipher.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <sqlite3.h>

namespace json = boost::json;

namespace dashstore::store::migrations {

namespace {

struct StoredConfig {
    std::string id;
    std::string value;
};

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    if (!ctx.cipher().encrypts()) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "No encryption key configured, configs stay plaintext");
        return report;
    }

    std::vector<StoredConfig> rows;
    {
        auto select = ctx.prepare("SELECT id, config_encrypted FROM integration_instances ORDER BY rowid");
        if (!select) {
            return std::unexpected(select.error());
        }
        int rc;
        while ((rc = select->step()) == SQLITE_ROW) {
            rows.push_back({select->column_text(0), select->column_text(1)});
        }
        if (rc != SQLITE_DONE) {
            return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
        }
    }

    std::vector<StoredConfig> sealed;
    for (auto& row : rows) {
        if (is_likely_encrypted(row.value)) {
            report.record({"integration_instances", row.id, RowStatus::Unchanged, {}});
            continue;
        }

        boost::system::error_code ec;
        auto parsed = json::parse(row.value, ec);
        if (ec) {
            report.record({"integration_instances", row.id, RowStatus::Skipped, "invalid JSON: " + ec.message()});
            continue;
        }
        if (!parsed.is_object()) {
            report.record({"integration_instances", row.id, RowStatus::Skipped, "config is not a JSON object"});
            continue;
        }
        sealed.push_back({row.id, ctx.cipher().seal(parsed.as_object())});
    }

    if (sealed.empty()) {
        return report;
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }
    auto update = ctx.prepare("UPDATE integration_instances SET config_encrypted = ? WHERE id = ?");
    if (!update) {
        return std::unexpected(update.error());
    }

    for (const auto& row : sealed) {
        update->reset();
        update->bind_text(1, row.value);
        update->bind_text(2, row.id);
        if (auto result = ctx.run(*update); !result) {
            return std::unexpected(result.error());
        }
        report.record({"integration_instances", row.id, RowStatus::Changed, {}});
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    NLOG_INFO(log::MIGRATE_LOGGER, "Encrypted {} plaintext integration configs ({} skipped)",
              report.rows_changed, report.rows_skipped());
    return report;
}

}  // anonymous namespace

Migration encrypt_plaintext_integration_configs() {
    return Migration{18, "encrypt_plaintext_integration_configs", up, {}};
}

} // namespace dashstore::store::migrations
