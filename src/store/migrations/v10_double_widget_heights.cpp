#include "store/migrations/units.hpp"
#include "store/widget_layout.hpp"
#include "common/log.hpp"
#include <sqlite3.h>

namespace dashstore::store::migrations {

namespace {

// Grid row height halved, so every stored widget height doubles
constexpr double HEIGHT_FACTOR = 2.0;

struct WidgetTable {
    const char* table;
    const char* key;
    std::vector<const char*> columns;
};

struct StoredRow {
    std::string key;
    std::vector<std::optional<std::string>> values;
};

std::string select_sql(const WidgetTable& t) {
    std::string sql = "SELECT ";
    sql += t.key;
    for (const char* column : t.columns) {
        sql += ", ";
        sql += column;
    }
    return sql + " FROM " + t.table;
}

std::string update_sql(const WidgetTable& t) {
    std::string sql = "UPDATE ";
    sql += t.table;
    sql += " SET ";
    for (size_t i = 0; i < t.columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += t.columns[i];
        sql += " = ?";
    }
    return sql + " WHERE " + t.key + " = ?";
}

// Read the whole table first, then rewrite changed rows inside one transaction
std::expected<UnitReport, MigrationError> rewrite_table(MigrationContext& ctx, const WidgetTable& t) {
    UnitReport report;

    std::vector<StoredRow> rows;
    {
        auto select = ctx.prepare(select_sql(t));
        if (!select) {
            return std::unexpected(select.error());
        }
        int rc;
        while ((rc = select->step()) == SQLITE_ROW) {
            StoredRow row;
            row.key = select->column_text(0);
            for (size_t i = 0; i < t.columns.size(); ++i) {
                row.values.push_back(select->column_optional_text(static_cast<int>(i) + 1));
            }
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
        }
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }
    auto update = ctx.prepare(update_sql(t));
    if (!update) {
        return std::unexpected(update.error());
    }

    for (const auto& row : rows) {
        bool changed = false;
        std::vector<std::optional<std::string>> values;

        for (size_t i = 0; i < row.values.size(); ++i) {
            const auto& original = row.values[i];
            auto outcome = scale_widget_heights(
                original ? std::optional<std::string_view>(*original) : std::nullopt, HEIGHT_FACTOR);

            if (outcome.status == TransformStatus::Skipped) {
                report.record({t.table, row.key + "." + t.columns[i], RowStatus::Skipped, outcome.reason});
            }
            changed = changed || outcome.status == TransformStatus::Changed;
            values.push_back(std::move(outcome.value));
        }

        if (!changed) {
            report.record({t.table, row.key, RowStatus::Unchanged, {}});
            continue;
        }

        update->reset();
        for (size_t i = 0; i < values.size(); ++i) {
            update->bind_optional_text(static_cast<int>(i) + 1, values[i]);
        }
        update->bind_text(static_cast<int>(values.size()) + 1, row.key);
        if (auto result = ctx.run(*update); !result) {
            return std::unexpected(result.error());
        }
        report.record({t.table, row.key, RowStatus::Changed, {}});
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    NLOG_DEBUG(log::MIGRATE_LOGGER, "Updated {} rows in {} ({} values skipped)",
               report.rows_changed, t.table, report.rows_skipped());
    return report;
}

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    const std::vector<WidgetTable> tables = {
        {"user_preferences", "user_id", {"dashboard_config"}},
        {"dashboard_templates", "id", {"widgets", "mobile_widgets"}},
        {"dashboard_backups", "id", {"widgets", "mobile_widgets"}},
    };

    UnitReport report;
    for (const auto& t : tables) {
        auto result = rewrite_table(ctx, t);
        if (!result) {
            return std::unexpected(result.error());
        }
        report.merge(std::move(*result));
    }
    return report;
}

}  // anonymous namespace

Migration double_widget_heights() {
    return Migration{10, "double_widget_heights", up, {}};
}

} // namespace dashstore::store::migrations
