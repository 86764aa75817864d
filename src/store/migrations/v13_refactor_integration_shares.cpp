#include "store/migrations/units.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"
#include <map>
#include <sqlite3.h>

namespace dashstore::store::migrations {

namespace {

struct TypeShare {
    std::string id;
    std::string integration_name;
    std::string share_type;
    std::optional<std::string> share_target;
    std::string shared_by;
    int64_t created_at = 0;
};

std::expected<std::vector<TypeShare>, MigrationError> load_type_shares(MigrationContext& ctx) {
    auto select = ctx.prepare(R"SQL(
        SELECT id, integration_name, share_type, share_target, shared_by, created_at
        FROM integration_shares
        WHERE integration_instance_id IS NULL
        ORDER BY rowid
    )SQL");
    if (!select) {
        return std::unexpected(select.error());
    }

    std::vector<TypeShare> shares;
    int rc;
    while ((rc = select->step()) == SQLITE_ROW) {
        TypeShare share;
        share.id = select->column_text(0);
        share.integration_name = select->column_text(1);
        share.share_type = select->column_text(2);
        share.share_target = select->column_optional_text(3);
        share.shared_by = select->column_text(4);
        share.created_at = select->column_int64(5);
        shares.push_back(std::move(share));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
    }
    return shares;
}

// type -> instance ids, in creation order
std::expected<std::map<std::string, std::vector<std::string>>, MigrationError> load_instances(MigrationContext& ctx) {
    auto select = ctx.prepare("SELECT id, type FROM integration_instances ORDER BY rowid");
    if (!select) {
        return std::unexpected(select.error());
    }

    std::map<std::string, std::vector<std::string>> by_type;
    int rc;
    while ((rc = select->step()) == SQLITE_ROW) {
        by_type[select->column_text(1)].push_back(select->column_text(0));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
    }
    return by_type;
}

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    auto added = ctx.add_column("integration_shares", "integration_instance_id", "TEXT");
    if (!added) {
        return std::unexpected(added.error());
    }

    auto shares = load_type_shares(ctx);
    if (!shares) {
        return std::unexpected(shares.error());
    }
    auto instances = load_instances(ctx);
    if (!instances) {
        return std::unexpected(instances.error());
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto remove = ctx.prepare("DELETE FROM integration_shares WHERE id = ?");
    auto assign = ctx.prepare("UPDATE integration_shares SET integration_instance_id = ? WHERE id = ?");
    auto insert = ctx.prepare(R"SQL(
        INSERT OR IGNORE INTO integration_shares
            (id, integration_name, integration_instance_id, share_type, share_target, shared_by, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )SQL");
    if (!remove) return std::unexpected(remove.error());
    if (!assign) return std::unexpected(assign.error());
    if (!insert) return std::unexpected(insert.error());

    int64_t deleted = 0;
    for (const auto& share : *shares) {
        auto it = instances->find(share.integration_name);
        if (it == instances->end() || it->second.empty()) {
            // No instance of this type left to share
            remove->reset();
            remove->bind_text(1, share.id);
            if (auto result = ctx.run(*remove); !result) {
                return std::unexpected(result.error());
            }
            ++deleted;
            report.record({"integration_shares", share.id, RowStatus::Changed, {}});
            continue;
        }

        const auto& ids = it->second;
        assign->reset();
        assign->bind_text(1, ids.front());
        assign->bind_text(2, share.id);
        if (auto result = ctx.run(*assign); !result) {
            return std::unexpected(result.error());
        }
        report.record({"integration_shares", share.id, RowStatus::Changed, {}});

        for (size_t i = 1; i < ids.size(); ++i) {
            auto new_id = crypto::random_uuid();
            insert->reset();
            insert->bind_text(1, new_id);
            insert->bind_text(2, share.integration_name);
            insert->bind_text(3, ids[i]);
            insert->bind_text(4, share.share_type);
            insert->bind_optional_text(5, share.share_target);
            insert->bind_text(6, share.shared_by);
            insert->bind_int64(7, share.created_at);
            if (auto result = ctx.run(*insert); !result) {
                return std::unexpected(result.error());
            }
            if (ctx.db().changes() == 0) {
                // Type-level unique index still present; dropped by a later unit
                report.record({"integration_shares", share.id + "->" + ids[i], RowStatus::Skipped,
                               "rejected by type-level unique index"});
            } else {
                report.record({"integration_shares", new_id, RowStatus::Changed, {}});
            }
        }
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    if (auto result = ctx.exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_integration_shares_instance_id
            ON integration_shares(integration_instance_id);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_integration_shares_instance_unique
            ON integration_shares(integration_instance_id, share_type, share_target);
    )SQL");
        !result) {
        return std::unexpected(result.error());
    }

    NLOG_DEBUG(log::MIGRATE_LOGGER, "Shares moved to instances: {} rows written, {} orphans deleted, {} skipped",
               report.rows_changed - deleted, deleted, report.rows_skipped());
    return report;
}

}  // anonymous namespace

Migration refactor_integration_shares() {
    return Migration{13, "refactor_integration_shares", up, {}};
}

} // namespace dashstore::store::migrations
