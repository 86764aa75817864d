#include "store/migrations/units.hpp"
#include "common/log.hpp"
#include <sqlite3.h>

namespace dashstore::store::migrations {

namespace {

// Not a valid hash in any scheme, so no password ever verifies against it
constexpr const char* NO_LOCAL_PASSWORD = "!proxy-auth-no-local-password";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    UnitReport report;

    // Accounts without a local password only ever carried the placeholder hash
    std::vector<std::string> affected;
    {
        auto select = ctx.prepare("SELECT id FROM users WHERE has_local_password = 0 AND password != ?");
        if (!select) {
            return std::unexpected(select.error());
        }
        select->bind_text(1, NO_LOCAL_PASSWORD);
        int rc;
        while ((rc = select->step()) == SQLITE_ROW) {
            affected.push_back(select->column_text(0));
        }
        if (rc != SQLITE_DONE) {
            return std::unexpected(ctx.fail(ctx.db().last_error(DbErrorCode::QUERY_FAILED)));
        }
    }

    if (affected.empty()) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "No proxy-only accounts need remediation");
        return report;
    }

    auto tx = Database::Transaction::begin(ctx.db());
    if (!tx) {
        return std::unexpected(ctx.fail(tx.error()));
    }

    auto update = ctx.prepare("UPDATE users SET password = ? WHERE id = ?");
    auto revoke = ctx.prepare("DELETE FROM sessions WHERE user_id = ?");
    if (!update) return std::unexpected(update.error());
    if (!revoke) return std::unexpected(revoke.error());

    int64_t sessions = 0;
    for (const auto& id : affected) {
        update->reset();
        update->bind_text(1, NO_LOCAL_PASSWORD);
        update->bind_text(2, id);
        if (auto result = ctx.run(*update); !result) {
            return std::unexpected(result.error());
        }

        revoke->reset();
        revoke->bind_text(1, id);
        if (auto result = ctx.run(*revoke); !result) {
            return std::unexpected(result.error());
        }
        sessions += ctx.db().changes();

        report.record({"users", id, RowStatus::Changed, {}});
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(ctx.fail(committed.error()));
    }

    NLOG_WARN(log::MIGRATE_LOGGER, "Reset placeholder password hash on {} proxy-only accounts, revoked {} sessions",
              affected.size(), sessions);
    return report;
}

}  // anonymous namespace

Migration remediate_proxy_password_hashes() {
    return Migration{16, "remediate_proxy_password_hashes", up, {}};
}

} // namespace dashstore::store::migrations
