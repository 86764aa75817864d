#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    // Each column is checked on its own; either may survive an interrupted run
    auto require_change = ctx.add_column("users", "require_password_change", "INTEGER DEFAULT 0");
    if (!require_change) {
        return std::unexpected(require_change.error());
    }

    auto local_password = ctx.add_column("users", "has_local_password", "INTEGER DEFAULT 1");
    if (!local_password) {
        return std::unexpected(local_password.error());
    }

    if (!*require_change) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "users.require_password_change already present");
    }
    if (!*local_password) {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "users.has_local_password already present");
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Password flags ready (added: require_password_change={}, has_local_password={})",
               *require_change, *local_password);
    return UnitReport{};
}

}  // anonymous namespace

Migration add_user_password_flags() {
    return Migration{2, "add_user_password_flags", up, {}};
}

} // namespace dashstore::store::migrations
