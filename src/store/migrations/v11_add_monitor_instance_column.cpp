#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    auto added = ctx.add_column("service_monitors", "integration_instance_id", "TEXT");
    if (!added) {
        return std::unexpected(added.error());
    }
    if (auto result = ctx.exec("CREATE INDEX IF NOT EXISTS idx_service_monitors_instance "
                               "ON service_monitors(integration_instance_id)");
        !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "service_monitors.integration_instance_id {}",
               *added ? "added" : "already present");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_monitor_instance_column() {
    return Migration{11, "add_monitor_instance_column", up, {}};
}

} // namespace dashstore::store::migrations
