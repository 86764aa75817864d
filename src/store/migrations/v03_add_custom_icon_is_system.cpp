#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    auto added = ctx.add_column("custom_icons", "is_system", "INTEGER DEFAULT 0");
    if (!added) {
        return std::unexpected(added.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "custom_icons.is_system {}", *added ? "added" : "already present");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_custom_icon_is_system() {
    return Migration{3, "add_custom_icon_is_system", up, {}};
}

} // namespace dashstore::store::migrations
