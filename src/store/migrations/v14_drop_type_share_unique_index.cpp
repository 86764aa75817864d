#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

// Created by add_integration_shares; it collides once two instances of one
// type are shared with the same target
constexpr const char* STALE_INDEX = "idx_integration_shares_unique";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    auto dropped = ctx.drop_index(STALE_INDEX);
    if (!dropped) {
        return std::unexpected(dropped.error());
    }
    if (*dropped) {
        NLOG_INFO(log::MIGRATE_LOGGER, "Dropped stale index {}", STALE_INDEX);
    } else {
        NLOG_DEBUG(log::MIGRATE_LOGGER, "Index {} not present", STALE_INDEX);
    }
    return UnitReport{};
}

}  // anonymous namespace

Migration drop_type_share_unique_index() {
    return Migration{14, "drop_type_share_unique_index", up, {}};
}

} // namespace dashstore::store::migrations
