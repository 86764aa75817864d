#include "store/migrations/units.hpp"

namespace dashstore::store::migrations {

std::vector<Migration> all() {
    return {
        initial_schema(),
        add_user_password_flags(),
        add_custom_icon_is_system(),
        add_dashboard_templates(),
        add_integration_instances(),
        migrate_integrations_to_instances(),
        add_integration_shares(),
        add_service_monitors(),
        prune_monitor_history(),
        double_widget_heights(),
        add_monitor_instance_column(),
        migrate_monitoring_types(),
        refactor_integration_shares(),
        drop_type_share_unique_index(),
        rename_uptime_kuma_type(),
        remediate_proxy_password_hashes(),
        add_media_library(),
        encrypt_plaintext_integration_configs(),
    };
}

std::expected<Registry, MigrationError> builtin_registry() {
    return Registry::create(all());
}

} // namespace dashstore::store::migrations
