#pragma once

#include "store/migration.hpp"
#include "store/registry.hpp"
#include <expected>
#include <vector>

namespace dashstore::store::migrations {

Migration initial_schema();                         // v1
Migration add_user_password_flags();                // v2
Migration add_custom_icon_is_system();              // v3
Migration add_dashboard_templates();                // v4
Migration add_integration_instances();              // v5
Migration migrate_integrations_to_instances();      // v6
Migration add_integration_shares();                 // v7
Migration add_service_monitors();                   // v8
Migration prune_monitor_history();                  // v9
Migration double_widget_heights();                  // v10
Migration add_monitor_instance_column();            // v11
Migration migrate_monitoring_types();               // v12
Migration refactor_integration_shares();            // v13
Migration drop_type_share_unique_index();           // v14
Migration rename_uptime_kuma_type();                // v15
Migration remediate_proxy_password_hashes();        // v16
Migration add_media_library();                      // v17
Migration encrypt_plaintext_integration_configs();  // v18

// Every shipped unit, in version order
std::vector<Migration> all();

// Registry built from all()
std::expected<Registry, MigrationError> builtin_registry();

} // namespace dashstore::store::migrations
