#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dashstore::store {

// ============================================================================
// Stored widget payload shapes
// ============================================================================

// Bare array of widget descriptors (dashboard_templates / dashboard_backups)
struct WidgetArrayV1 {
    boost::json::array widgets;
};

// Object with a `widgets` array (user_preferences.dashboard_config)
struct DashboardConfigV1 {
    boost::json::object config;
};

// Any other valid JSON; never rewritten
struct OpaquePayload {
    boost::json::value value;
};

using WidgetPayload = std::variant<WidgetArrayV1, DashboardConfigV1, OpaquePayload>;

WidgetPayload classify_payload(boost::json::value value);

// Scale `h`, `layouts.lg.h`, `layouts.sm.h` and `layout.h` of one widget.
// Returns the number of heights changed.
int scale_widget(boost::json::object& widget, double factor);

// Returns the number of heights changed across the payload
int scale_payload(WidgetPayload& payload, double factor);

std::string serialize_payload(const WidgetPayload& payload);

// ============================================================================
// Column-level transform
// ============================================================================

enum class TransformStatus {
    Unchanged,      // Null, empty, opaque or nothing to scale
    Changed,
    Skipped,        // Not valid JSON; original kept
};

struct TransformOutcome {
    std::optional<std::string> value;
    TransformStatus status = TransformStatus::Unchanged;
    std::string reason;         // Set when skipped
};

// Multiply widget heights in a stored JSON column value by `factor`.
// Stateless: applying it twice scales twice.
TransformOutcome scale_widget_heights(std::optional<std::string_view> raw, double factor);

} // namespace dashstore::store
