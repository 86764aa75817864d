#include "store/widget_layout.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <initializer_list>

namespace json = boost::json;

namespace dashstore::store {

namespace {

// Largest magnitude a double holds as an exact integer
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

std::optional<double> number_of(const json::value& v) {
    if (v.is_int64()) return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    if (v.is_double()) return v.as_double();
    return std::nullopt;
}

// Whole results are stored as integers so 4 * 2 serializes as 8, not 8.0
json::value make_number(double x) {
    if (std::isfinite(x) && std::trunc(x) == x && std::fabs(x) < MAX_EXACT_INTEGER) {
        return json::value(static_cast<int64_t>(x));
    }
    return json::value(x);
}

json::value* find_path(json::object& obj, std::initializer_list<std::string_view> path) {
    json::object* current = &obj;
    json::value* found = nullptr;

    for (auto key : path) {
        if (!current) return nullptr;
        auto it = current->find(key);
        if (it == current->end()) return nullptr;
        found = &it->value();
        current = found->is_object() ? &found->as_object() : nullptr;
    }
    return found;
}

bool scale_at(json::object& widget, std::initializer_list<std::string_view> path, double factor) {
    json::value* slot = find_path(widget, path);
    if (!slot) return false;

    auto number = number_of(*slot);
    if (!number) return false;

    json::value scaled = make_number(*number * factor);
    if (scaled == *slot) return false;
    *slot = std::move(scaled);
    return true;
}

int scale_widgets(json::array& widgets, double factor) {
    int changed = 0;
    for (auto& widget : widgets) {
        if (widget.is_object()) {
            changed += scale_widget(widget.as_object(), factor);
        }
    }
    return changed;
}

}  // anonymous namespace

WidgetPayload classify_payload(json::value value) {
    if (value.is_array()) {
        return WidgetArrayV1{std::move(value.as_array())};
    }
    if (value.is_object()) {
        auto& obj = value.as_object();
        if (auto it = obj.find("widgets"); it != obj.end() && it->value().is_array()) {
            return DashboardConfigV1{std::move(obj)};
        }
    }
    return OpaquePayload{std::move(value)};
}

int scale_widget(json::object& widget, double factor) {
    int changed = 0;
    changed += scale_at(widget, {"h"}, factor) ? 1 : 0;
    changed += scale_at(widget, {"layouts", "lg", "h"}, factor) ? 1 : 0;
    changed += scale_at(widget, {"layouts", "sm", "h"}, factor) ? 1 : 0;
    changed += scale_at(widget, {"layout", "h"}, factor) ? 1 : 0;
    return changed;
}

int scale_payload(WidgetPayload& payload, double factor) {
    if (auto* arr = std::get_if<WidgetArrayV1>(&payload)) {
        return scale_widgets(arr->widgets, factor);
    }
    if (auto* dash = std::get_if<DashboardConfigV1>(&payload)) {
        return scale_widgets(dash->config["widgets"].as_array(), factor);
    }
    return 0;
}

void write_value(std::string& out, const json::value& v);

void write_object(std::string& out, const json::object& obj) {
    out += '{';
    bool first = true;
    for (const auto& kv : obj) {
        if (!first) out += ',';
        first = false;
        out += json::serialize(kv.key());
        out += ':';
        write_value(out, kv.value());
    }
    out += '}';
}

void write_array(std::string& out, const json::array& arr) {
    out += '[';
    bool first = true;
    for (const auto& item : arr) {
        if (!first) out += ',';
        first = false;
        write_value(out, item);
    }
    out += ']';
}

// Doubles are written in plain decimal form (0.5, not 5E-1) so untouched
// fields keep the text the application stored
void write_value(std::string& out, const json::value& v) {
    switch (v.kind()) {
        case json::kind::object:
            write_object(out, v.get_object());
            break;
        case json::kind::array:
            write_array(out, v.get_array());
            break;
        case json::kind::double_:
            out += fmt::format("{}", v.get_double());
            break;
        default:
            out += json::serialize(v);
            break;
    }
}

std::string serialize_payload(const WidgetPayload& payload) {
    std::string out;
    if (auto* arr = std::get_if<WidgetArrayV1>(&payload)) {
        write_array(out, arr->widgets);
    } else if (auto* dash = std::get_if<DashboardConfigV1>(&payload)) {
        write_object(out, dash->config);
    } else {
        write_value(out, std::get<OpaquePayload>(payload).value);
    }
    return out;
}

TransformOutcome scale_widget_heights(std::optional<std::string_view> raw, double factor) {
    TransformOutcome outcome;
    if (!raw) {
        return outcome;
    }
    outcome.value = std::string(*raw);
    if (raw->empty()) {
        return outcome;
    }

    boost::system::error_code ec;
    auto parsed = json::parse(*raw, ec);
    if (ec) {
        outcome.status = TransformStatus::Skipped;
        outcome.reason = "invalid JSON: " + ec.message();
        return outcome;
    }

    auto payload = classify_payload(std::move(parsed));
    if (scale_payload(payload, factor) == 0) {
        return outcome;
    }

    outcome.value = serialize_payload(payload);
    outcome.status = TransformStatus::Changed;
    return outcome;
}

} // namespace dashstore::store
