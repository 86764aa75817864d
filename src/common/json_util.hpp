#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace dashstore {

// Safe JSON field accessors with defaults

inline std::string jstr(const boost::json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

inline bool jbool(const boost::json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

inline int64_t jint(const boost::json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

inline const boost::json::object* jsection(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

} // namespace dashstore
