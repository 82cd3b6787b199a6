#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voxfleet {

namespace json = boost::json;

// Safe JSON field accessors with defaults
inline std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

inline bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

inline int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
        if (it->value().is_double()) return static_cast<int64_t>(it->value().as_double());
    }
    return def;
}

inline uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64() && it->value().as_int64() >= 0)
            return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

inline double jdouble(const json::object& obj, std::string_view key, double def = 0.0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_double()) return it->value().as_double();
        if (it->value().is_int64()) return static_cast<double>(it->value().as_int64());
        if (it->value().is_uint64()) return static_cast<double>(it->value().as_uint64());
    }
    return def;
}

inline const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

inline const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

// Parse text into an object, nullopt on malformed input or a non-object root
inline std::optional<json::object> parse_object(std::string_view text) {
    boost::system::error_code ec;
    auto jv = json::parse(text, ec);
    if (ec || !jv.is_object()) {
        return std::nullopt;
    }
    return std::move(jv.as_object());
}

} // namespace voxfleet
