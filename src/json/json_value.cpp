//! # JSON Value Implementation
//!
//! Deep copy and structural equality for `JsonValue`.

#include "json/json_value.hpp"

namespace apidiff::json {

auto JsonValue::clone() const -> JsonValue {
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj.emplace(key, val.clone());
        }
        return JsonValue(std::move(obj));
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (!(a[i] == b[i])) {
                return false;
            }
        }
        return true;
    }
    const auto& a = as_object();
    const auto& b = other.as_object();
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, val] : a) {
        auto it = b.find(key);
        if (it == b.end() || !(val == it->second)) {
            return false;
        }
    }
    return true;
}

} // namespace apidiff::json
