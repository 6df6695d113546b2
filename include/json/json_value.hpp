//! # JSON Value Types
//!
//! The JSON document model shared by the MCP server, the CLI `--json`
//! output and the surface/diff serializers.
//!
//! - `JsonNumber` keeps integers exact (counts, ids) and only falls back to
//!   `double` for values with a fraction or exponent
//! - `JsonValue` is a variant over null, bool, number, string, array and object
//! - Arrays and objects are boxed, so a `JsonValue` is move-only; use `clone()`
//! - Objects are `std::map`, so serialized keys come out sorted
//!
//! ## Example
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("packageId", json_string("Newtonsoft.Json"));
//! obj.set("removedTypes", json_int(3));
//! std::cout << obj.to_string();   // {"packageId":"Newtonsoft.Json","removedTypes":3}
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace apidiff::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// JSON number preserving integer precision.
///
/// | JSON Input | Storage |
/// |------------|---------|
/// | `42` | `Int64` |
/// | `18446744073709551615` | `Uint64` |
/// | `3.14`, `1e10` | `Double` |
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Uint64, Double };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Double;
    }

    /// Lossless conversion to `int64_t`, or nullopt.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Lossy conversion to `double` (always succeeds).
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds compare as doubles.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// Any JSON value.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(uint64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

    // ------------------------------------------------------------------------
    // Type queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_integer();
        }
        return false;
    }

    // ------------------------------------------------------------------------
    // Accessors (throw std::bad_variant_access on a type mismatch)
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::runtime_error("JSON number cannot be converted to int64_t");
        }
        return *opt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    // ------------------------------------------------------------------------
    // Object / array access
    // ------------------------------------------------------------------------

    /// Returns the member named `key`, or nullptr if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ------------------------------------------------------------------------
    // Serialization (json_serializer.cpp)
    // ------------------------------------------------------------------------

    /// Compact form, no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented form, one member per line.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    // ------------------------------------------------------------------------
    // Copy and compare (json_value.cpp)
    // ------------------------------------------------------------------------

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

/// Builds a JSON array of strings.
inline auto json_string_array(const std::vector<std::string>& items) -> JsonValue {
    JsonArray arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JsonValue(std::move(arr));
}

} // namespace apidiff::json
