#include "surface/surface_json.hpp"

namespace apidiff::surface {

using json::JsonError;
using json::JsonValue;

namespace {

void set_optional(JsonValue& object, const std::string& key,
                  const std::optional<std::string>& value) {
    if (value) {
        object.set(key, json::json_string(*value));
    }
}

// ============================================================================
// Field readers
// ============================================================================

auto field(const JsonValue& object, const std::string& key) -> const JsonValue* {
    return object.is_object() ? object.get(key) : nullptr;
}

auto read_string(const JsonValue& object, const std::string& key)
    -> Result<std::string, JsonError> {
    const JsonValue* value = field(object, key);
    if (value == nullptr || !value->is_string()) {
        return JsonError::make("expected string field '" + key + "'");
    }
    return value->as_string();
}

auto read_bool(const JsonValue& object, const std::string& key) -> Result<bool, JsonError> {
    const JsonValue* value = field(object, key);
    if (value == nullptr || !value->is_bool()) {
        return JsonError::make("expected boolean field '" + key + "'");
    }
    return value->as_bool();
}

auto read_optional(const JsonValue& object, const std::string& key)
    -> Result<std::optional<std::string>, JsonError> {
    const JsonValue* value = field(object, key);
    if (value == nullptr || value->is_null()) {
        return std::optional<std::string>();
    }
    if (!value->is_string()) {
        return JsonError::make("expected string field '" + key + "'");
    }
    return std::optional<std::string>(value->as_string());
}

auto read_array(const JsonValue& object, const std::string& key)
    -> Result<const json::JsonArray*, JsonError> {
    const JsonValue* value = field(object, key);
    if (value == nullptr || !value->is_array()) {
        return JsonError::make("expected array field '" + key + "'");
    }
    return &value->as_array();
}

auto read_strings(const JsonValue& object, const std::string& key)
    -> Result<std::vector<std::string>, JsonError> {
    auto array = read_array(object, key);
    if (is_err(array)) {
        return unwrap_err(array);
    }
    std::vector<std::string> items;
    for (const auto& item : *unwrap(array)) {
        if (!item.is_string()) {
            return JsonError::make("expected strings in '" + key + "'");
        }
        items.push_back(item.as_string());
    }
    return items;
}

#define TRY_FIELD(target, expr)                                                                    \
    do {                                                                                           \
        auto _r = (expr);                                                                          \
        if (is_err(_r)) {                                                                          \
            return unwrap_err(_r);                                                                 \
        }                                                                                          \
        target = std::move(unwrap(_r));                                                            \
    } while (0)

auto parameter_from_json(const JsonValue& value) -> Result<ParameterSurface, JsonError> {
    ParameterSurface parameter;
    TRY_FIELD(parameter.name, read_string(value, "name"));
    TRY_FIELD(parameter.type_name, read_string(value, "type"));
    TRY_FIELD(parameter.has_default, read_bool(value, "hasDefault"));
    return parameter;
}

auto method_from_json(const JsonValue& value) -> Result<MethodSurface, JsonError> {
    MethodSurface method;
    TRY_FIELD(method.name, read_string(value, "name"));
    TRY_FIELD(method.signature, read_string(value, "signature"));
    TRY_FIELD(method.return_type, read_string(value, "returnType"));
    TRY_FIELD(method.is_static, read_bool(value, "isStatic"));
    TRY_FIELD(method.is_async, read_bool(value, "isAsync"));
    TRY_FIELD(method.obsolete_message, read_optional(value, "obsoleteMessage"));

    const json::JsonArray* parameters = nullptr;
    TRY_FIELD(parameters, read_array(value, "parameters"));
    for (const auto& item : *parameters) {
        ParameterSurface parameter;
        TRY_FIELD(parameter, parameter_from_json(item));
        method.parameters.push_back(std::move(parameter));
    }
    return method;
}

auto property_from_json(const JsonValue& value) -> Result<PropertySurface, JsonError> {
    PropertySurface property;
    TRY_FIELD(property.name, read_string(value, "name"));
    TRY_FIELD(property.type_name, read_string(value, "type"));
    TRY_FIELD(property.can_read, read_bool(value, "canRead"));
    TRY_FIELD(property.can_write, read_bool(value, "canWrite"));
    return property;
}

} // namespace

// ============================================================================
// Writers
// ============================================================================

auto to_json(const TypeSurface& type) -> JsonValue {
    auto object = json::json_object();
    object.set("fullName", json::json_string(type.full_name));
    object.set("namespace", json::json_string(type.namespace_name));
    object.set("name", json::json_string(type.name));
    object.set("kind", json::json_string(type.kind));
    object.set("isPublic", json::json_bool(type.is_public));
    set_optional(object, "baseType", type.base_type);
    object.set("interfaces", json::json_string_array(type.interfaces));
    set_optional(object, "obsoleteMessage", type.obsolete_message);

    auto methods = json::json_array();
    for (const auto& method : type.methods) {
        auto entry = json::json_object();
        entry.set("name", json::json_string(method.name));
        entry.set("signature", json::json_string(method.signature));
        entry.set("returnType", json::json_string(method.return_type));
        entry.set("isStatic", json::json_bool(method.is_static));
        entry.set("isAsync", json::json_bool(method.is_async));
        set_optional(entry, "obsoleteMessage", method.obsolete_message);
        auto parameters = json::json_array();
        for (const auto& parameter : method.parameters) {
            auto p = json::json_object();
            p.set("name", json::json_string(parameter.name));
            p.set("type", json::json_string(parameter.type_name));
            p.set("hasDefault", json::json_bool(parameter.has_default));
            parameters.push(std::move(p));
        }
        entry.set("parameters", std::move(parameters));
        methods.push(std::move(entry));
    }
    object.set("methods", std::move(methods));

    auto properties = json::json_array();
    for (const auto& property : type.properties) {
        auto entry = json::json_object();
        entry.set("name", json::json_string(property.name));
        entry.set("type", json::json_string(property.type_name));
        entry.set("canRead", json::json_bool(property.can_read));
        entry.set("canWrite", json::json_bool(property.can_write));
        properties.push(std::move(entry));
    }
    object.set("properties", std::move(properties));
    return object;
}

auto to_json(const std::vector<TypeSurface>& types) -> JsonValue {
    auto array = json::json_array();
    for (const auto& type : types) {
        array.push(to_json(type));
    }
    return array;
}

auto to_json(const ApiSurface& surface) -> JsonValue {
    auto object = json::json_object();
    object.set("packageId", json::json_string(surface.package_id));
    object.set("version", json::json_string(surface.version));
    object.set("archiveSha512", json::json_string(surface.archive_sha512));
    object.set("typeCount", json::json_int(static_cast<int64_t>(surface.types.size())));
    object.set("types", to_json(surface.types));
    object.set("skippedModules", json::json_string_array(surface.skipped_modules));
    set_optional(object, "error", surface.error);
    return object;
}

// ============================================================================
// Readers
// ============================================================================

auto type_from_json(const JsonValue& value) -> Result<TypeSurface, JsonError> {
    if (!value.is_object()) {
        return JsonError::make("expected type object");
    }
    TypeSurface type;
    TRY_FIELD(type.full_name, read_string(value, "fullName"));
    TRY_FIELD(type.namespace_name, read_string(value, "namespace"));
    TRY_FIELD(type.name, read_string(value, "name"));
    TRY_FIELD(type.kind, read_string(value, "kind"));
    TRY_FIELD(type.is_public, read_bool(value, "isPublic"));
    TRY_FIELD(type.base_type, read_optional(value, "baseType"));
    TRY_FIELD(type.interfaces, read_strings(value, "interfaces"));
    TRY_FIELD(type.obsolete_message, read_optional(value, "obsoleteMessage"));

    const json::JsonArray* methods = nullptr;
    TRY_FIELD(methods, read_array(value, "methods"));
    for (const auto& item : *methods) {
        MethodSurface method;
        TRY_FIELD(method, method_from_json(item));
        type.methods.push_back(std::move(method));
    }

    const json::JsonArray* properties = nullptr;
    TRY_FIELD(properties, read_array(value, "properties"));
    for (const auto& item : *properties) {
        PropertySurface property;
        TRY_FIELD(property, property_from_json(item));
        type.properties.push_back(std::move(property));
    }
    return type;
}

auto types_from_json(const JsonValue& value) -> Result<std::vector<TypeSurface>, JsonError> {
    if (!value.is_array()) {
        return JsonError::make("expected array of types");
    }
    std::vector<TypeSurface> types;
    for (const auto& item : value.as_array()) {
        TypeSurface type;
        TRY_FIELD(type, type_from_json(item));
        types.push_back(std::move(type));
    }
    return types;
}

auto surface_from_json(const JsonValue& value) -> Result<ApiSurface, JsonError> {
    if (!value.is_object()) {
        return JsonError::make("expected surface object");
    }
    ApiSurface surface;
    TRY_FIELD(surface.package_id, read_string(value, "packageId"));
    TRY_FIELD(surface.version, read_string(value, "version"));
    TRY_FIELD(surface.archive_sha512, read_string(value, "archiveSha512"));
    TRY_FIELD(surface.skipped_modules, read_strings(value, "skippedModules"));
    TRY_FIELD(surface.error, read_optional(value, "error"));

    const JsonValue* types = field(value, "types");
    if (types == nullptr) {
        return JsonError::make("expected array field 'types'");
    }
    TRY_FIELD(surface.types, types_from_json(*types));
    return surface;
}

#undef TRY_FIELD

} // namespace apidiff::surface
