#include "inspector/result_json.hpp"

namespace apidiff::inspector {

namespace {

void set_optional(json::JsonValue& object, const std::string& key,
                  const std::optional<std::string>& value) {
    if (value) {
        object.set(key, json::json_string(*value));
    }
}

auto count(size_t value) -> json::JsonValue {
    return json::json_int(static_cast<int64_t>(value));
}

} // namespace

auto to_json(const DecompileResult& result) -> json::JsonValue {
    auto object = json::json_object();
    object.set("packageId", json::json_string(result.package_id));
    object.set("version", json::json_string(result.version));
    set_optional(object, "typeName", result.type_name);
    set_optional(object, "sourceCode", result.source);
    set_optional(object, "error", result.error);
    return object;
}

auto to_json(const ObsoleteApisResult& result) -> json::JsonValue {
    auto object = json::json_object();
    object.set("packageId", json::json_string(result.package_id));
    object.set("version", json::json_string(result.version));
    auto items = json::json_array();
    for (const auto& item : result.items) {
        auto entry = json::json_object();
        entry.set("name", json::json_string(item.name));
        entry.set("kind", json::json_string(item.kind));
        entry.set("message", json::json_string(item.message));
        items.push(std::move(entry));
    }
    object.set("items", std::move(items));
    set_optional(object, "error", result.error);
    return object;
}

auto to_json(const BreakingChangesCheck& check) -> json::JsonValue {
    auto object = json::json_object();
    object.set("packageId", json::json_string(check.package_id));
    object.set("fromVersion", json::json_string(check.from_version));
    object.set("toVersion", json::json_string(check.to_version));
    object.set("hasBreakingChanges", json::json_bool(check.has_breaking_changes));
    object.set("removedTypesCount", count(check.removed_types_count));
    object.set("removedMethodsCount", count(check.removed_methods_count));
    object.set("syncToAsyncCount", count(check.sync_to_async_count));
    object.set("hasNewFeatures", json::json_bool(check.has_new_features));
    object.set("addedTypesCount", count(check.added_types_count));
    object.set("addedMethodsCount", count(check.added_methods_count));
    set_optional(object, "comparisonError", check.comparison_error);
    return object;
}

} // namespace apidiff::inspector
