#include "diff/diff_json.hpp"

namespace apidiff::diff {

auto to_json(const ChangeSet& changes) -> json::JsonValue {
    auto object = json::json_object();
    object.set("removedTypes", json::json_string_array(changes.removed_types));
    object.set("addedTypes", json::json_string_array(changes.added_types));
    object.set("removedMethods", json::json_string_array(changes.removed_methods));
    object.set("addedMethods", json::json_string_array(changes.added_methods));
    object.set("removedProperties", json::json_string_array(changes.removed_properties));
    object.set("addedProperties", json::json_string_array(changes.added_properties));
    object.set("removedInterfaces", json::json_string_array(changes.removed_interfaces));
    object.set("addedInterfaces", json::json_string_array(changes.added_interfaces));
    object.set("baseClassChanges", json::json_string_array(changes.base_class_changes));
    object.set("obsoleteTypes", json::json_string_array(changes.obsolete_types));
    object.set("obsoleteMethods", json::json_string_array(changes.obsolete_methods));
    object.set("asyncChanges", json::json_string_array(changes.async_migrations));
    object.set("namespaceChanges", json::json_string_array(changes.namespace_changes));
    object.set("isMetaPackage", json::json_bool(changes.is_meta_package));
    object.set("metaDependencies", json::json_string_array(changes.meta_dependencies));
    if (changes.comparison_error) {
        object.set("comparisonError", json::json_string(*changes.comparison_error));
    }
    object.set("hasBreakingChanges", json::json_bool(changes.has_breaking_changes()));
    object.set("hasAdditions", json::json_bool(changes.has_additions()));
    return object;
}

auto to_json(const DiffResult& result) -> json::JsonValue {
    auto object = json::json_object();
    object.set("packageId", json::json_string(result.package_id()));
    object.set("fromVersion", json::json_string(result.from_version()));
    object.set("toVersion", json::json_string(result.to_version()));
    object.set("changes", to_json(result.changes()));
    return object;
}

} // namespace apidiff::diff
