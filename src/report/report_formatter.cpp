#include "report/report_formatter.hpp"

#include <algorithm>
#include <sstream>

namespace apidiff::report {

namespace {

void append_list(std::ostringstream& out, const std::vector<std::string>& items,
                 const char* header) {
    if (items.empty()) {
        return;
    }
    out << "### " << header << " (" << items.size() << ")\n";
    size_t shown = std::min(items.size(), MAX_LIST_ITEMS);
    for (size_t i = 0; i < shown; ++i) {
        out << "- " << items[i] << "\n";
    }
    if (items.size() > MAX_LIST_ITEMS) {
        out << "- ... and " << (items.size() - MAX_LIST_ITEMS) << " more\n";
    }
    out << "\n";
}

} // namespace

auto format_change_set(const diff::ChangeSet& changes) -> std::string {
    std::ostringstream out;

    if (changes.has_breaking_changes()) {
        out << "## Breaking Changes\n";
        append_list(out, changes.removed_types, "Removed Types");
        append_list(out, changes.removed_methods, "Removed Methods");
        append_list(out, changes.removed_properties, "Removed Properties");
        append_list(out, changes.removed_interfaces, "Removed Interfaces");
        append_list(out, changes.base_class_changes, "Base Class Changes");
        append_list(out, changes.async_migrations, "Sync → Async Migrations");
        append_list(out, changes.namespace_changes, "Namespace Changes");
    }

    if (changes.has_deprecations()) {
        out << "## Deprecations\n";
        append_list(out, changes.obsolete_types, "Obsolete Types");
        append_list(out, changes.obsolete_methods, "Obsolete Methods");
    }

    if (changes.has_additions()) {
        out << "## New Features\n";
        append_list(out, changes.added_types, "New Types");
        append_list(out, changes.added_methods, "New Methods");
        append_list(out, changes.added_properties, "New Properties");
        append_list(out, changes.added_interfaces, "New Interfaces");
    }

    if (changes.is_meta_package) {
        out << "## Meta-Package\n";
        out << "This package contains no assemblies, only dependencies:\n";
        const auto& deps = changes.meta_dependencies;
        size_t shown = std::min(deps.size(), MAX_META_DEPENDENCIES);
        for (size_t i = 0; i < shown; ++i) {
            out << "- " << deps[i] << "\n";
        }
        if (deps.size() > MAX_META_DEPENDENCIES) {
            out << "... and " << (deps.size() - MAX_META_DEPENDENCIES) << " more\n";
        }
    }

    if (changes.comparison_error) {
        out << "\n**Warning:** " << *changes.comparison_error << "\n";
    }
    return out.str();
}

auto format_version_report(const diff::DiffResult& result) -> std::string {
    return "# API Changes: " + result.package_id() + "\n**" + result.from_version() + " → " +
           result.to_version() + "**\n\n" + format_change_set(result.changes());
}

} // namespace apidiff::report
