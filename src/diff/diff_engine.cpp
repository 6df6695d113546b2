#include "diff/diff_engine.hpp"

#include "diff/async_migration.hpp"
#include "log/log.hpp"

#include <unordered_map>
#include <unordered_set>

namespace apidiff::diff {

using surface::MethodSurface;
using surface::TypeSurface;

namespace {

constexpr const char* CANCELLED_MESSAGE = "Comparison cancelled";

auto index_by_name(const std::vector<TypeSurface>& types)
    -> std::unordered_map<std::string, const TypeSurface*> {
    std::unordered_map<std::string, const TypeSurface*> index;
    for (const auto& type : types) {
        index.emplace(type.full_name, &type);
    }
    return index;
}

auto with_message(std::string entry, const std::optional<std::string>& message) -> std::string {
    if (message && !message->empty()) {
        entry += ": " + *message;
    }
    return entry;
}

void compare_interfaces(const TypeSurface& old_type, const TypeSurface& new_type,
                        ChangeSet& changes) {
    std::unordered_set<std::string> old_set(old_type.interfaces.begin(),
                                            old_type.interfaces.end());
    std::unordered_set<std::string> new_set(new_type.interfaces.begin(),
                                            new_type.interfaces.end());
    for (const auto& iface : old_type.interfaces) {
        if (new_set.count(iface) == 0) {
            changes.removed_interfaces.push_back(old_type.full_name + " no longer implements " +
                                                 iface);
        }
    }
    for (const auto& iface : new_type.interfaces) {
        if (old_set.count(iface) == 0) {
            changes.added_interfaces.push_back(new_type.full_name + " now implements " + iface);
        }
    }
}

void compare_methods(const TypeSurface& old_type, const TypeSurface& new_type,
                     ChangeSet& changes) {
    std::unordered_set<std::string> old_signatures;
    for (const auto& method : old_type.methods) {
        old_signatures.insert(method.signature);
    }
    std::unordered_set<std::string> new_signatures;
    std::vector<const MethodSurface*> added;
    for (const auto& method : new_type.methods) {
        new_signatures.insert(method.signature);
        if (old_signatures.count(method.signature) == 0) {
            added.push_back(&method);
        }
    }

    std::vector<bool> consumed(added.size(), false);
    for (const auto& method : old_type.methods) {
        if (new_signatures.count(method.signature) != 0) {
            continue;
        }
        if (has_async_counterpart(method, new_type)) {
            changes.async_migrations.push_back(migration_entry(old_type.full_name, method));
            if (auto pick = pick_async_counterpart(method, added, consumed)) {
                consumed[*pick] = true;
            }
            continue;
        }
        changes.removed_methods.push_back(old_type.full_name + "." + method.signature);
    }

    for (size_t i = 0; i < added.size(); ++i) {
        if (!consumed[i]) {
            changes.added_methods.push_back(new_type.full_name + "." + added[i]->signature);
        }
    }
}

void compare_properties(const TypeSurface& old_type, const TypeSurface& new_type,
                        ChangeSet& changes) {
    auto old_names = old_type.property_names();
    auto new_names = new_type.property_names();
    std::unordered_set<std::string> old_set(old_names.begin(), old_names.end());
    std::unordered_set<std::string> new_set(new_names.begin(), new_names.end());
    for (const auto& name : old_names) {
        if (new_set.count(name) == 0) {
            changes.removed_properties.push_back(old_type.full_name + "." + name);
        }
    }
    for (const auto& name : new_names) {
        if (old_set.count(name) == 0) {
            changes.added_properties.push_back(new_type.full_name + "." + name);
        }
    }
}

void compare_type(const TypeSurface& old_type, const TypeSurface& new_type, ChangeSet& changes) {
    compare_interfaces(old_type, new_type, changes);

    if (old_type.base_type && new_type.base_type && *old_type.base_type != *new_type.base_type) {
        changes.base_class_changes.push_back(old_type.full_name + ": " + *old_type.base_type +
                                             " → " + *new_type.base_type);
    }
    if (old_type.namespace_name != new_type.namespace_name) {
        changes.namespace_changes.push_back(old_type.full_name + " → " + new_type.full_name);
    }

    compare_methods(old_type, new_type, changes);
    compare_properties(old_type, new_type, changes);

    // Deprecations are read from the new side only
    if (new_type.obsolete_message) {
        changes.obsolete_types.push_back(
            with_message(new_type.full_name, new_type.obsolete_message));
    }
    for (const auto& method : new_type.methods) {
        if (method.obsolete_message) {
            changes.obsolete_methods.push_back(
                with_message(new_type.full_name + "." + method.name, method.obsolete_message));
        }
    }
}

/// A removed type whose simple name and kind match exactly one added type
/// in another namespace.
void detect_moves(const std::vector<const TypeSurface*>& removed,
                  const std::vector<const TypeSurface*>& added, ChangeSet& changes) {
    for (const TypeSurface* old_type : removed) {
        const TypeSurface* target = nullptr;
        int matches = 0;
        for (const TypeSurface* new_type : added) {
            if (new_type->name == old_type->name && new_type->kind == old_type->kind &&
                new_type->namespace_name != old_type->namespace_name) {
                target = new_type;
                ++matches;
            }
        }
        if (matches == 1) {
            changes.namespace_changes.push_back(old_type->full_name + " → " + target->full_name);
        }
    }
}

} // namespace

auto compare_surfaces(const std::vector<TypeSurface>& old_types,
                      const std::vector<TypeSurface>& new_types, const CancellationToken& cancel)
    -> ChangeSet {
    ChangeSet changes;
    auto old_index = index_by_name(old_types);
    auto new_index = index_by_name(new_types);

    std::vector<const TypeSurface*> removed;
    for (const auto& old_type : old_types) {
        if (cancel.is_cancelled()) {
            changes.comparison_error = CANCELLED_MESSAGE;
            return changes;
        }
        if (old_index.at(old_type.full_name) != &old_type) {
            continue; // duplicate name, first occurrence already compared
        }
        auto it = new_index.find(old_type.full_name);
        if (it == new_index.end()) {
            changes.removed_types.push_back(old_type.full_name);
            removed.push_back(&old_type);
            continue;
        }
        compare_type(old_type, *it->second, changes);
    }

    std::vector<const TypeSurface*> added;
    for (const auto& new_type : new_types) {
        if (cancel.is_cancelled()) {
            changes.comparison_error = CANCELLED_MESSAGE;
            return changes;
        }
        if (new_index.at(new_type.full_name) != &new_type) {
            continue;
        }
        if (old_index.count(new_type.full_name) == 0) {
            changes.added_types.push_back(new_type.full_name);
            added.push_back(&new_type);
        }
    }

    detect_moves(removed, added, changes);

    APIDIFF_LOG_DEBUG("diff", "Compared " << old_types.size() << " → " << new_types.size()
                                          << " types: " << changes.removed_types.size()
                                          << " removed, " << changes.added_types.size()
                                          << " added, " << changes.async_migrations.size()
                                          << " async migrations");
    return changes;
}

} // namespace apidiff::diff
