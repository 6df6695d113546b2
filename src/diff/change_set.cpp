#include "diff/change_set.hpp"

namespace apidiff::diff {

auto ChangeSet::has_breaking_changes() const -> bool {
    return !removed_types.empty() || !removed_methods.empty() || !removed_properties.empty() ||
           !removed_interfaces.empty() || !base_class_changes.empty() ||
           !async_migrations.empty();
}

auto ChangeSet::has_additions() const -> bool {
    return !added_types.empty() || !added_methods.empty() || !added_properties.empty() ||
           !added_interfaces.empty();
}

auto ChangeSet::has_deprecations() const -> bool {
    return !obsolete_types.empty() || !obsolete_methods.empty();
}

auto ChangeSet::is_empty() const -> bool {
    return !has_breaking_changes() && !has_additions() && !has_deprecations() &&
           namespace_changes.empty();
}

} // namespace apidiff::diff
