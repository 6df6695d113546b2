#include "diff/async_migration.hpp"

namespace apidiff::diff {

using surface::MethodSurface;

namespace {

auto async_name(const MethodSurface& method) -> std::string {
    return method.name + ASYNC_SUFFIX;
}

auto same_parameters(const MethodSurface& a, const MethodSurface& b) -> bool {
    if (a.parameters.size() != b.parameters.size()) {
        return false;
    }
    for (size_t i = 0; i < a.parameters.size(); ++i) {
        if (a.parameters[i].type_name != b.parameters[i].type_name) {
            return false;
        }
    }
    return true;
}

auto same_plus_cancellation(const MethodSurface& sync, const MethodSurface& async) -> bool {
    if (async.parameters.size() != sync.parameters.size() + 1 ||
        async.parameters.back().type_name != CANCELLATION_TOKEN_TYPE) {
        return false;
    }
    for (size_t i = 0; i < sync.parameters.size(); ++i) {
        if (sync.parameters[i].type_name != async.parameters[i].type_name) {
            return false;
        }
    }
    return true;
}

} // namespace

auto has_async_counterpart(const MethodSurface& removed, const surface::TypeSurface& new_type)
    -> bool {
    if (removed.is_async) {
        return false;
    }
    std::string wanted = async_name(removed);
    for (const auto& method : new_type.methods) {
        if (method.name == wanted && method.is_async) {
            return true;
        }
    }
    return false;
}

auto pick_async_counterpart(const MethodSurface& removed,
                            const std::vector<const MethodSurface*>& added,
                            const std::vector<bool>& consumed) -> std::optional<size_t> {
    std::string wanted = async_name(removed);
    auto eligible = [&](size_t i) {
        return !consumed[i] && added[i]->name == wanted && added[i]->is_async;
    };

    for (size_t i = 0; i < added.size(); ++i) {
        if (eligible(i) && same_parameters(removed, *added[i])) {
            return i;
        }
    }
    for (size_t i = 0; i < added.size(); ++i) {
        if (eligible(i) && same_plus_cancellation(removed, *added[i])) {
            return i;
        }
    }
    for (size_t i = 0; i < added.size(); ++i) {
        if (eligible(i)) {
            return i;
        }
    }
    return std::nullopt;
}

auto migration_entry(const std::string& type_full_name, const MethodSurface& removed)
    -> std::string {
    return type_full_name + "." + removed.name + " → " + async_name(removed) + " (sync to async)";
}

} // namespace apidiff::diff
