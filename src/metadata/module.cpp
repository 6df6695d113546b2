#include "metadata/module.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace apidiff::metadata {

namespace {

/// Nesting and resolution-scope chains deeper than this are treated as broken.
constexpr int MAX_CHAIN = 64;

auto join_name(std::string_view ns, std::string_view name) -> std::string {
    if (ns.empty()) {
        return std::string(name);
    }
    std::string out(ns);
    out.push_back('.');
    out.append(name);
    return out;
}

} // namespace

auto Module::load(std::string module_name, ByteBuffer bytes) -> Result<Box<Module>, MetadataError> {
    Box<Module> module(new Module());
    module->module_name_ = std::move(module_name);
    module->bytes_ = std::move(bytes);

    auto pe = PeImage::parse(module->bytes_);
    if (is_err(pe)) {
        return unwrap_err(pe);
    }
    module->pe_.emplace(std::move(unwrap(pe)));

    auto reader = MetadataReader::open(module->bytes_, *module->pe_);
    if (is_err(reader)) {
        return unwrap_err(reader);
    }
    module->reader_.emplace(std::move(unwrap(reader)));

    if (module->reader_->row_count(TableId::Assembly) == 0) {
        return MetadataError{"module has no assembly manifest", 0};
    }
    module->assembly_name_ = std::string(module->reader_->assembly().name);
    if (module->assembly_name_.empty()) {
        return MetadataError{"assembly has no name", 0};
    }

    auto indexed = module->build_indexes();
    if (is_err(indexed)) {
        return unwrap_err(indexed);
    }
    return module;
}

// ============================================================================
// Index construction
// ============================================================================

auto Module::build_indexes() -> Result<bool, MetadataError> {
    const MetadataReader& md = *reader_;
    uint32_t types = md.row_count(TableId::TypeDef);
    uint32_t methods = md.row_count(TableId::MethodDef);
    uint32_t properties = md.row_count(TableId::Property);

    // Nesting
    enclosing_.assign(types + 1, 0);
    for (uint32_t row = 1; row <= md.row_count(TableId::NestedClass); ++row) {
        auto nc = md.nested_class(row);
        if (nc.nested == 0 || nc.nested > types || nc.enclosing == 0 || nc.enclosing > types ||
            nc.nested == nc.enclosing) {
            return MetadataError{"bad NestedClass row " + std::to_string(row), 0};
        }
        enclosing_[nc.nested] = nc.enclosing;
    }

    // Full names, outermost first
    full_names_.assign(types + 1, std::string());
    for (uint32_t row = 1; row <= types; ++row) {
        std::vector<uint32_t> chain;
        for (uint32_t t = row; t != 0; t = enclosing_[t]) {
            if (chain.size() > MAX_CHAIN) {
                return MetadataError{"cyclic type nesting at TypeDef row " + std::to_string(row),
                                     0};
            }
            chain.push_back(t);
        }
        auto outer = md.type_def(chain.back());
        std::string name = join_name(outer.namespace_name, outer.name);
        for (auto it = chain.rbegin() + 1; it != chain.rend(); ++it) {
            name.push_back('+');
            name.append(md.type_def(*it).name);
        }
        by_full_name_.emplace(name, row);
        full_names_[row] = std::move(name);
    }

    // Method ownership
    method_owner_.assign(methods + 1, 0);
    for (uint32_t row = 1; row <= types; ++row) {
        auto [first, last] = md.method_range(row);
        for (uint32_t m = first; m < last; ++m) {
            method_owner_[m] = row;
        }
    }

    // Interfaces
    interfaces_.assign(types + 1, {});
    for (uint32_t row = 1; row <= md.row_count(TableId::InterfaceImpl); ++row) {
        auto impl = md.interface_impl(row);
        if (impl.class_row == 0 || impl.class_row > types) {
            return MetadataError{"bad InterfaceImpl row " + std::to_string(row), 0};
        }
        interfaces_[impl.class_row].push_back(impl.interface);
    }

    // Properties and accessors
    properties_.assign(types + 1, RowRange{1, 1});
    for (uint32_t row = 1; row <= md.row_count(TableId::PropertyMap); ++row) {
        auto map = md.property_map(row);
        if (map.parent == 0 || map.parent > types) {
            return MetadataError{"bad PropertyMap row " + std::to_string(row), 0};
        }
        properties_[map.parent] = md.property_range(row);
    }
    accessors_.assign(properties + 1, PropertyAccessors{});
    is_accessor_.assign(methods + 1, false);
    for (uint32_t row = 1; row <= md.row_count(TableId::MethodSemantics); ++row) {
        auto sem = md.method_semantics(row);
        if (sem.method == 0 || sem.method > methods) {
            continue;
        }
        is_accessor_[sem.method] = true;
        if (sem.association.table != TableId::Property) {
            continue;
        }
        auto& acc = accessors_[sem.association.row];
        if ((sem.semantics & method_semantics::GETTER) != 0) {
            acc.getter = sem.method;
        } else if ((sem.semantics & method_semantics::SETTER) != 0) {
            acc.setter = sem.method;
        }
    }

    // Custom attributes
    for (uint32_t row = 1; row <= md.row_count(TableId::CustomAttribute); ++row) {
        attributes_[key(md.custom_attribute(row).parent)].push_back(row);
    }

    // Generic parameters
    for (uint32_t row = 1; row <= md.row_count(TableId::GenericParam); ++row) {
        auto gp = md.generic_param(row);
        generic_params_[key(gp.owner)].emplace_back(gp.number, std::string(gp.name));
    }
    for (auto& [_, params] : generic_params_) {
        std::stable_sort(params.begin(), params.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
    }

    // TypeRefs
    type_refs_.assign(md.row_count(TableId::TypeRef) + 1, std::nullopt);
    for (uint32_t row = 1; row <= md.row_count(TableId::TypeRef); ++row) {
        auto resolved = resolve_type_ref(row, 0);
        if (is_err(resolved)) {
            return unwrap_err(resolved);
        }
    }

    APIDIFF_LOG_DEBUG("metadata", "Indexed " << module_name_ << " (" << assembly_name_ << "): "
                                             << types << " types, " << methods << " methods");
    return true;
}

auto Module::resolve_type_ref(uint32_t row, int depth) -> Result<bool, MetadataError> {
    if (type_refs_[row]) {
        return true;
    }
    if (depth > MAX_CHAIN) {
        return MetadataError{"broken resolution scope chain at TypeRef row " + std::to_string(row),
                             0};
    }

    const MetadataReader& md = *reader_;
    auto ref = md.type_ref(row);
    TypeRefTarget target;
    const CodedIndex& scope = ref.resolution_scope;

    if (scope.table == TableId::TypeRef && !scope.is_null()) {
        if (scope.row == row) {
            return MetadataError{"TypeRef row " + std::to_string(row) + " encloses itself", 0};
        }
        auto outer = resolve_type_ref(scope.row, depth + 1);
        if (is_err(outer)) {
            return outer;
        }
        const TypeRefTarget& enclosing = *type_refs_[scope.row];
        target.assembly_name = enclosing.assembly_name;
        target.full_name = enclosing.full_name + "+" + std::string(ref.name);
    } else {
        if (scope.table == TableId::AssemblyRef && !scope.is_null()) {
            target.assembly_name = std::string(md.assembly_ref(scope.row).name);
        }
        // Module, ModuleRef and null scopes refer to this assembly
        target.full_name = join_name(ref.namespace_name, ref.name);
    }
    type_refs_[row] = std::move(target);
    return true;
}

// ============================================================================
// Accessors
// ============================================================================

auto Module::enclosing_type(uint32_t type_row) const -> uint32_t {
    return type_row < enclosing_.size() ? enclosing_[type_row] : 0;
}

auto Module::type_full_name(uint32_t type_row) const -> const std::string& {
    static const std::string EMPTY;
    return type_row < full_names_.size() ? full_names_[type_row] : EMPTY;
}

auto Module::type_namespace(uint32_t type_row) const -> std::string_view {
    uint32_t outer = type_row;
    for (int i = 0; i < MAX_CHAIN && enclosing_type(outer) != 0; ++i) {
        outer = enclosing_type(outer);
    }
    return reader_->type_def(outer).namespace_name;
}

auto Module::find_type(std::string_view full_name) const -> uint32_t {
    auto it = by_full_name_.find(std::string(full_name));
    return it == by_full_name_.end() ? 0 : it->second;
}

auto Module::method_owner(uint32_t method_row) const -> uint32_t {
    return method_row < method_owner_.size() ? method_owner_[method_row] : 0;
}

auto Module::type_ref_target(uint32_t type_ref_row) const -> const TypeRefTarget& {
    return *type_refs_.at(type_ref_row);
}

auto Module::interfaces_of(uint32_t type_row) const -> const std::vector<CodedIndex>& {
    return interfaces_.at(type_row);
}

auto Module::properties_of(uint32_t type_row) const -> RowRange {
    return properties_.at(type_row);
}

auto Module::accessors_of(uint32_t property_row) const -> PropertyAccessors {
    return property_row < accessors_.size() ? accessors_[property_row] : PropertyAccessors{};
}

auto Module::is_accessor(uint32_t method_row) const -> bool {
    return method_row < is_accessor_.size() && is_accessor_[method_row];
}

auto Module::custom_attributes_of(CodedIndex parent) const -> const std::vector<uint32_t>& {
    static const std::vector<uint32_t> NONE;
    auto it = attributes_.find(key(parent));
    return it == attributes_.end() ? NONE : it->second;
}

auto Module::generic_params_of(CodedIndex owner) const -> std::vector<std::string> {
    std::vector<std::string> names;
    auto it = generic_params_.find(key(owner));
    if (it != generic_params_.end()) {
        for (const auto& [_, name] : it->second) {
            names.push_back(name);
        }
    }
    return names;
}

} // namespace apidiff::metadata
