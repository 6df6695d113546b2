#include "surface/surface_extractor.hpp"

#include "log/log.hpp"
#include "metadata/custom_attribute.hpp"
#include "metadata/signature.hpp"
#include "metadata/type_names.hpp"

#include <functional>
#include <unordered_set>

namespace apidiff::surface {

namespace md = metadata;

namespace {

constexpr const char* MODULE_PSEUDO_TYPE = "<Module>";
/// Base-type and interface chains deeper than this are cut off.
constexpr int MAX_HIERARCHY = 32;
constexpr uint16_t ACCESS_PRIVATE = 0x0001;

/// A type in the hierarchy walk, with the generic arguments in scope.
struct TypeFrame {
    const md::Module* module = nullptr;
    uint32_t row = 0;
    md::GenericContext context;
};

auto type_index(uint32_t row) -> md::CodedIndex {
    return md::CodedIndex{md::TableId::TypeDef, row};
}

/// Frame for a TypeDefOrRef/TypeSpec seen from `from`, if it resolves inside
/// the context.
auto frame_for(const md::LoadContext& context, const TypeFrame& from, md::CodedIndex type)
    -> std::optional<TypeFrame> {
    if (type.is_null()) {
        return std::nullopt;
    }
    if (type.table != md::TableId::TypeSpec) {
        auto resolved = context.resolve(*from.module, type);
        if (!resolved) {
            return std::nullopt;
        }
        return TypeFrame{resolved->module, resolved->row,
                         md::GenericContext::for_type(*resolved->module, resolved->row)};
    }

    const auto& reader = from.module->reader();
    auto spec = md::decode_type_spec(reader.blob_at(reader.type_spec(type.row).signature));
    if (is_err(spec)) {
        APIDIFF_LOG_DEBUG("surface", "Undecodable type spec in " << from.module->module_name()
                                                                 << ": "
                                                                 << unwrap_err(spec).message);
        return std::nullopt;
    }
    const md::TypeSig& sig = unwrap(spec);
    if (sig.kind != md::TypeSigKind::GenericInst) {
        return std::nullopt;
    }
    auto resolved = context.resolve(*from.module, sig.type);
    if (!resolved) {
        return std::nullopt;
    }

    TypeFrame frame{resolved->module, resolved->row, {}};
    for (const auto& arg : sig.args) {
        frame.context.type_args_short.push_back(
            md::display_name(*from.module, arg, from.context, md::NameStyle::Short));
        frame.context.type_args_full.push_back(
            md::display_name(*from.module, arg, from.context, md::NameStyle::Full));
    }
    return frame;
}

auto base_frame(const md::LoadContext& context, const TypeFrame& frame)
    -> std::optional<TypeFrame> {
    return frame_for(context, frame, frame.module->reader().type_def(frame.row).extends);
}

auto type_kind(const md::Module& module, uint32_t row) -> const char* {
    namespace ta = md::type_attributes;
    auto def = module.reader().type_def(row);
    if ((def.flags & ta::INTERFACE) != 0) {
        return kind::INTERFACE;
    }
    if (!def.extends.is_null()) {
        auto base = md::definition_name(module, def.extends);
        if (is_ok(base)) {
            const std::string& base_name = unwrap(base);
            if (base_name == "System.Enum") {
                return kind::ENUM;
            }
            if (base_name == "System.ValueType" && module.type_full_name(row) != "System.Enum") {
                return kind::STRUCT;
            }
        }
    }
    bool is_abstract = (def.flags & ta::ABSTRACT) != 0;
    bool is_sealed = (def.flags & ta::SEALED) != 0;
    if (is_abstract && is_sealed) {
        return kind::STATIC_CLASS;
    }
    if (is_abstract) {
        return kind::ABSTRACT_CLASS;
    }
    if (is_sealed) {
        return kind::SEALED_CLASS;
    }
    return kind::CLASS;
}

/// Builds one method record. Returns nullopt when its signature is unreadable.
auto build_method(const md::Module& module, uint32_t row, const md::GenericContext& type_context)
    -> std::optional<MethodSurface> {
    const auto& reader = module.reader();
    auto def = reader.method_def(row);
    auto sig = md::decode_method_sig(reader.blob_at(def.signature));
    if (is_err(sig)) {
        APIDIFF_LOG_DEBUG("surface", "Skipping method " << module.type_full_name(module.method_owner(row))
                                                        << "." << def.name << ": "
                                                        << unwrap_err(sig).message);
        return std::nullopt;
    }
    const md::MethodSig& method_sig = unwrap(sig);
    md::GenericContext context = type_context.with_method(module, row);

    // Param rows by sequence number; sequence 0 describes the return value
    std::vector<const md::ParamRow*> by_sequence(method_sig.params.size() + 1, nullptr);
    std::vector<md::ParamRow> param_rows;
    auto [first, last] = reader.param_range(row);
    for (uint32_t p = first; p < last; ++p) {
        param_rows.push_back(reader.param(p));
    }
    for (const auto& param : param_rows) {
        if (param.sequence < by_sequence.size()) {
            by_sequence[param.sequence] = &param;
        }
    }

    MethodSurface method;
    method.name = std::string(def.name);
    method.signature = method.name + "(";
    for (size_t i = 0; i < method_sig.params.size(); ++i) {
        const md::ParamRow* param = by_sequence[i + 1];
        ParameterSurface surface;
        surface.name = param != nullptr && !param->name.empty() ? std::string(param->name) : "arg";
        surface.type_name =
            md::display_name(module, method_sig.params[i], context, md::NameStyle::Full);
        surface.has_default =
            param != nullptr && (param->flags & md::param_attributes::HAS_DEFAULT) != 0;
        if (i > 0) {
            method.signature.push_back(',');
        }
        method.signature +=
            md::display_name(module, method_sig.params[i], context, md::NameStyle::Short);
        method.parameters.push_back(std::move(surface));
    }
    method.signature.push_back(')');
    method.return_type =
        md::display_name(module, method_sig.return_type, context, md::NameStyle::Full);
    method.is_static = (def.flags & md::method_attributes::STATIC) != 0;
    method.is_async = is_async_return_type(method.return_type);
    method.obsolete_message =
        md::find_obsolete(module, md::CodedIndex{md::TableId::MethodDef, row});
    return method;
}

struct PropertyInfo {
    PropertySurface surface;
    bool is_static = false;
    bool is_public = false;
    bool is_private = false;
};

auto build_property(const md::Module& module, uint32_t row, const md::GenericContext& context)
    -> std::optional<PropertyInfo> {
    const auto& reader = module.reader();
    auto def = reader.property(row);
    auto sig = md::decode_property_sig(reader.blob_at(def.signature));
    if (is_err(sig)) {
        APIDIFF_LOG_DEBUG("surface", "Skipping property " << def.name << ": "
                                                          << unwrap_err(sig).message);
        return std::nullopt;
    }

    PropertyInfo info;
    info.surface.name = std::string(def.name);
    info.surface.type_name =
        md::display_name(module, unwrap(sig).type, context, md::NameStyle::Full);

    auto accessors = module.accessors_of(row);
    info.surface.can_read = accessors.getter != 0;
    info.surface.can_write = accessors.setter != 0;
    info.is_private = true;
    for (uint32_t accessor : {accessors.getter, accessors.setter}) {
        if (accessor == 0) {
            continue;
        }
        auto flags = reader.method_def(accessor).flags;
        uint16_t access = flags & md::method_attributes::ACCESS_MASK;
        info.is_public = info.is_public || access == md::method_attributes::PUBLIC;
        info.is_private = info.is_private && access == ACCESS_PRIVATE;
        info.is_static = (flags & md::method_attributes::STATIC) != 0;
    }
    return info;
}

} // namespace

// ============================================================================
// Async shape
// ============================================================================

auto is_async_return_type(std::string_view full_type_name) -> bool {
    for (std::string_view task : {std::string_view("System.Threading.Tasks.Task"),
                                  std::string_view("System.Threading.Tasks.ValueTask")}) {
        if (full_type_name == task) {
            return true;
        }
        if (full_type_name.size() > task.size() + 1 && full_type_name.substr(0, task.size()) == task &&
            full_type_name[task.size()] == '<') {
            return true;
        }
    }
    return false;
}

auto TypeSurface::property_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& property : properties) {
        if (seen.insert(property.name).second) {
            names.push_back(property.name);
        }
    }
    return names;
}

// ============================================================================
// Extractor
// ============================================================================

SurfaceExtractor::SurfaceExtractor(const md::LoadContext& context, ExtractOptions options)
    : context_(context), options_(options) {}

auto SurfaceExtractor::is_visible(const md::Module& module, uint32_t type_row) const -> bool {
    namespace ta = md::type_attributes;
    auto def = module.reader().type_def(type_row);
    if (def.name == MODULE_PSEUDO_TYPE && def.namespace_name.empty()) {
        return false;
    }
    if (options_.include_non_public) {
        return true;
    }

    uint32_t row = type_row;
    for (int depth = 0; depth < MAX_HIERARCHY; ++depth) {
        uint32_t visibility = module.reader().type_def(row).flags & ta::VISIBILITY_MASK;
        uint32_t enclosing = module.enclosing_type(row);
        if (enclosing == 0) {
            return visibility == ta::PUBLIC;
        }
        if (visibility != ta::NESTED_PUBLIC) {
            return false;
        }
        row = enclosing;
    }
    return false;
}

auto SurfaceExtractor::extract_type(const md::Module& module, uint32_t type_row) const
    -> TypeSurface {
    const auto& reader = module.reader();
    auto def = reader.type_def(type_row);

    TypeSurface type;
    type.full_name = module.type_full_name(type_row);
    type.namespace_name = std::string(module.type_namespace(type_row));
    type.name = std::string(def.name);
    type.kind = type_kind(module, type_row);
    {
        ExtractOptions public_only;
        type.is_public = SurfaceExtractor(context_, public_only).is_visible(module, type_row);
    }
    type.obsolete_message = md::find_obsolete(module, type_index(type_row));

    TypeFrame self{&module, type_row, md::GenericContext::for_type(module, type_row)};

    if (!def.extends.is_null()) {
        auto base = md::display_name(module, def.extends, self.context, md::NameStyle::Full);
        if (is_ok(base)) {
            type.base_type = std::move(unwrap(base));
        } else {
            APIDIFF_LOG_DEBUG("surface", "Unreadable base type of " << type.full_name << ": "
                                                                    << unwrap_err(base).message);
        }
    }

    // Interfaces: declared, their bases, then the base class chain
    std::unordered_set<std::string> seen_interfaces;
    std::function<void(const TypeFrame&, int)> collect_interfaces =
        [&](const TypeFrame& frame, int depth) {
            if (depth > MAX_HIERARCHY) {
                return;
            }
            for (const auto& iface : frame.module->interfaces_of(frame.row)) {
                auto name =
                    md::display_name(*frame.module, iface, frame.context, md::NameStyle::Full);
                if (is_err(name)) {
                    continue;
                }
                if (seen_interfaces.insert(unwrap(name)).second) {
                    type.interfaces.push_back(unwrap(name));
                }
                if (auto parent = frame_for(context_, frame, iface)) {
                    collect_interfaces(*parent, depth + 1);
                }
            }
            if (auto base = base_frame(context_, frame)) {
                collect_interfaces(*base, depth + 1);
            }
        };
    collect_interfaces(self, 0);

    // Methods and properties, walking up the base chain
    std::unordered_set<std::string> seen_signatures;
    std::unordered_set<std::string> seen_properties;
    std::optional<TypeFrame> frame = self;
    for (int depth = 0; frame && depth < MAX_HIERARCHY; ++depth) {
        const md::Module& owner = *frame->module;
        const auto& owner_reader = owner.reader();
        bool inherited = depth > 0;

        auto [first, last] = owner_reader.method_range(frame->row);
        for (uint32_t m = first; m < last; ++m) {
            auto flags = owner_reader.method_def(m).flags;
            uint16_t access = flags & md::method_attributes::ACCESS_MASK;
            if ((flags & md::method_attributes::SPECIAL_NAME) != 0 || owner.is_accessor(m)) {
                continue;
            }
            if (access != md::method_attributes::PUBLIC && !options_.include_non_public) {
                continue;
            }
            if (inherited && ((flags & md::method_attributes::STATIC) != 0 ||
                              access == ACCESS_PRIVATE)) {
                continue;
            }
            auto method = build_method(owner, m, frame->context);
            if (method && seen_signatures.insert(method->signature).second) {
                type.methods.push_back(std::move(*method));
            }
        }

        auto [pfirst, plast] = owner.properties_of(frame->row);
        for (uint32_t p = pfirst; p < plast; ++p) {
            auto property = build_property(owner, p, frame->context);
            if (!property) {
                continue;
            }
            if (!property->is_public && !options_.include_non_public) {
                continue;
            }
            if (inherited && (property->is_static || property->is_private)) {
                continue;
            }
            if (seen_properties.insert(property->surface.name).second) {
                type.properties.push_back(std::move(property->surface));
            }
        }

        frame = base_frame(context_, *frame);
    }

    return type;
}

auto SurfaceExtractor::extract(const CancellationToken& cancel) const -> std::vector<TypeSurface> {
    std::vector<TypeSurface> types;
    std::unordered_set<std::string> seen;

    for (const auto& module : context_.modules()) {
        if (cancel.is_cancelled()) {
            APIDIFF_LOG_DEBUG("surface", "Extraction cancelled");
            break;
        }
        uint32_t count = module->reader().row_count(md::TableId::TypeDef);
        size_t before = types.size();
        for (uint32_t row = 1; row <= count; ++row) {
            if (!is_visible(*module, row)) {
                continue;
            }
            const std::string& full_name = module->type_full_name(row);
            if (!seen.insert(full_name).second) {
                APIDIFF_LOG_DEBUG("surface", "Duplicate type " << full_name << " in "
                                                               << module->module_name()
                                                               << " ignored");
                continue;
            }
            types.push_back(extract_type(*module, row));
        }
        APIDIFF_LOG_DEBUG("surface", module->module_name() << ": " << (types.size() - before)
                                                           << " types");
    }
    return types;
}

} // namespace apidiff::surface
