#include "metadata/type_names.hpp"

namespace apidiff::metadata {

namespace {

/// Strips the arity of every `+`-separated segment of a reflection name.
auto strip_all_arities(std::string_view full_name) -> std::string {
    std::string out;
    size_t start = 0;
    while (start <= full_name.size()) {
        size_t plus = full_name.find('+', start);
        if (plus == std::string_view::npos) {
            plus = full_name.size();
        }
        if (start > 0) {
            out.push_back('+');
        }
        out += strip_arity(full_name.substr(start, plus - start));
        start = plus + 1;
    }
    return out;
}

/// Name of a TypeDef or TypeRef; anything else renders as "?".
auto named(const Module& module, CodedIndex type, NameStyle style) -> std::string {
    if (type.table == TableId::TypeDef) {
        return style == NameStyle::Short
                   ? strip_arity(module.reader().type_def(type.row).name)
                   : strip_all_arities(module.type_full_name(type.row));
    }
    if (type.table == TableId::TypeRef) {
        return style == NameStyle::Short
                   ? strip_arity(module.reader().type_ref(type.row).name)
                   : strip_all_arities(module.type_ref_target(type.row).full_name);
    }
    return "?";
}

auto type_spec_sig(const Module& module, uint32_t row) -> Result<TypeSig, MetadataError> {
    return decode_type_spec(module.reader().blob_at(module.reader().type_spec(row).signature));
}

auto var_name(const std::vector<std::string>& names, uint32_t number, const char* prefix)
    -> std::string {
    if (number < names.size()) {
        return names[number];
    }
    return prefix + std::to_string(number);
}

} // namespace

auto strip_arity(std::string_view name) -> std::string {
    size_t tick = name.rfind('`');
    if (tick == std::string_view::npos || tick + 1 == name.size()) {
        return std::string(name);
    }
    for (size_t i = tick + 1; i < name.size(); ++i) {
        if (name[i] < '0' || name[i] > '9') {
            return std::string(name);
        }
    }
    return std::string(name.substr(0, tick));
}

auto GenericContext::for_type(const Module& module, uint32_t type_row) -> GenericContext {
    GenericContext context;
    context.type_args_short = module.generic_params_of(CodedIndex{TableId::TypeDef, type_row});
    context.type_args_full = context.type_args_short;
    return context;
}

auto GenericContext::with_method(const Module& module, uint32_t method_row) const
    -> GenericContext {
    GenericContext context = *this;
    context.method_args = module.generic_params_of(CodedIndex{TableId::MethodDef, method_row});
    return context;
}

auto display_name(const Module& module, const TypeSig& sig, const GenericContext& context,
                  NameStyle style) -> std::string {
    auto inner = [&](size_t i) -> std::string {
        return i < sig.args.size() ? display_name(module, sig.args[i], context, style)
                                   : std::string("?");
    };

    switch (sig.kind) {
    case TypeSigKind::Primitive: {
        std::string name(primitive_name(sig.element));
        return style == NameStyle::Full ? "System." + name : name;
    }
    case TypeSigKind::Named:
        return named(module, sig.type, style);
    case TypeSigKind::GenericInst: {
        std::string out = named(module, sig.type, style);
        out.push_back('<');
        for (size_t i = 0; i < sig.args.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            out += inner(i);
        }
        out.push_back('>');
        return out;
    }
    case TypeSigKind::SzArray:
        return inner(0) + "[]";
    case TypeSigKind::Array:
        return inner(0) + "[" + std::string(sig.rank > 1 ? sig.rank - 1 : 0, ',') + "]";
    case TypeSigKind::Pointer:
        return inner(0) + "*";
    case TypeSigKind::ByRef:
        return inner(0) + "&";
    case TypeSigKind::TypeVar:
        return var_name(style == NameStyle::Short ? context.type_args_short
                                                  : context.type_args_full,
                        sig.number, "T");
    case TypeSigKind::MethodVar:
        return var_name(context.method_args, sig.number, "M");
    case TypeSigKind::FnPtr:
        return style == NameStyle::Full ? "System.IntPtr" : "IntPtr";
    }
    return "?";
}

auto display_name(const Module& module, CodedIndex type, const GenericContext& context,
                  NameStyle style) -> Result<std::string, MetadataError> {
    if (type.is_null()) {
        return MetadataError{"null type index", 0};
    }
    if (type.table == TableId::TypeSpec) {
        auto spec = type_spec_sig(module, type.row);
        if (is_err(spec)) {
            return unwrap_err(spec);
        }
        return display_name(module, unwrap(spec), context, style);
    }
    return named(module, type, style);
}

auto definition_name(const Module& module, CodedIndex type) -> Result<std::string, MetadataError> {
    switch (type.table) {
    case TableId::TypeDef:
        return module.type_full_name(type.row);
    case TableId::TypeRef:
        return module.type_ref_target(type.row).full_name;
    case TableId::TypeSpec: {
        auto spec = type_spec_sig(module, type.row);
        if (is_err(spec)) {
            return unwrap_err(spec);
        }
        const TypeSig& sig = unwrap(spec);
        if (sig.kind != TypeSigKind::GenericInst && sig.kind != TypeSigKind::Named) {
            return MetadataError{"type spec is not a named type", 0};
        }
        if (sig.type.table == TableId::TypeSpec) {
            return MetadataError{"nested type spec", 0};
        }
        return definition_name(module, sig.type);
    }
    default:
        return MetadataError{"not a type index", 0};
    }
}

} // namespace apidiff::metadata
