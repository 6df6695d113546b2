//! # Type Display Names
//!
//! Renders signature types and TypeDefOrRef indexes as text.
//!
//! | Style | Named type | Generic instance | Example |
//! |-------|-----------|------------------|---------|
//! | `Short` | innermost simple name | `List<Int32>` | `Dictionary<String,List<Int32>>` |
//! | `Full` | `Ns.Outer+Inner` | `System.Collections.Generic.List<System.Int32>` | |
//!
//! Arity suffixes (`` `1 ``) are stripped in both styles. Generic parameters
//! render through a `GenericContext`, which holds the already-rendered names
//! of the type and method arguments in scope (either the parameter names of
//! the declaring definition or, when walking into a generic base type, the
//! rendered instantiation arguments).

#ifndef APIDIFF_METADATA_TYPE_NAMES_HPP
#define APIDIFF_METADATA_TYPE_NAMES_HPP

#include "metadata/module.hpp"
#include "metadata/signature.hpp"

#include <string>
#include <vector>

namespace apidiff::metadata {

enum class NameStyle {
    Short,
    Full,
};

struct GenericContext {
    std::vector<std::string> type_args_short;
    std::vector<std::string> type_args_full;
    std::vector<std::string> method_args;

    /// Context of a generic definition: every argument is its parameter name.
    [[nodiscard]] static auto for_type(const Module& module, uint32_t type_row) -> GenericContext;

    /// Adds the method's own generic parameter names.
    [[nodiscard]] auto with_method(const Module& module, uint32_t method_row) const
        -> GenericContext;
};

/// Removes a trailing arity suffix: "List`1" -> "List".
[[nodiscard]] auto strip_arity(std::string_view name) -> std::string;

/// Renders a signature type.
[[nodiscard]] auto display_name(const Module& module, const TypeSig& sig,
                                const GenericContext& context, NameStyle style) -> std::string;

/// Renders a TypeDef, TypeRef or TypeSpec index (base types, interfaces).
[[nodiscard]] auto display_name(const Module& module, CodedIndex type,
                                const GenericContext& context, NameStyle style)
    -> Result<std::string, MetadataError>;

/// Reflection full name of a TypeDef/TypeRef index, arity kept. TypeSpecs
/// yield their generic definition's name.
[[nodiscard]] auto definition_name(const Module& module, CodedIndex type)
    -> Result<std::string, MetadataError>;

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_TYPE_NAMES_HPP
