//! # Metadata Module
//!
//! One managed module loaded for inspection: it owns the image bytes, the
//! parsed `MetadataReader`, and the lookup indexes built once at load time
//! (nesting, interfaces, custom attributes, property accessors, generic
//! parameters, TypeDef names).
//!
//! A `Module` never moves once loaded (it is always held by `Box`), so the
//! reader's views into the image stay valid for its whole lifetime.

#ifndef APIDIFF_METADATA_MODULE_HPP
#define APIDIFF_METADATA_MODULE_HPP

#include "common.hpp"
#include "metadata/metadata_reader.hpp"
#include "metadata/pe_image.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apidiff::metadata {

/// Where a TypeRef points after walking its resolution-scope chain.
struct TypeRefTarget {
    /// Assembly name for AssemblyRef scopes; empty for this module's own types.
    std::string assembly_name;
    /// Reflection-style full name (`Ns.Outer+Inner`, arity suffixes kept).
    std::string full_name;
};

struct PropertyAccessors {
    uint32_t getter = 0; ///< MethodDef row, 0 if none
    uint32_t setter = 0;
};

class Module {
public:
    /// Parses `bytes` as a managed assembly module.
    ///
    /// Fails when the image is not PE/COFF, has no CLI header or metadata,
    /// has no Assembly row, or has a TypeRef whose resolution scope chain
    /// is broken.
    [[nodiscard]] static auto load(std::string module_name, ByteBuffer bytes)
        -> Result<Box<Module>, MetadataError>;

    Module(const Module&) = delete;
    auto operator=(const Module&) -> Module& = delete;

    [[nodiscard]] auto module_name() const -> const std::string& {
        return module_name_;
    }
    [[nodiscard]] auto assembly_name() const -> const std::string& {
        return assembly_name_;
    }
    [[nodiscard]] auto reader() const -> const MetadataReader& {
        return *reader_;
    }
    [[nodiscard]] auto image() const -> const ByteBuffer& {
        return bytes_;
    }

    // ------------------------------------------------------------------------
    // Types
    // ------------------------------------------------------------------------

    /// Enclosing TypeDef row of a nested type, 0 for top-level types.
    [[nodiscard]] auto enclosing_type(uint32_t type_row) const -> uint32_t;

    /// `Ns.Outer+Inner` for a TypeDef row.
    [[nodiscard]] auto type_full_name(uint32_t type_row) const -> const std::string&;

    /// Namespace of the outermost enclosing type.
    [[nodiscard]] auto type_namespace(uint32_t type_row) const -> std::string_view;

    /// TypeDef row by reflection full name, 0 if absent.
    [[nodiscard]] auto find_type(std::string_view full_name) const -> uint32_t;

    /// TypeDef row that declares a MethodDef row, 0 if none.
    [[nodiscard]] auto method_owner(uint32_t method_row) const -> uint32_t;

    [[nodiscard]] auto type_ref_target(uint32_t type_ref_row) const -> const TypeRefTarget&;

    /// Declared interfaces (InterfaceImpl rows) of a TypeDef, in table order.
    [[nodiscard]] auto interfaces_of(uint32_t type_row) const -> const std::vector<CodedIndex>&;

    /// Property rows declared by a TypeDef.
    [[nodiscard]] auto properties_of(uint32_t type_row) const -> RowRange;

    [[nodiscard]] auto accessors_of(uint32_t property_row) const -> PropertyAccessors;

    /// True if a MethodDef row is a property or event accessor.
    [[nodiscard]] auto is_accessor(uint32_t method_row) const -> bool;

    // ------------------------------------------------------------------------
    // Attributes and generics
    // ------------------------------------------------------------------------

    /// CustomAttribute rows attached to `parent`.
    [[nodiscard]] auto custom_attributes_of(CodedIndex parent) const
        -> const std::vector<uint32_t>&;

    /// Generic parameter names of a TypeDef or MethodDef, ordered by number.
    [[nodiscard]] auto generic_params_of(CodedIndex owner) const -> std::vector<std::string>;

private:
    Module() = default;

    [[nodiscard]] auto build_indexes() -> Result<bool, MetadataError>;
    [[nodiscard]] auto resolve_type_ref(uint32_t row, int depth) -> Result<bool, MetadataError>;

    static auto key(CodedIndex index) -> uint64_t {
        return (static_cast<uint64_t>(index.table) << 32) | index.row;
    }

    std::string module_name_;
    std::string assembly_name_;
    ByteBuffer bytes_;
    std::optional<PeImage> pe_;
    std::optional<MetadataReader> reader_;

    // Indexed by 1-based row; slot 0 unused
    std::vector<uint32_t> enclosing_;
    std::vector<std::string> full_names_;
    std::vector<uint32_t> method_owner_;
    std::vector<std::vector<CodedIndex>> interfaces_;
    std::vector<RowRange> properties_;
    std::vector<PropertyAccessors> accessors_;
    std::vector<bool> is_accessor_;
    std::vector<std::optional<TypeRefTarget>> type_refs_;

    std::unordered_map<std::string, uint32_t> by_full_name_;
    std::unordered_map<uint64_t, std::vector<uint32_t>> attributes_;
    std::unordered_map<uint64_t, std::vector<std::pair<uint16_t, std::string>>> generic_params_;
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_MODULE_HPP
