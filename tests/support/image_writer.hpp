//! # ECMA-335 Image Writer
//!
//! Synthesizes minimal managed modules (PE32 + CLI header + metadata) for
//! the metadata, surface and inspector tests. Only what the reader needs is
//! emitted: one `.text` section, the `#~`, `#Strings`, `#Blob` and `#GUID`
//! streams, and the tables for types, methods, parameters, properties,
//! interfaces, nesting, generic parameters and `[Obsolete]` attributes.
//!
//! ```cpp
//! test::ImageWriter w("ExamplePkg");
//! auto object = w.system("Object");
//! w.add_type({.ns = "ExamplePkg", .name = "Widget", .extends = object,
//!             .methods = {{.name = "Run", .signature = sig::method(sig::void_(), {})}}});
//! ByteBuffer dll = w.build();
//! ```
//!
//! Column widths, coded-index tags and row layout come from the same schema
//! tables the reader uses (`metadata/tables.hpp`).

#pragma once

#include "common.hpp"
#include "metadata/signature.hpp"
#include "metadata/tables.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidiff::test {

namespace md = metadata;

// ============================================================================
// Flags
// ============================================================================

namespace flags {
constexpr uint32_t PUBLIC_TYPE = 0x0001;
constexpr uint32_t NESTED_PUBLIC = 0x0002;
constexpr uint32_t NESTED_PRIVATE = 0x0003;
constexpr uint32_t INTERFACE = 0x00A0; // Interface | Abstract
constexpr uint32_t ABSTRACT = 0x0080;
constexpr uint32_t SEALED = 0x0100;

constexpr uint16_t PRIVATE = 0x0001;
constexpr uint16_t ASSEMBLY = 0x0003;
constexpr uint16_t PUBLIC = 0x0006;
constexpr uint16_t STATIC = 0x0010;
constexpr uint16_t VIRTUAL = 0x0040;
constexpr uint16_t HIDE_BY_SIG = 0x0080;
constexpr uint16_t SPECIAL_NAME = 0x0800;
constexpr uint16_t RT_SPECIAL_NAME = 0x1000;

constexpr uint16_t PUBLIC_METHOD = PUBLIC | HIDE_BY_SIG;

constexpr uint16_t PARAM_OPTIONAL = 0x0010;
constexpr uint16_t PARAM_HAS_DEFAULT = 0x1000;
} // namespace flags

// ============================================================================
// Signature blobs
// ============================================================================

namespace sig {
[[nodiscard]] auto primitive(uint8_t element) -> ByteBuffer;
[[nodiscard]] auto void_() -> ByteBuffer;
[[nodiscard]] auto int32() -> ByteBuffer;
[[nodiscard]] auto string() -> ByteBuffer;
[[nodiscard]] auto boolean() -> ByteBuffer;
[[nodiscard]] auto named(md::CodedIndex type, bool value_type = false) -> ByteBuffer;
[[nodiscard]] auto generic(md::CodedIndex definition, const std::vector<ByteBuffer>& args,
                           bool value_type = false) -> ByteBuffer;
[[nodiscard]] auto sz_array(const ByteBuffer& element) -> ByteBuffer;
[[nodiscard]] auto type_var(uint32_t number) -> ByteBuffer;
[[nodiscard]] auto method_var(uint32_t number) -> ByteBuffer;
/// MethodDefSig. Instance methods get HASTHIS.
[[nodiscard]] auto method(const ByteBuffer& ret, const std::vector<ByteBuffer>& params,
                          bool is_static = false, uint32_t generic_count = 0) -> ByteBuffer;
[[nodiscard]] auto property(const ByteBuffer& type, bool is_static = false) -> ByteBuffer;
} // namespace sig

// ============================================================================
// Declarations
// ============================================================================

struct ParamDecl {
    std::string name;
    uint16_t flags = 0;
};

struct MethodDecl {
    std::string name;
    ByteBuffer signature;
    std::vector<ParamDecl> params;
    uint16_t flags = flags::PUBLIC_METHOD;
    /// `[Obsolete(message)]`; an empty message uses the parameterless constructor.
    std::optional<std::string> obsolete;
    std::vector<std::string> generic_params;
};

struct PropertyDecl {
    std::string name;
    /// Property type (a `Type` blob, not a PropertySig).
    ByteBuffer type;
    bool getter = true;
    bool setter = false;
    bool is_static = false;
    uint16_t access = flags::PUBLIC;
};

struct TypeDecl {
    std::string ns;
    std::string name;
    uint32_t flags = flags::PUBLIC_TYPE;
    md::CodedIndex extends;
    std::vector<md::CodedIndex> interfaces;
    std::vector<MethodDecl> methods;
    std::vector<PropertyDecl> properties;
    std::optional<std::string> obsolete;
    std::vector<std::string> generic_params;
    /// TypeDef row of the enclosing type, 0 for top-level types.
    uint32_t enclosing = 0;
};

// ============================================================================
// Writer
// ============================================================================

class ImageWriter {
public:
    explicit ImageWriter(std::string assembly_name, std::string module_name = "");

    auto assembly_ref(std::string_view name) -> uint32_t;

    /// TypeRef scoped to an AssemblyRef; identical requests share one row.
    auto type_ref(std::string_view assembly, std::string_view ns, std::string_view name)
        -> md::CodedIndex;

    auto nested_type_ref(md::CodedIndex outer, std::string_view name) -> md::CodedIndex;

    /// `System.<name>` from System.Runtime.
    auto system(std::string_view name) -> md::CodedIndex;

    auto type_spec(ByteBuffer signature) -> md::CodedIndex;

    /// Declares a type. Rows are assigned in declaration order after `<Module>`.
    auto add_type(TypeDecl type) -> md::CodedIndex;

    /// TypeDef index the next `add_type` call will return.
    [[nodiscard]] auto next_type() const -> md::CodedIndex;

    [[nodiscard]] auto type(md::CodedIndex index) -> TypeDecl&;

    /// Serializes the module.
    [[nodiscard]] auto build() const -> ByteBuffer;

private:
    struct TypeRefDecl {
        md::CodedIndex scope;
        std::string ns;
        std::string name;
    };

    std::string assembly_name_;
    std::string module_name_;
    std::vector<std::string> assembly_refs_;
    std::vector<TypeRefDecl> type_refs_;
    std::vector<ByteBuffer> type_specs_;
    std::vector<TypeDecl> types_;
};

} // namespace apidiff::test
