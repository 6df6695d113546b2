//! # ECMA-335 Tables
//!
//! Table identifiers, coded-index kinds, column schemas (ECMA-335 II.22) and
//! the decoded row types for the tables the surface extractor reads.
//!
//! Schemas describe every one of the 45 tables so that row sizes (and hence
//! the offsets of later tables) can be computed even for tables whose rows
//! are never decoded.

#ifndef APIDIFF_METADATA_TABLES_HPP
#define APIDIFF_METADATA_TABLES_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace apidiff::metadata {

// ============================================================================
// Table Identifiers
// ============================================================================

enum class TableId : uint8_t {
    Module = 0x00,
    TypeRef = 0x01,
    TypeDef = 0x02,
    FieldPtr = 0x03,
    Field = 0x04,
    MethodPtr = 0x05,
    MethodDef = 0x06,
    ParamPtr = 0x07,
    Param = 0x08,
    InterfaceImpl = 0x09,
    MemberRef = 0x0A,
    Constant = 0x0B,
    CustomAttribute = 0x0C,
    FieldMarshal = 0x0D,
    DeclSecurity = 0x0E,
    ClassLayout = 0x0F,
    FieldLayout = 0x10,
    StandAloneSig = 0x11,
    EventMap = 0x12,
    EventPtr = 0x13,
    Event = 0x14,
    PropertyMap = 0x15,
    PropertyPtr = 0x16,
    Property = 0x17,
    MethodSemantics = 0x18,
    MethodImpl = 0x19,
    ModuleRef = 0x1A,
    TypeSpec = 0x1B,
    ImplMap = 0x1C,
    FieldRva = 0x1D,
    EncLog = 0x1E,
    EncMap = 0x1F,
    Assembly = 0x20,
    AssemblyProcessor = 0x21,
    AssemblyOs = 0x22,
    AssemblyRef = 0x23,
    AssemblyRefProcessor = 0x24,
    AssemblyRefOs = 0x25,
    File = 0x26,
    ExportedType = 0x27,
    ManifestResource = 0x28,
    NestedClass = 0x29,
    GenericParam = 0x2A,
    MethodSpec = 0x2B,
    GenericParamConstraint = 0x2C,

    /// Placeholder for unused coded-index tags.
    Unused = 0xFF,
};

constexpr size_t TABLE_COUNT = 0x2D;

[[nodiscard]] auto table_name(TableId id) -> std::string_view;

// ============================================================================
// Coded Indexes (II.24.2.6)
// ============================================================================

enum class CodedKind : uint8_t {
    TypeDefOrRef,
    HasConstant,
    HasCustomAttribute,
    HasFieldMarshal,
    HasDeclSecurity,
    MemberRefParent,
    HasSemantics,
    MethodDefOrRef,
    MemberForwarded,
    Implementation,
    CustomAttributeType,
    ResolutionScope,
    TypeOrMethodDef,
};

struct CodedIndexInfo {
    uint8_t tag_bits;
    std::vector<TableId> tables;
};

[[nodiscard]] auto coded_index_info(CodedKind kind) -> const CodedIndexInfo&;

/// A decoded coded index. `row` is 1-based; 0 means null.
struct CodedIndex {
    TableId table = TableId::Unused;
    uint32_t row = 0;

    [[nodiscard]] auto is_null() const -> bool {
        return row == 0;
    }
    [[nodiscard]] auto operator==(const CodedIndex& other) const -> bool {
        return table == other.table && row == other.row;
    }
};

// ============================================================================
// Column Schemas
// ============================================================================

enum class ColumnType : uint8_t {
    U8,
    U16,
    U32,
    String, ///< #Strings heap index
    Guid,   ///< #GUID heap index
    Blob,   ///< #Blob heap index
    Table,  ///< simple index into `table`
    Coded,  ///< coded index of kind `coded`
};

struct Column {
    ColumnType type;
    TableId table = TableId::Unused;
    CodedKind coded = CodedKind::TypeDefOrRef;
};

[[nodiscard]] auto table_schema(TableId id) -> const std::vector<Column>&;

// ============================================================================
// Flags
// ============================================================================

namespace type_attributes {
constexpr uint32_t VISIBILITY_MASK = 0x00000007;
constexpr uint32_t NOT_PUBLIC = 0x00000000;
constexpr uint32_t PUBLIC = 0x00000001;
constexpr uint32_t NESTED_PUBLIC = 0x00000002;
constexpr uint32_t INTERFACE = 0x00000020;
constexpr uint32_t ABSTRACT = 0x00000080;
constexpr uint32_t SEALED = 0x00000100;
} // namespace type_attributes

namespace method_attributes {
constexpr uint16_t ACCESS_MASK = 0x0007;
constexpr uint16_t PUBLIC = 0x0006;
constexpr uint16_t STATIC = 0x0010;
constexpr uint16_t VIRTUAL = 0x0040;
constexpr uint16_t ABSTRACT = 0x0400;
constexpr uint16_t SPECIAL_NAME = 0x0800;
} // namespace method_attributes

namespace param_attributes {
constexpr uint16_t HAS_DEFAULT = 0x1000;
constexpr uint16_t OPTIONAL = 0x0010;
} // namespace param_attributes

namespace method_semantics {
constexpr uint16_t SETTER = 0x0001;
constexpr uint16_t GETTER = 0x0002;
} // namespace method_semantics

// ============================================================================
// Decoded Rows
// ============================================================================

struct ModuleRow {
    std::string_view name;
};

struct TypeRefRow {
    CodedIndex resolution_scope;
    std::string_view name;
    std::string_view namespace_name;
};

struct TypeDefRow {
    uint32_t flags = 0;
    std::string_view name;
    std::string_view namespace_name;
    CodedIndex extends;
    uint32_t field_list = 0;
    uint32_t method_list = 0;
};

struct MethodDefRow {
    uint32_t rva = 0;
    uint16_t impl_flags = 0;
    uint16_t flags = 0;
    std::string_view name;
    uint32_t signature = 0; ///< #Blob index
    uint32_t param_list = 0;
};

struct ParamRow {
    uint16_t flags = 0;
    uint16_t sequence = 0;
    std::string_view name;
};

struct InterfaceImplRow {
    uint32_t class_row = 0;
    CodedIndex interface;
};

struct MemberRefRow {
    CodedIndex parent;
    std::string_view name;
    uint32_t signature = 0;
};

struct CustomAttributeRow {
    CodedIndex parent;
    CodedIndex constructor;
    uint32_t value = 0;
};

struct PropertyMapRow {
    uint32_t parent = 0;
    uint32_t property_list = 0;
};

struct PropertyRow {
    uint16_t flags = 0;
    std::string_view name;
    uint32_t signature = 0;
};

struct MethodSemanticsRow {
    uint16_t semantics = 0;
    uint32_t method = 0;
    CodedIndex association;
};

struct TypeSpecRow {
    uint32_t signature = 0;
};

struct AssemblyRow {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t build = 0;
    uint16_t revision = 0;
    std::string_view name;
    std::string_view culture;
};

struct AssemblyRefRow {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t build = 0;
    uint16_t revision = 0;
    std::string_view name;
    std::string_view culture;
};

struct NestedClassRow {
    uint32_t nested = 0;
    uint32_t enclosing = 0;
};

struct GenericParamRow {
    uint16_t number = 0;
    uint16_t flags = 0;
    CodedIndex owner;
    std::string_view name;
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_TABLES_HPP
