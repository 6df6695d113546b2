#include "metadata/tables.hpp"

namespace apidiff::metadata {

namespace {

using T = TableId;
using K = CodedKind;

constexpr auto u8() -> Column {
    return Column{ColumnType::U8};
}
constexpr auto u16() -> Column {
    return Column{ColumnType::U16};
}
constexpr auto u32() -> Column {
    return Column{ColumnType::U32};
}
constexpr auto str() -> Column {
    return Column{ColumnType::String};
}
constexpr auto guid() -> Column {
    return Column{ColumnType::Guid};
}
constexpr auto blob() -> Column {
    return Column{ColumnType::Blob};
}
constexpr auto idx(TableId table) -> Column {
    return Column{ColumnType::Table, table};
}
constexpr auto coded(CodedKind kind) -> Column {
    return Column{ColumnType::Coded, TableId::Unused, kind};
}

auto build_schemas() -> std::array<std::vector<Column>, TABLE_COUNT> {
    std::array<std::vector<Column>, TABLE_COUNT> s;
    auto at = [&s](TableId id) -> std::vector<Column>& { return s[static_cast<size_t>(id)]; };

    at(T::Module) = {u16(), str(), guid(), guid(), guid()};
    at(T::TypeRef) = {coded(K::ResolutionScope), str(), str()};
    at(T::TypeDef) = {u32(), str(), str(), coded(K::TypeDefOrRef), idx(T::Field), idx(T::MethodDef)};
    at(T::FieldPtr) = {idx(T::Field)};
    at(T::Field) = {u16(), str(), blob()};
    at(T::MethodPtr) = {idx(T::MethodDef)};
    at(T::MethodDef) = {u32(), u16(), u16(), str(), blob(), idx(T::Param)};
    at(T::ParamPtr) = {idx(T::Param)};
    at(T::Param) = {u16(), u16(), str()};
    at(T::InterfaceImpl) = {idx(T::TypeDef), coded(K::TypeDefOrRef)};
    at(T::MemberRef) = {coded(K::MemberRefParent), str(), blob()};
    // Type is one byte followed by one padding byte
    at(T::Constant) = {u8(), u8(), coded(K::HasConstant), blob()};
    at(T::CustomAttribute) = {coded(K::HasCustomAttribute), coded(K::CustomAttributeType), blob()};
    at(T::FieldMarshal) = {coded(K::HasFieldMarshal), blob()};
    at(T::DeclSecurity) = {u16(), coded(K::HasDeclSecurity), blob()};
    at(T::ClassLayout) = {u16(), u32(), idx(T::TypeDef)};
    at(T::FieldLayout) = {u32(), idx(T::Field)};
    at(T::StandAloneSig) = {blob()};
    at(T::EventMap) = {idx(T::TypeDef), idx(T::Event)};
    at(T::EventPtr) = {idx(T::Event)};
    at(T::Event) = {u16(), str(), coded(K::TypeDefOrRef)};
    at(T::PropertyMap) = {idx(T::TypeDef), idx(T::Property)};
    at(T::PropertyPtr) = {idx(T::Property)};
    at(T::Property) = {u16(), str(), blob()};
    at(T::MethodSemantics) = {u16(), idx(T::MethodDef), coded(K::HasSemantics)};
    at(T::MethodImpl) = {idx(T::TypeDef), coded(K::MethodDefOrRef), coded(K::MethodDefOrRef)};
    at(T::ModuleRef) = {str()};
    at(T::TypeSpec) = {blob()};
    at(T::ImplMap) = {u16(), coded(K::MemberForwarded), str(), idx(T::ModuleRef)};
    at(T::FieldRva) = {u32(), idx(T::Field)};
    at(T::EncLog) = {u32(), u32()};
    at(T::EncMap) = {u32()};
    at(T::Assembly) = {u32(), u16(), u16(), u16(), u16(), u32(), blob(), str(), str()};
    at(T::AssemblyProcessor) = {u32()};
    at(T::AssemblyOs) = {u32(), u32(), u32()};
    at(T::AssemblyRef) = {u16(), u16(), u16(), u16(), u32(), blob(), str(), str(), blob()};
    at(T::AssemblyRefProcessor) = {u32(), idx(T::AssemblyRef)};
    at(T::AssemblyRefOs) = {u32(), u32(), u32(), idx(T::AssemblyRef)};
    at(T::File) = {u32(), str(), blob()};
    at(T::ExportedType) = {u32(), u32(), str(), str(), coded(K::Implementation)};
    at(T::ManifestResource) = {u32(), u32(), str(), coded(K::Implementation)};
    at(T::NestedClass) = {idx(T::TypeDef), idx(T::TypeDef)};
    at(T::GenericParam) = {u16(), u16(), coded(K::TypeOrMethodDef), str()};
    at(T::MethodSpec) = {coded(K::MethodDefOrRef), blob()};
    at(T::GenericParamConstraint) = {idx(T::GenericParam), coded(K::TypeDefOrRef)};
    return s;
}

auto build_coded() -> std::array<CodedIndexInfo, 13> {
    return {{
        {2, {T::TypeDef, T::TypeRef, T::TypeSpec}},
        {2, {T::Field, T::Param, T::Property}},
        {5,
         {T::MethodDef, T::Field, T::TypeRef, T::TypeDef, T::Param, T::InterfaceImpl,
          T::MemberRef, T::Module, T::DeclSecurity, T::Property, T::Event, T::StandAloneSig,
          T::ModuleRef, T::TypeSpec, T::Assembly, T::AssemblyRef, T::File, T::ExportedType,
          T::ManifestResource, T::GenericParam, T::GenericParamConstraint, T::MethodSpec}},
        {1, {T::Field, T::Param}},
        {2, {T::TypeDef, T::MethodDef, T::Assembly}},
        {3, {T::TypeDef, T::TypeRef, T::ModuleRef, T::MethodDef, T::TypeSpec}},
        {1, {T::Event, T::Property}},
        {1, {T::MethodDef, T::MemberRef}},
        {1, {T::Field, T::MethodDef}},
        {2, {T::File, T::AssemblyRef, T::ExportedType}},
        {3, {T::Unused, T::Unused, T::MethodDef, T::MemberRef, T::Unused}},
        {2, {T::Module, T::ModuleRef, T::AssemblyRef, T::TypeRef}},
        {1, {T::TypeDef, T::MethodDef}},
    }};
}

} // namespace

auto table_schema(TableId id) -> const std::vector<Column>& {
    static const auto schemas = build_schemas();
    return schemas[static_cast<size_t>(id)];
}

auto coded_index_info(CodedKind kind) -> const CodedIndexInfo& {
    static const auto coded_infos = build_coded();
    return coded_infos[static_cast<size_t>(kind)];
}

auto table_name(TableId id) -> std::string_view {
    static constexpr std::array<std::string_view, TABLE_COUNT> NAMES = {
        "Module",          "TypeRef",
        "TypeDef",         "FieldPtr",
        "Field",           "MethodPtr",
        "MethodDef",       "ParamPtr",
        "Param",           "InterfaceImpl",
        "MemberRef",       "Constant",
        "CustomAttribute", "FieldMarshal",
        "DeclSecurity",    "ClassLayout",
        "FieldLayout",     "StandAloneSig",
        "EventMap",        "EventPtr",
        "Event",           "PropertyMap",
        "PropertyPtr",     "Property",
        "MethodSemantics", "MethodImpl",
        "ModuleRef",       "TypeSpec",
        "ImplMap",         "FieldRVA",
        "EncLog",          "EncMap",
        "Assembly",        "AssemblyProcessor",
        "AssemblyOS",      "AssemblyRef",
        "AssemblyRefProcessor", "AssemblyRefOS",
        "File",            "ExportedType",
        "ManifestResource", "NestedClass",
        "GenericParam",    "MethodSpec",
        "GenericParamConstraint",
    };
    auto index = static_cast<size_t>(id);
    return index < TABLE_COUNT ? NAMES[index] : std::string_view("Unused");
}

} // namespace apidiff::metadata
