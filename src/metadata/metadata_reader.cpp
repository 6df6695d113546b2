//! # Metadata Reader Implementation
//!
//! ```text
//! metadata root:  "BSJB" major minor reserved len version[len] flags nstreams
//!                 { offset size name\0 (padded to 4) } * nstreams
//! table stream:   reserved major minor heap_sizes reserved valid:u64 sorted:u64
//!                 rows:u32 * popcount(valid) [extra:u32] rows...
//! ```

#include "metadata/metadata_reader.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace apidiff::metadata {

namespace {

constexpr uint8_t HEAP_STRINGS_WIDE = 0x01;
constexpr uint8_t HEAP_GUID_WIDE = 0x02;
constexpr uint8_t HEAP_BLOB_WIDE = 0x04;
constexpr uint8_t HEAP_EXTRA_DATA = 0x40;
constexpr size_t MAX_STREAMS = 16;

auto error_at(std::string message, const ByteReader& r) -> MetadataError {
    return MetadataError{std::move(message), r.failed() ? r.fail_offset() : r.pos()};
}

} // namespace

// ============================================================================
// Open
// ============================================================================

auto MetadataReader::open(const ByteBuffer& image, const PeImage& pe)
    -> Result<MetadataReader, MetadataError> {
    ByteReader all(image);
    ByteReader root = all.window(pe.metadata_offset(), pe.metadata_size());
    if (root.failed()) {
        return MetadataError{"metadata root out of range", pe.metadata_offset()};
    }

    MetadataReader reader;
    root.skip(12); // signature, major, minor, reserved
    uint32_t version_length = root.u32();
    std::string_view version = root.str(version_length);
    reader.version_ = std::string(version.substr(0, version.find('\0')));
    root.skip(2); // flags
    uint16_t stream_count = root.u16();
    if (root.failed() || stream_count > MAX_STREAMS) {
        return error_at("malformed metadata root", root);
    }

    bool have_tables = false;
    bool uncompressed = false;
    for (uint16_t i = 0; i < stream_count; ++i) {
        uint32_t offset = root.u32();
        uint32_t size = root.u32();
        std::string_view name = root.cstring(32);
        root.align4();
        if (root.failed()) {
            return error_at("truncated stream header", root);
        }

        ByteReader stream = root.window(offset, size);
        if (root.failed()) {
            return MetadataError{"stream " + std::string(name) + " out of range", offset};
        }
        if (name == "#~" || name == "#-") {
            reader.tables_stream_ = stream;
            uncompressed = name == "#-";
            have_tables = true;
        } else if (name == "#Strings") {
            reader.strings_ = stream;
        } else if (name == "#Blob") {
            reader.blobs_ = stream;
        } else if (name == "#GUID") {
            reader.guids_ = stream;
        }
        // #US (user strings) and #JTD carry nothing the surface needs
    }
    if (!have_tables) {
        return MetadataError{"no table stream", 0};
    }
    if (reader.strings_.size() > 0 && reader.strings_.data()[reader.strings_.size() - 1] != 0) {
        return MetadataError{"#Strings heap is not NUL-terminated", 0};
    }

    // Table stream header
    ByteReader& t = reader.tables_stream_;
    t.seek(0);
    t.skip(6); // reserved, major, minor
    uint8_t heap_sizes = t.u8();
    t.skip(1);
    uint64_t valid = t.u64();
    t.skip(8); // sorted
    if (t.failed()) {
        return error_at("truncated table stream header", t);
    }
    reader.string_width_ = (heap_sizes & HEAP_STRINGS_WIDE) != 0 ? 4 : 2;
    reader.guid_width_ = (heap_sizes & HEAP_GUID_WIDE) != 0 ? 4 : 2;
    reader.blob_width_ = (heap_sizes & HEAP_BLOB_WIDE) != 0 ? 4 : 2;

    for (size_t i = 0; i < 64; ++i) {
        if ((valid & (uint64_t{1} << i)) == 0) {
            continue;
        }
        if (i >= TABLE_COUNT) {
            return error_at("unknown metadata table 0x" + std::to_string(i), t);
        }
        reader.tables_[i].rows = t.u32();
    }
    if ((heap_sizes & HEAP_EXTRA_DATA) != 0) {
        t.skip(4);
    }
    if (t.failed()) {
        return error_at("truncated row counts", t);
    }

    for (auto ptr : {TableId::FieldPtr, TableId::MethodPtr, TableId::ParamPtr, TableId::EventPtr,
                     TableId::PropertyPtr}) {
        if (reader.row_count(ptr) > 0) {
            return MetadataError{"indirection table " + std::string(table_name(ptr)) +
                                     " is not supported",
                                 t.pos()};
        }
    }
    if (uncompressed) {
        APIDIFF_LOG_DEBUG("metadata", "Uncompressed table stream without pointer tables");
    }

    reader.layout_tables(t.pos());
    const TableInfo& last = reader.tables_[TABLE_COUNT - 1];
    if (last.offset + static_cast<size_t>(last.rows) * last.row_size > t.size()) {
        return MetadataError{"tables extend past the table stream", t.size()};
    }

    auto valid_cells = reader.validate();
    if (is_err(valid_cells)) {
        return unwrap_err(valid_cells);
    }

    APIDIFF_LOG_TRACE("metadata", "Metadata " << reader.version_ << ": "
                                              << reader.row_count(TableId::TypeDef) << " types, "
                                              << reader.row_count(TableId::MethodDef)
                                              << " methods");
    return reader;
}

// ============================================================================
// Layout
// ============================================================================

auto MetadataReader::column_width(const Column& column) const -> size_t {
    switch (column.type) {
    case ColumnType::U8:
        return 1;
    case ColumnType::U16:
        return 2;
    case ColumnType::U32:
        return 4;
    case ColumnType::String:
        return string_width_;
    case ColumnType::Guid:
        return guid_width_;
    case ColumnType::Blob:
        return blob_width_;
    case ColumnType::Table:
        return row_count(column.table) < (1u << 16) ? 2 : 4;
    case ColumnType::Coded: {
        const auto& info = coded_index_info(column.coded);
        uint32_t max_rows = 0;
        for (TableId id : info.tables) {
            if (id != TableId::Unused) {
                max_rows = std::max(max_rows, row_count(id));
            }
        }
        return max_rows < (1u << (16 - info.tag_bits)) ? 2 : 4;
    }
    }
    return 4;
}

void MetadataReader::layout_tables(size_t data_start) {
    size_t offset = data_start;
    for (size_t i = 0; i < TABLE_COUNT; ++i) {
        TableInfo& info = tables_[i];
        const auto& schema = table_schema(static_cast<TableId>(i));
        info.column_offsets.clear();
        info.column_widths.clear();
        size_t row_size = 0;
        for (const auto& column : schema) {
            size_t width = column_width(column);
            info.column_offsets.push_back(row_size);
            info.column_widths.push_back(width);
            row_size += width;
        }
        info.row_size = row_size;
        info.offset = offset;
        offset += static_cast<size_t>(info.rows) * row_size;
    }
}

auto MetadataReader::validate() const -> Result<bool, MetadataError> {
    for (size_t i = 0; i < TABLE_COUNT; ++i) {
        auto id = static_cast<TableId>(i);
        const auto& schema = table_schema(id);
        for (uint32_t row = 1; row <= tables_[i].rows; ++row) {
            for (size_t col = 0; col < schema.size(); ++col) {
                const Column& column = schema[col];
                uint32_t raw = cell(id, row, col);
                auto fail = [&](const std::string& what) -> MetadataError {
                    return MetadataError{std::string(table_name(id)) + " row " +
                                             std::to_string(row) + ": " + what,
                                         tables_[i].offset + (row - 1) * tables_[i].row_size};
                };
                switch (column.type) {
                case ColumnType::String:
                    if (raw >= strings_.size() && !(raw == 0 && strings_.size() == 0)) {
                        return fail("string index out of range");
                    }
                    break;
                case ColumnType::Guid:
                    if (static_cast<size_t>(raw) * 16 > guids_.size()) {
                        return fail("GUID index out of range");
                    }
                    break;
                case ColumnType::Blob: {
                    if (raw == 0 && blobs_.size() == 0) {
                        break;
                    }
                    ByteReader b = blobs_;
                    b.seek(raw);
                    uint32_t length = b.compressed_u32();
                    b.skip(length);
                    if (b.failed()) {
                        return fail("blob index out of range");
                    }
                    break;
                }
                case ColumnType::Table:
                    if (raw > row_count(column.table) + 1) {
                        return fail("index into " + std::string(table_name(column.table)) +
                                    " out of range");
                    }
                    break;
                case ColumnType::Coded: {
                    const auto& info = coded_index_info(column.coded);
                    uint32_t tag = raw & ((1u << info.tag_bits) - 1);
                    uint32_t target_row = raw >> info.tag_bits;
                    if (target_row == 0) {
                        break;
                    }
                    if (tag >= info.tables.size() || info.tables[tag] == TableId::Unused ||
                        target_row > row_count(info.tables[tag])) {
                        return fail("coded index out of range");
                    }
                    break;
                }
                default:
                    break;
                }
            }
        }
    }
    return true;
}

// ============================================================================
// Heaps and cells
// ============================================================================

auto MetadataReader::string_at(uint32_t index) const -> std::string_view {
    if (index >= strings_.size()) {
        return {};
    }
    ByteReader r = strings_;
    r.seek(index);
    return r.cstring(strings_.size() - index);
}

auto MetadataReader::blob_at(uint32_t index) const -> ByteReader {
    if (blobs_.size() == 0) {
        return ByteReader();
    }
    ByteReader r = blobs_;
    r.seek(index);
    uint32_t length = r.compressed_u32();
    return r.window(r.pos(), length);
}

auto MetadataReader::cell(TableId table, uint32_t row, size_t column) const -> uint32_t {
    const TableInfo& info = tables_[static_cast<size_t>(table)];
    ByteReader r = tables_stream_;
    r.seek(info.offset + static_cast<size_t>(row - 1) * info.row_size +
           info.column_offsets[column]);
    switch (info.column_widths[column]) {
    case 1:
        return r.u8();
    case 2:
        return r.u16();
    default:
        return r.u32();
    }
}

auto MetadataReader::decode_coded(CodedKind kind, uint32_t raw) -> CodedIndex {
    const auto& info = coded_index_info(kind);
    uint32_t tag = raw & ((1u << info.tag_bits) - 1);
    uint32_t row = raw >> info.tag_bits;
    if (row == 0 || tag >= info.tables.size()) {
        return CodedIndex{};
    }
    return CodedIndex{info.tables[tag], row};
}

auto MetadataReader::coded_cell(TableId table, uint32_t row, size_t column) const -> CodedIndex {
    return decode_coded(table_schema(table)[column].coded, cell(table, row, column));
}

// ============================================================================
// Typed rows
// ============================================================================

auto MetadataReader::module_row() const -> ModuleRow {
    if (row_count(TableId::Module) == 0) {
        return ModuleRow{};
    }
    return ModuleRow{string_at(cell(TableId::Module, 1, 1))};
}

auto MetadataReader::type_ref(uint32_t row) const -> TypeRefRow {
    constexpr auto T = TableId::TypeRef;
    return TypeRefRow{
        .resolution_scope = coded_cell(T, row, 0),
        .name = string_at(cell(T, row, 1)),
        .namespace_name = string_at(cell(T, row, 2)),
    };
}

auto MetadataReader::type_def(uint32_t row) const -> TypeDefRow {
    constexpr auto T = TableId::TypeDef;
    return TypeDefRow{
        .flags = cell(T, row, 0),
        .name = string_at(cell(T, row, 1)),
        .namespace_name = string_at(cell(T, row, 2)),
        .extends = coded_cell(T, row, 3),
        .field_list = cell(T, row, 4),
        .method_list = cell(T, row, 5),
    };
}

auto MetadataReader::method_def(uint32_t row) const -> MethodDefRow {
    constexpr auto T = TableId::MethodDef;
    return MethodDefRow{
        .rva = cell(T, row, 0),
        .impl_flags = static_cast<uint16_t>(cell(T, row, 1)),
        .flags = static_cast<uint16_t>(cell(T, row, 2)),
        .name = string_at(cell(T, row, 3)),
        .signature = cell(T, row, 4),
        .param_list = cell(T, row, 5),
    };
}

auto MetadataReader::param(uint32_t row) const -> ParamRow {
    constexpr auto T = TableId::Param;
    return ParamRow{
        .flags = static_cast<uint16_t>(cell(T, row, 0)),
        .sequence = static_cast<uint16_t>(cell(T, row, 1)),
        .name = string_at(cell(T, row, 2)),
    };
}

auto MetadataReader::interface_impl(uint32_t row) const -> InterfaceImplRow {
    constexpr auto T = TableId::InterfaceImpl;
    return InterfaceImplRow{cell(T, row, 0), coded_cell(T, row, 1)};
}

auto MetadataReader::member_ref(uint32_t row) const -> MemberRefRow {
    constexpr auto T = TableId::MemberRef;
    return MemberRefRow{coded_cell(T, row, 0), string_at(cell(T, row, 1)), cell(T, row, 2)};
}

auto MetadataReader::custom_attribute(uint32_t row) const -> CustomAttributeRow {
    constexpr auto T = TableId::CustomAttribute;
    return CustomAttributeRow{coded_cell(T, row, 0), coded_cell(T, row, 1), cell(T, row, 2)};
}

auto MetadataReader::property_map(uint32_t row) const -> PropertyMapRow {
    constexpr auto T = TableId::PropertyMap;
    return PropertyMapRow{cell(T, row, 0), cell(T, row, 1)};
}

auto MetadataReader::property(uint32_t row) const -> PropertyRow {
    constexpr auto T = TableId::Property;
    return PropertyRow{static_cast<uint16_t>(cell(T, row, 0)), string_at(cell(T, row, 1)),
                       cell(T, row, 2)};
}

auto MetadataReader::method_semantics(uint32_t row) const -> MethodSemanticsRow {
    constexpr auto T = TableId::MethodSemantics;
    return MethodSemanticsRow{static_cast<uint16_t>(cell(T, row, 0)), cell(T, row, 1),
                              coded_cell(T, row, 2)};
}

auto MetadataReader::type_spec(uint32_t row) const -> TypeSpecRow {
    return TypeSpecRow{cell(TableId::TypeSpec, row, 0)};
}

auto MetadataReader::assembly() const -> AssemblyRow {
    constexpr auto T = TableId::Assembly;
    if (row_count(T) == 0) {
        return AssemblyRow{};
    }
    return AssemblyRow{
        .major = static_cast<uint16_t>(cell(T, 1, 1)),
        .minor = static_cast<uint16_t>(cell(T, 1, 2)),
        .build = static_cast<uint16_t>(cell(T, 1, 3)),
        .revision = static_cast<uint16_t>(cell(T, 1, 4)),
        .name = string_at(cell(T, 1, 7)),
        .culture = string_at(cell(T, 1, 8)),
    };
}

auto MetadataReader::assembly_ref(uint32_t row) const -> AssemblyRefRow {
    constexpr auto T = TableId::AssemblyRef;
    return AssemblyRefRow{
        .major = static_cast<uint16_t>(cell(T, row, 0)),
        .minor = static_cast<uint16_t>(cell(T, row, 1)),
        .build = static_cast<uint16_t>(cell(T, row, 2)),
        .revision = static_cast<uint16_t>(cell(T, row, 3)),
        .name = string_at(cell(T, row, 6)),
        .culture = string_at(cell(T, row, 7)),
    };
}

auto MetadataReader::nested_class(uint32_t row) const -> NestedClassRow {
    constexpr auto T = TableId::NestedClass;
    return NestedClassRow{cell(T, row, 0), cell(T, row, 1)};
}

auto MetadataReader::generic_param(uint32_t row) const -> GenericParamRow {
    constexpr auto T = TableId::GenericParam;
    return GenericParamRow{
        .number = static_cast<uint16_t>(cell(T, row, 0)),
        .flags = static_cast<uint16_t>(cell(T, row, 1)),
        .owner = coded_cell(T, row, 2),
        .name = string_at(cell(T, row, 3)),
    };
}

// ============================================================================
// Ranges
// ============================================================================

namespace {

/// Clamps a list column to `[first, next_first)` within `1..=count`.
auto list_range(uint32_t first, uint32_t next, uint32_t count) -> RowRange {
    uint32_t end = count + 1;
    first = std::min(std::max(first, 1u), end);
    next = std::min(std::max(next, first), end);
    return {first, next};
}

} // namespace

auto MetadataReader::method_range(uint32_t type_row) const -> RowRange {
    uint32_t types = row_count(TableId::TypeDef);
    uint32_t methods = row_count(TableId::MethodDef);
    uint32_t next = type_row < types ? type_def(type_row + 1).method_list : methods + 1;
    return list_range(type_def(type_row).method_list, next, methods);
}

auto MetadataReader::param_range(uint32_t method_row) const -> RowRange {
    uint32_t methods = row_count(TableId::MethodDef);
    uint32_t params = row_count(TableId::Param);
    uint32_t next = method_row < methods ? method_def(method_row + 1).param_list : params + 1;
    return list_range(method_def(method_row).param_list, next, params);
}

auto MetadataReader::property_range(uint32_t property_map_row) const -> RowRange {
    uint32_t maps = row_count(TableId::PropertyMap);
    uint32_t properties = row_count(TableId::Property);
    uint32_t next = property_map_row < maps ? property_map(property_map_row + 1).property_list
                                            : properties + 1;
    return list_range(property_map(property_map_row).property_list, next, properties);
}

} // namespace apidiff::metadata
