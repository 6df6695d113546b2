//! # Metadata Reader
//!
//! Reads the ECMA-335 metadata root of one module: stream headers, the
//! `#Strings`, `#Blob` and `#GUID` heaps and the compressed table stream.
//!
//! `open()` validates every cell of every table up front (heap offsets,
//! simple and coded table indexes), so the row accessors afterwards cannot
//! read outside the image and need no error path.
//!
//! ## Lifetime
//!
//! The reader borrows the image bytes. Whoever owns the `ByteBuffer` (a
//! `metadata::Module`) must keep it alive and at a fixed address.
//!
//! ## Not supported
//!
//! Uncompressed (`#-`) streams that actually use the `*Ptr` indirection
//! tables are rejected; compilers do not emit them for shipped modules.

#ifndef APIDIFF_METADATA_READER_HPP
#define APIDIFF_METADATA_READER_HPP

#include "common.hpp"
#include "common/byte_reader.hpp"
#include "metadata/metadata_error.hpp"
#include "metadata/pe_image.hpp"
#include "metadata/tables.hpp"

#include <array>
#include <string>
#include <utility>

namespace apidiff::metadata {

/// A half-open, 1-based row range `[first, last)`.
using RowRange = std::pair<uint32_t, uint32_t>;

class MetadataReader {
public:
    [[nodiscard]] static auto open(const ByteBuffer& image, const PeImage& pe)
        -> Result<MetadataReader, MetadataError>;

    [[nodiscard]] auto row_count(TableId table) const -> uint32_t {
        return tables_[static_cast<size_t>(table)].rows;
    }

    /// Runtime version string from the metadata root (e.g. "v4.0.30319").
    [[nodiscard]] auto version_string() const -> const std::string& {
        return version_;
    }

    // ------------------------------------------------------------------------
    // Heaps
    // ------------------------------------------------------------------------

    [[nodiscard]] auto string_at(uint32_t index) const -> std::string_view;

    /// A reader over one blob (length prefix already consumed).
    [[nodiscard]] auto blob_at(uint32_t index) const -> ByteReader;

    // ------------------------------------------------------------------------
    // Raw cells
    // ------------------------------------------------------------------------

    /// Raw value of `column` in 1-based `row`.
    [[nodiscard]] auto cell(TableId table, uint32_t row, size_t column) const -> uint32_t;

    [[nodiscard]] auto coded_cell(TableId table, uint32_t row, size_t column) const -> CodedIndex;

    [[nodiscard]] static auto decode_coded(CodedKind kind, uint32_t raw) -> CodedIndex;

    // ------------------------------------------------------------------------
    // Typed rows
    // ------------------------------------------------------------------------

    [[nodiscard]] auto module_row() const -> ModuleRow;
    [[nodiscard]] auto type_ref(uint32_t row) const -> TypeRefRow;
    [[nodiscard]] auto type_def(uint32_t row) const -> TypeDefRow;
    [[nodiscard]] auto method_def(uint32_t row) const -> MethodDefRow;
    [[nodiscard]] auto param(uint32_t row) const -> ParamRow;
    [[nodiscard]] auto interface_impl(uint32_t row) const -> InterfaceImplRow;
    [[nodiscard]] auto member_ref(uint32_t row) const -> MemberRefRow;
    [[nodiscard]] auto custom_attribute(uint32_t row) const -> CustomAttributeRow;
    [[nodiscard]] auto property_map(uint32_t row) const -> PropertyMapRow;
    [[nodiscard]] auto property(uint32_t row) const -> PropertyRow;
    [[nodiscard]] auto method_semantics(uint32_t row) const -> MethodSemanticsRow;
    [[nodiscard]] auto type_spec(uint32_t row) const -> TypeSpecRow;
    [[nodiscard]] auto assembly() const -> AssemblyRow;
    [[nodiscard]] auto assembly_ref(uint32_t row) const -> AssemblyRefRow;
    [[nodiscard]] auto nested_class(uint32_t row) const -> NestedClassRow;
    [[nodiscard]] auto generic_param(uint32_t row) const -> GenericParamRow;

    // ------------------------------------------------------------------------
    // Owned ranges
    // ------------------------------------------------------------------------

    [[nodiscard]] auto method_range(uint32_t type_row) const -> RowRange;
    [[nodiscard]] auto param_range(uint32_t method_row) const -> RowRange;
    [[nodiscard]] auto property_range(uint32_t property_map_row) const -> RowRange;

private:
    struct TableInfo {
        uint32_t rows = 0;
        size_t row_size = 0;
        size_t offset = 0; ///< within the table stream
        std::vector<size_t> column_offsets;
        std::vector<size_t> column_widths;
    };

    MetadataReader() = default;

    [[nodiscard]] auto column_width(const Column& column) const -> size_t;
    void layout_tables(size_t data_start);
    [[nodiscard]] auto validate() const -> Result<bool, MetadataError>;

    ByteReader tables_stream_;
    ByteReader strings_;
    ByteReader blobs_;
    ByteReader guids_;
    std::string version_;
    size_t string_width_ = 2;
    size_t guid_width_ = 2;
    size_t blob_width_ = 2;
    std::array<TableInfo, TABLE_COUNT> tables_{};
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_READER_HPP
