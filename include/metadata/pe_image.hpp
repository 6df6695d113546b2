//! # PE/COFF Image
//!
//! Minimal PE/COFF header reader: just enough to find the CLI header and
//! the ECMA-335 metadata root inside a managed module.
//!
//! ```text
//! DOS header ("MZ", e_lfanew @ 0x3C)
//!   -> "PE\0\0" + COFF header (20 bytes)
//!   -> optional header (PE32 0x10b / PE32+ 0x20b) with data directories
//!   -> section table (40 bytes per section)
//! CLI header = data directory 14 -> metadata root ("BSJB")
//! ```
//!
//! No code is mapped or executed; the image is only read as bytes.

#ifndef APIDIFF_METADATA_PE_IMAGE_HPP
#define APIDIFF_METADATA_PE_IMAGE_HPP

#include "common.hpp"
#include "metadata/metadata_error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace apidiff::metadata {

struct SectionHeader {
    std::string name;
    uint32_t virtual_address = 0;
    uint32_t virtual_size = 0;
    uint32_t raw_offset = 0;
    uint32_t raw_size = 0;
};

struct DataDirectory {
    uint32_t rva = 0;
    uint32_t size = 0;
};

class PeImage {
public:
    /// Parses headers of `bytes`. The image does not keep a reference.
    [[nodiscard]] static auto parse(const ByteBuffer& bytes) -> Result<PeImage, MetadataError>;

    /// Maps an RVA to a file offset through the section table.
    [[nodiscard]] auto rva_to_offset(uint32_t rva) const -> std::optional<uint32_t>;

    [[nodiscard]] auto is_pe32_plus() const -> bool {
        return pe32_plus_;
    }
    [[nodiscard]] auto sections() const -> const std::vector<SectionHeader>& {
        return sections_;
    }
    /// File offset and size of the metadata root.
    [[nodiscard]] auto metadata_offset() const -> uint32_t {
        return metadata_offset_;
    }
    [[nodiscard]] auto metadata_size() const -> uint32_t {
        return metadata_size_;
    }
    /// CLI header flags (COMIMAGE_FLAGS_*).
    [[nodiscard]] auto cli_flags() const -> uint32_t {
        return cli_flags_;
    }

    static constexpr size_t CLI_HEADER_DIRECTORY = 14;

private:
    PeImage() = default;

    bool pe32_plus_ = false;
    std::vector<SectionHeader> sections_;
    uint32_t metadata_offset_ = 0;
    uint32_t metadata_size_ = 0;
    uint32_t cli_flags_ = 0;
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_PE_IMAGE_HPP
