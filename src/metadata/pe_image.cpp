#include "metadata/pe_image.hpp"

#include "common/byte_reader.hpp"

#include <algorithm>

namespace apidiff::metadata {

namespace {

constexpr uint16_t DOS_MAGIC = 0x5A4D; // "MZ"
constexpr uint32_t PE_SIGNATURE = 0x00004550;
constexpr uint16_t PE32_MAGIC = 0x10b;
constexpr uint16_t PE32_PLUS_MAGIC = 0x20b;
constexpr uint32_t METADATA_MAGIC = 0x424A5342; // "BSJB"
constexpr size_t SECTION_HEADER_SIZE = 40;

auto error(std::string message, const ByteReader& r) -> MetadataError {
    return MetadataError{std::move(message), r.failed() ? r.fail_offset() : r.pos()};
}

} // namespace

auto PeImage::parse(const ByteBuffer& bytes) -> Result<PeImage, MetadataError> {
    ByteReader r(bytes);

    if (r.u16() != DOS_MAGIC) {
        return error("not a PE image (missing MZ header)", r);
    }
    r.seek(0x3C);
    uint32_t pe_offset = r.u32();
    r.seek(pe_offset);
    if (r.u32() != PE_SIGNATURE) {
        return error("not a PE image (missing PE signature)", r);
    }

    // COFF header
    r.skip(2); // machine
    uint16_t section_count = r.u16();
    r.skip(12); // timestamp, symbol table pointer, symbol count
    uint16_t optional_size = r.u16();
    r.skip(2); // characteristics
    if (r.failed()) {
        return error("truncated COFF header", r);
    }

    // Optional header
    size_t optional_start = r.pos();
    uint16_t magic = r.u16();
    PeImage image;
    if (magic == PE32_PLUS_MAGIC) {
        image.pe32_plus_ = true;
    } else if (magic != PE32_MAGIC) {
        return error("unknown optional header magic", r);
    }
    size_t count_offset = image.pe32_plus_ ? 108 : 92;
    r.seek(optional_start + count_offset);
    uint32_t directory_count = r.u32();
    if (r.failed() || directory_count <= CLI_HEADER_DIRECTORY ||
        count_offset + 4 + static_cast<size_t>(directory_count) * 8 > optional_size) {
        return error("no CLI header directory", r);
    }
    r.skip(CLI_HEADER_DIRECTORY * 8);
    DataDirectory cli{r.u32(), r.u32()};
    if (r.failed()) {
        return error("truncated data directories", r);
    }
    if (cli.rva == 0 || cli.size == 0) {
        return error("not a managed module (empty CLI header directory)", r);
    }

    // Section table
    r.seek(optional_start + optional_size);
    for (uint16_t i = 0; i < section_count; ++i) {
        SectionHeader section;
        std::string_view raw_name = r.str(8);
        section.name = std::string(raw_name.substr(0, raw_name.find('\0')));
        section.virtual_size = r.u32();
        section.virtual_address = r.u32();
        section.raw_size = r.u32();
        section.raw_offset = r.u32();
        r.skip(SECTION_HEADER_SIZE - 24);
        if (r.failed()) {
            return error("truncated section table", r);
        }
        image.sections_.push_back(std::move(section));
    }

    // CLI header: cb, runtime version, metadata directory, flags
    auto cli_offset = image.rva_to_offset(cli.rva);
    if (!cli_offset) {
        return error("CLI header RVA outside every section", r);
    }
    r.seek(*cli_offset);
    r.skip(8);
    DataDirectory metadata{r.u32(), r.u32()};
    image.cli_flags_ = r.u32();
    if (r.failed()) {
        return error("truncated CLI header", r);
    }

    auto metadata_offset = image.rva_to_offset(metadata.rva);
    if (!metadata_offset || metadata.size < 16 ||
        static_cast<size_t>(*metadata_offset) + metadata.size > bytes.size()) {
        return error("metadata directory out of range", r);
    }
    r.seek(*metadata_offset);
    if (r.u32() != METADATA_MAGIC) {
        return error("bad metadata signature", r);
    }
    image.metadata_offset_ = *metadata_offset;
    image.metadata_size_ = metadata.size;
    return image;
}

auto PeImage::rva_to_offset(uint32_t rva) const -> std::optional<uint32_t> {
    for (const auto& section : sections_) {
        uint32_t extent = std::max(section.virtual_size, section.raw_size);
        if (rva >= section.virtual_address && rva - section.virtual_address < extent) {
            uint32_t delta = rva - section.virtual_address;
            if (delta >= section.raw_size) {
                return std::nullopt;
            }
            return section.raw_offset + delta;
        }
    }
    return std::nullopt;
}

} // namespace apidiff::metadata
