//! # ZIP Archive Reader
//!
//! Reads `.nupkg` containers (plain ZIP). Supports stored (method 0) and
//! deflated (method 8) entries; encrypted entries, other methods and ZIP64
//! are rejected with `ArchiveError`. Inflated data is checked against the
//! central directory's CRC-32.

#pragma once

#include "package/archive_reader.hpp"

#include <unordered_map>

namespace apidiff::package {

class ZipArchive : public ArchiveReader {
public:
    /// Parses the central directory of `bytes`. The archive owns the bytes.
    [[nodiscard]] static auto open(ByteBuffer bytes) -> Result<ZipArchive, ArchiveError>;

    [[nodiscard]] auto entries() const -> const std::vector<std::string>& override {
        return names_;
    }

    [[nodiscard]] auto read_entry(const std::string& path) const
        -> Result<ByteBuffer, ArchiveError> override;

    /// Entries larger than this (uncompressed) are refused.
    static constexpr uint64_t MAX_ENTRY_SIZE = 512ull * 1024 * 1024;

private:
    struct Entry {
        std::string name;
        uint16_t flags = 0;
        uint16_t method = 0;
        uint32_t crc = 0;
        uint32_t compressed_size = 0;
        uint32_t uncompressed_size = 0;
        uint32_t local_header_offset = 0;
    };

    ZipArchive() = default;

    ByteBuffer bytes_;
    std::vector<Entry> entries_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace apidiff::package
