//! # ZIP Archive Reader Implementation
//!
//! Locates the end-of-central-directory record (scanning back over a
//! trailing comment), walks the central directory, then on demand jumps to
//! each entry's local header and inflates with zlib in raw mode.

#include "package/zip_archive.hpp"

#include "common/byte_reader.hpp"
#include "log/log.hpp"

#include <cstring>
#include <optional>
#include <zlib.h>

namespace apidiff::package {

namespace {

constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr uint32_t CENTRAL_SIGNATURE = 0x02014b50;
constexpr uint32_t LOCAL_SIGNATURE = 0x04034b50;
constexpr size_t EOCD_MIN_SIZE = 22;
constexpr size_t MAX_COMMENT = 0xFFFF;

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATE = 8;

auto find_eocd(const ByteBuffer& bytes) -> std::optional<size_t> {
    if (bytes.size() < EOCD_MIN_SIZE) {
        return std::nullopt;
    }
    size_t last = bytes.size() - EOCD_MIN_SIZE;
    size_t first = last > MAX_COMMENT ? last - MAX_COMMENT : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        uint32_t sig = static_cast<uint32_t>(bytes[pos]) | (bytes[pos + 1] << 8) |
                       (bytes[pos + 2] << 16) | (static_cast<uint32_t>(bytes[pos + 3]) << 24);
        if (sig == EOCD_SIGNATURE) {
            return pos;
        }
    }
    return std::nullopt;
}

auto inflate_raw(const uint8_t* data, size_t size, size_t expected)
    -> Result<ByteBuffer, ArchiveError> {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -15) != Z_OK) {
        return ArchiveError{"inflateInit2 failed"};
    }

    // zlib rejects a null output pointer even when nothing is produced
    ByteBuffer out(expected == 0 ? 1 : expected);
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(expected);

    int ret = inflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return ArchiveError{"corrupt deflate stream (zlib " + std::to_string(ret) + ")"};
    }
    if (produced != expected) {
        return ArchiveError{"inflated size mismatch"};
    }
    out.resize(expected);
    return out;
}

} // namespace

auto ZipArchive::open(ByteBuffer bytes) -> Result<ZipArchive, ArchiveError> {
    auto eocd_pos = find_eocd(bytes);
    if (!eocd_pos) {
        return ArchiveError{"not a ZIP archive (no end of central directory)"};
    }

    ByteReader eocd(bytes);
    eocd.seek(*eocd_pos + 4);
    uint16_t disk = eocd.u16();
    uint16_t cd_disk = eocd.u16();
    eocd.skip(2); // entries on this disk
    uint16_t total_entries = eocd.u16();
    uint32_t cd_size = eocd.u32();
    uint32_t cd_offset = eocd.u32();
    if (eocd.failed()) {
        return ArchiveError{"truncated end of central directory"};
    }
    if (disk != 0 || cd_disk != 0) {
        return ArchiveError{"multi-disk archives are not supported"};
    }
    if (total_entries == 0xFFFF || cd_offset == 0xFFFFFFFF) {
        return ArchiveError{"ZIP64 archives are not supported"};
    }

    ZipArchive archive;
    ByteReader all(bytes);
    ByteReader cd = all.window(cd_offset, cd_size);
    if (all.failed()) {
        return ArchiveError{"central directory out of range"};
    }

    for (uint16_t i = 0; i < total_entries; ++i) {
        if (cd.u32() != CENTRAL_SIGNATURE) {
            return ArchiveError{"bad central directory signature at entry " + std::to_string(i)};
        }
        Entry entry;
        cd.skip(4); // version made by, version needed
        entry.flags = cd.u16();
        entry.method = cd.u16();
        cd.skip(4); // time, date
        entry.crc = cd.u32();
        entry.compressed_size = cd.u32();
        entry.uncompressed_size = cd.u32();
        uint16_t name_len = cd.u16();
        uint16_t extra_len = cd.u16();
        uint16_t comment_len = cd.u16();
        cd.skip(8); // disk start, internal attrs, external attrs
        entry.local_header_offset = cd.u32();
        entry.name = std::string(cd.str(name_len));
        cd.skip(static_cast<size_t>(extra_len) + comment_len);
        if (cd.failed()) {
            return ArchiveError{"truncated central directory"};
        }

        // Directories carry no data
        if (entry.name.empty() || entry.name.back() == '/') {
            continue;
        }
        for (auto& c : entry.name) {
            if (c == '\\') {
                c = '/';
            }
        }
        if (archive.by_name_.count(entry.name) != 0) {
            APIDIFF_LOG_DEBUG("zip", "Duplicate entry ignored: " << entry.name);
            continue;
        }
        archive.by_name_.emplace(entry.name, archive.entries_.size());
        archive.names_.push_back(entry.name);
        archive.entries_.push_back(std::move(entry));
    }

    archive.bytes_ = std::move(bytes);
    APIDIFF_LOG_DEBUG("zip", "Opened archive with " << archive.entries_.size() << " entries");
    return archive;
}

auto ZipArchive::read_entry(const std::string& path) const -> Result<ByteBuffer, ArchiveError> {
    auto it = by_name_.find(path);
    if (it == by_name_.end()) {
        return ArchiveError{"no such entry: " + path};
    }
    const Entry& entry = entries_[it->second];

    if ((entry.flags & FLAG_ENCRYPTED) != 0) {
        return ArchiveError{"encrypted entry: " + path};
    }
    if (entry.compressed_size == 0xFFFFFFFF || entry.uncompressed_size == 0xFFFFFFFF) {
        return ArchiveError{"ZIP64 entry not supported: " + path};
    }
    if (entry.uncompressed_size > MAX_ENTRY_SIZE) {
        return ArchiveError{"entry too large: " + path};
    }

    ByteReader reader(bytes_);
    reader.seek(entry.local_header_offset);
    if (reader.u32() != LOCAL_SIGNATURE) {
        return ArchiveError{"bad local header for " + path};
    }
    reader.skip(22); // version .. uncompressed size
    uint16_t name_len = reader.u16();
    uint16_t extra_len = reader.u16();
    reader.skip(static_cast<size_t>(name_len) + extra_len);
    const uint8_t* data = reader.bytes(entry.compressed_size);
    if (reader.failed() || data == nullptr) {
        return ArchiveError{"truncated data for " + path};
    }

    ByteBuffer out;
    if (entry.method == METHOD_STORED) {
        if (entry.compressed_size != entry.uncompressed_size) {
            return ArchiveError{"stored entry size mismatch: " + path};
        }
        out.assign(data, data + entry.compressed_size);
    } else if (entry.method == METHOD_DEFLATE) {
        auto inflated = inflate_raw(data, entry.compressed_size, entry.uncompressed_size);
        if (is_err(inflated)) {
            return ArchiveError{unwrap_err(inflated).message + ": " + path};
        }
        out = std::move(unwrap(inflated));
    } else {
        return ArchiveError{"unsupported compression method " + std::to_string(entry.method) +
                            ": " + path};
    }

    uint32_t crc = static_cast<uint32_t>(
        crc32(0, out.data(), static_cast<uInt>(out.size())));
    if (crc != entry.crc) {
        return ArchiveError{"CRC mismatch: " + path};
    }
    return out;
}

} // namespace apidiff::package
