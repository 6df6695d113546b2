#include "support/zip_builder.hpp"

#include "support/byte_writer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace apidiff::test {

namespace {

auto deflate_raw(const ByteBuffer& input) -> ByteBuffer {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    ByteBuffer out(deflateBound(&strm, static_cast<uLong>(input.size())) + 16);
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(produced);
    return out;
}

} // namespace

auto to_bytes(std::string_view text) -> ByteBuffer {
    return ByteBuffer(text.begin(), text.end());
}

auto ZipBuilder::add(std::string path, ByteBuffer data, bool deflate) -> ZipBuilder& {
    entries_.push_back(Entry{std::move(path), std::move(data), deflate});
    return *this;
}

auto ZipBuilder::add_text(std::string path, std::string_view text, bool deflate) -> ZipBuilder& {
    return add(std::move(path), to_bytes(text), deflate);
}

auto ZipBuilder::build() const -> ByteBuffer {
    ByteWriter out;
    ByteWriter central;

    for (const auto& entry : entries_) {
        auto crc = static_cast<uint32_t>(
            crc32(0, entry.data.data(), static_cast<uInt>(entry.data.size())));
        ByteBuffer payload = entry.deflate ? deflate_raw(entry.data) : entry.data;
        uint16_t method = entry.deflate ? 8 : 0;
        auto offset = static_cast<uint32_t>(out.size());

        out.u32(0x04034b50);
        out.u16(20); // version needed
        out.u16(0);  // flags
        out.u16(method);
        out.u16(0); // time
        out.u16(0); // date
        out.u32(crc);
        out.u32(static_cast<uint32_t>(payload.size()));
        out.u32(static_cast<uint32_t>(entry.data.size()));
        out.u16(static_cast<uint16_t>(entry.path.size()));
        out.u16(0); // extra
        out.text(entry.path);
        out.bytes(payload);

        central.u32(0x02014b50);
        central.u16(20); // version made by
        central.u16(20); // version needed
        central.u16(0);
        central.u16(method);
        central.u16(0);
        central.u16(0);
        central.u32(crc);
        central.u32(static_cast<uint32_t>(payload.size()));
        central.u32(static_cast<uint32_t>(entry.data.size()));
        central.u16(static_cast<uint16_t>(entry.path.size()));
        central.u16(0); // extra
        central.u16(0); // comment
        central.u16(0); // disk start
        central.u16(0); // internal attributes
        central.u32(0); // external attributes
        central.u32(offset);
        central.text(entry.path);
    }

    auto cd_offset = static_cast<uint32_t>(out.size());
    out.bytes(central.buffer());
    out.u32(0x06054b50);
    out.u16(0);
    out.u16(0);
    out.u16(static_cast<uint16_t>(entries_.size()));
    out.u16(static_cast<uint16_t>(entries_.size()));
    out.u32(static_cast<uint32_t>(central.size()));
    out.u32(cd_offset);
    out.u16(0); // comment length
    return out.take();
}

void flip_first_byte_of(ByteBuffer& archive, std::string_view marker) {
    auto it = std::search(archive.begin(), archive.end(), marker.begin(), marker.end());
    if (it == archive.end()) {
        throw std::runtime_error("marker not found in archive");
    }
    *it ^= 0xFF;
}

} // namespace apidiff::test
