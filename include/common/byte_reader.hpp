//! # Byte Reader
//!
//! Bounds-checked little-endian cursor over an immutable byte range, used by
//! the ZIP reader, the PE/COFF reader and the ECMA-335 metadata decoders.
//!
//! Failure is sticky: a read past the end marks the reader as failed, returns
//! zero, and every later read also returns zero. Callers read a whole record
//! and check `failed()` once, so no read can ever touch memory outside the
//! range.
//!
//! ```cpp
//! ByteReader r(bytes.data(), bytes.size());
//! uint32_t sig = r.u32();
//! uint16_t count = r.u16();
//! if (r.failed()) {
//!     return MetadataError{"truncated header", r.fail_offset()};
//! }
//! ```

#ifndef APIDIFF_COMMON_BYTE_READER_HPP
#define APIDIFF_COMMON_BYTE_READER_HPP

#include "common.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace apidiff {

class ByteReader {
public:
    ByteReader() = default;

    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    explicit ByteReader(const ByteBuffer& buffer) : data_(buffer.data()), size_(buffer.size()) {}

    // ------------------------------------------------------------------------
    // Fixed-width reads
    // ------------------------------------------------------------------------

    auto u8() -> uint8_t {
        if (!ensure(1)) {
            return 0;
        }
        return data_[pos_++];
    }

    auto u16() -> uint16_t {
        if (!ensure(2)) {
            return 0;
        }
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    auto u32() -> uint32_t {
        if (!ensure(4)) {
            return 0;
        }
        uint32_t v = static_cast<uint32_t>(data_[pos_]) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    auto u64() -> uint64_t {
        uint64_t lo = u32();
        uint64_t hi = u32();
        return lo | (hi << 32);
    }

    /// Reads a 2- or 4-byte little-endian value (heap and table indexes).
    auto index(size_t width) -> uint32_t {
        return width == 2 ? u16() : u32();
    }

    // ------------------------------------------------------------------------
    // ECMA-335 compressed integers (II.23.2)
    // ------------------------------------------------------------------------

    /// 1, 2 or 4 byte big-endian compressed unsigned integer.
    auto compressed_u32() -> uint32_t {
        uint8_t b0 = u8();
        if ((b0 & 0x80) == 0) {
            return b0;
        }
        if ((b0 & 0xC0) == 0x80) {
            uint8_t b1 = u8();
            return (static_cast<uint32_t>(b0 & 0x3F) << 8) | b1;
        }
        if ((b0 & 0xE0) == 0xC0) {
            uint8_t b1 = u8();
            uint8_t b2 = u8();
            uint8_t b3 = u8();
            return (static_cast<uint32_t>(b0 & 0x1F) << 24) | (static_cast<uint32_t>(b1) << 16) |
                   (static_cast<uint32_t>(b2) << 8) | b3;
        }
        fail();
        return 0;
    }

    /// Compressed signed integer (rotated sign bit), used for array lower bounds.
    auto compressed_i32() -> int32_t {
        size_t start = pos_;
        uint32_t raw = compressed_u32();
        size_t width = pos_ - start;
        bool negative = (raw & 1) != 0;
        uint32_t magnitude = raw >> 1;
        if (!negative) {
            return static_cast<int32_t>(magnitude);
        }
        uint32_t bits = width == 1 ? 6 : (width == 2 ? 13 : 28);
        return static_cast<int32_t>(magnitude | (~0u << bits));
    }

    // ------------------------------------------------------------------------
    // Ranges
    // ------------------------------------------------------------------------

    /// Returns a pointer to the next `n` bytes and advances, or nullptr.
    auto bytes(size_t n) -> const uint8_t* {
        if (!ensure(n)) {
            return nullptr;
        }
        const uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    /// Reads `n` bytes as a string view (no encoding check).
    auto str(size_t n) -> std::string_view {
        const uint8_t* p = bytes(n);
        if (p == nullptr) {
            return {};
        }
        return std::string_view(reinterpret_cast<const char*>(p), n);
    }

    /// Reads a NUL-terminated string of at most `max_len` bytes (terminator consumed).
    auto cstring(size_t max_len) -> std::string_view {
        size_t limit = std::min(size_ - std::min(pos_, size_), max_len);
        for (size_t i = 0; i < limit; ++i) {
            if (data_[pos_ + i] == 0) {
                std::string_view s(reinterpret_cast<const char*>(data_ + pos_), i);
                pos_ += i + 1;
                return s;
            }
        }
        fail();
        return {};
    }

    /// A reader over `[offset, offset + len)` of this range. Fails (both
    /// readers) if the window is out of bounds.
    auto window(size_t offset, size_t len) -> ByteReader {
        if (failed_ || offset > size_ || len > size_ - offset) {
            fail();
            ByteReader bad;
            bad.failed_ = true;
            return bad;
        }
        return ByteReader(data_ + offset, len);
    }

    void seek(size_t pos) {
        if (pos > size_) {
            fail();
            return;
        }
        pos_ = pos;
    }

    void skip(size_t n) {
        if (ensure(n)) {
            pos_ += n;
        }
    }

    /// Advances to the next multiple of 4 (stream names, version strings).
    void align4() {
        size_t aligned = (pos_ + 3) & ~static_cast<size_t>(3);
        seek(aligned);
    }

    [[nodiscard]] auto pos() const -> size_t {
        return pos_;
    }
    [[nodiscard]] auto size() const -> size_t {
        return size_;
    }
    [[nodiscard]] auto remaining() const -> size_t {
        return pos_ <= size_ ? size_ - pos_ : 0;
    }
    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= size_;
    }
    [[nodiscard]] auto data() const -> const uint8_t* {
        return data_;
    }
    [[nodiscard]] auto failed() const -> bool {
        return failed_;
    }
    /// Position of the first failing read.
    [[nodiscard]] auto fail_offset() const -> size_t {
        return fail_offset_;
    }

private:
    auto ensure(size_t n) -> bool {
        if (failed_ || n > size_ || pos_ > size_ - n) {
            fail();
            return false;
        }
        return true;
    }

    void fail() {
        if (!failed_) {
            failed_ = true;
            fail_offset_ = pos_;
        }
    }

    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
    bool failed_ = false;
    size_t fail_offset_ = 0;
};

} // namespace apidiff

#endif // APIDIFF_COMMON_BYTE_READER_HPP
