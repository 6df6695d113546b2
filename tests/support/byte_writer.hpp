//! # Byte Writer
//!
//! Little-endian append-only buffer, the write-side counterpart of
//! `ByteReader`, used by the test fixtures that synthesize binary files.

#pragma once

#include "common.hpp"

#include <string_view>

namespace apidiff::test {

class ByteWriter {
public:
    void u8(uint8_t v) {
        buf_.push_back(v);
    }
    void u16(uint16_t v) {
        u8(static_cast<uint8_t>(v));
        u8(static_cast<uint8_t>(v >> 8));
    }
    void u32(uint32_t v) {
        u16(static_cast<uint16_t>(v));
        u16(static_cast<uint16_t>(v >> 16));
    }
    void u64(uint64_t v) {
        u32(static_cast<uint32_t>(v));
        u32(static_cast<uint32_t>(v >> 32));
    }
    /// Unsigned value in 2 or 4 bytes.
    void index(uint32_t v, size_t width) {
        if (width == 2) {
            u16(static_cast<uint16_t>(v));
        } else {
            u32(v);
        }
    }
    /// ECMA-335 II.23.2 compressed unsigned integer.
    void compressed(uint32_t v) {
        if (v < 0x80) {
            u8(static_cast<uint8_t>(v));
        } else if (v < 0x4000) {
            u8(static_cast<uint8_t>(0x80 | (v >> 8)));
            u8(static_cast<uint8_t>(v));
        } else {
            u8(static_cast<uint8_t>(0xC0 | (v >> 24)));
            u8(static_cast<uint8_t>(v >> 16));
            u8(static_cast<uint8_t>(v >> 8));
            u8(static_cast<uint8_t>(v));
        }
    }
    void bytes(const ByteBuffer& data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }
    void text(std::string_view s) {
        buf_.insert(buf_.end(), s.begin(), s.end());
    }
    void zeros(size_t n) {
        buf_.insert(buf_.end(), n, 0);
    }
    void align(size_t alignment) {
        while (buf_.size() % alignment != 0) {
            buf_.push_back(0);
        }
    }
    /// Overwrites 4 bytes at `offset`.
    void patch_u32(size_t offset, uint32_t v) {
        for (size_t i = 0; i < 4; ++i) {
            buf_[offset + i] = static_cast<uint8_t>(v >> (8 * i));
        }
    }

    [[nodiscard]] auto size() const -> size_t {
        return buf_.size();
    }
    [[nodiscard]] auto buffer() const -> const ByteBuffer& {
        return buf_;
    }
    [[nodiscard]] auto take() -> ByteBuffer {
        return std::move(buf_);
    }

private:
    ByteBuffer buf_;
};

} // namespace apidiff::test
