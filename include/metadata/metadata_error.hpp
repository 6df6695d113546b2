//! # Metadata Errors
//!
//! Every decoding failure in the metadata layer (PE headers, metadata root,
//! table stream, heaps, signatures, attribute blobs) is reported as a
//! `MetadataError`. The offset is relative to the range being decoded and is
//! only meant for diagnostics.

#ifndef APIDIFF_METADATA_ERROR_HPP
#define APIDIFF_METADATA_ERROR_HPP

#include <cstddef>
#include <string>

namespace apidiff::metadata {

struct MetadataError {
    std::string message;
    size_t offset = 0;

    [[nodiscard]] auto to_string() const -> std::string {
        return message + " (at offset 0x" + to_hex(offset) + ")";
    }

private:
    static auto to_hex(size_t v) -> std::string {
        static constexpr char DIGITS[] = "0123456789abcdef";
        std::string out;
        do {
            out.insert(out.begin(), DIGITS[v & 0xF]);
            v >>= 4;
        } while (v != 0);
        return out;
    }
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_ERROR_HPP
