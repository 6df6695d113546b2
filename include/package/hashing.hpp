//! # Archive Hashing
//!
//! OpenSSL-backed helpers: the registry's `packageHash` format (SHA-512,
//! base64) and random identifiers for scratch directories.

#pragma once

#include "common.hpp"

#include <optional>
#include <string>

namespace apidiff::package {

/// SHA-512 of `bytes`, base64-encoded. Returns nullopt if OpenSSL fails.
[[nodiscard]] auto sha512_base64(const ByteBuffer& bytes) -> std::optional<std::string>;

/// `byte_count` cryptographically random bytes as lowercase hex.
[[nodiscard]] auto random_hex(size_t byte_count) -> std::optional<std::string>;

} // namespace apidiff::package
