//! # Custom Attributes
//!
//! Structural decoding of custom attributes: the attribute type is found
//! through the constructor's declaring type (MethodDef owner or MemberRef
//! parent), never through a live type. Only what the surface needs is
//! decoded: the `[Obsolete]` marker and its message.
//!
//! Attribute value blob (II.23.3):
//!
//! ```text
//! 0x0001 (prolog) FixedArg* NumNamed:u16 NamedArg*
//! SerString = 0xFF (null) | compressed length + UTF-8 bytes
//! ```

#ifndef APIDIFF_METADATA_CUSTOM_ATTRIBUTE_HPP
#define APIDIFF_METADATA_CUSTOM_ATTRIBUTE_HPP

#include "metadata/module.hpp"

#include <optional>
#include <string>

namespace apidiff::metadata {

constexpr const char* OBSOLETE_ATTRIBUTE = "System.ObsoleteAttribute";

/// Reflection full name of the type declaring an attribute constructor.
[[nodiscard]] auto attribute_type_name(const Module& module, CodedIndex constructor)
    -> Result<std::string, MetadataError>;

/// Reads the first fixed argument as a string, when the constructor takes
/// one. A missing or null string decodes as "".
[[nodiscard]] auto decode_leading_string(ByteReader value, bool has_string_argument)
    -> Result<std::string, MetadataError>;

/// Obsolete message of a TypeDef or MethodDef, nullopt if not obsolete.
/// An `[Obsolete]` without a message yields "".
[[nodiscard]] auto find_obsolete(const Module& module, CodedIndex parent)
    -> std::optional<std::string>;

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_CUSTOM_ATTRIBUTE_HPP
