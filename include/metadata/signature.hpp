//! # Signature Decoding
//!
//! Decodes the `#Blob` signatures of ECMA-335 II.23.2 into a small tree:
//!
//! | Blob | Decoder |
//! |------|---------|
//! | MethodDefSig / MethodRefSig | `decode_method_sig` |
//! | PropertySig (0x08) | `decode_property_sig` |
//! | TypeSpec | `decode_type_spec` |
//!
//! Custom modifiers (`modreq`/`modopt`) and `pinned` are skipped. Named types
//! keep their raw `TypeDefOrRef` coded index; naming happens in
//! `type_names.hpp`, where the owning module is known.

#ifndef APIDIFF_METADATA_SIGNATURE_HPP
#define APIDIFF_METADATA_SIGNATURE_HPP

#include "common.hpp"
#include "common/byte_reader.hpp"
#include "metadata/metadata_error.hpp"
#include "metadata/tables.hpp"

#include <string_view>
#include <vector>

namespace apidiff::metadata {

// ============================================================================
// Element Types (II.23.1.16)
// ============================================================================

namespace element_type {
constexpr uint8_t END = 0x00;
constexpr uint8_t VOID = 0x01;
constexpr uint8_t BOOLEAN = 0x02;
constexpr uint8_t CHAR = 0x03;
constexpr uint8_t I1 = 0x04;
constexpr uint8_t U1 = 0x05;
constexpr uint8_t I2 = 0x06;
constexpr uint8_t U2 = 0x07;
constexpr uint8_t I4 = 0x08;
constexpr uint8_t U4 = 0x09;
constexpr uint8_t I8 = 0x0a;
constexpr uint8_t U8 = 0x0b;
constexpr uint8_t R4 = 0x0c;
constexpr uint8_t R8 = 0x0d;
constexpr uint8_t STRING = 0x0e;
constexpr uint8_t PTR = 0x0f;
constexpr uint8_t BYREF = 0x10;
constexpr uint8_t VALUETYPE = 0x11;
constexpr uint8_t CLASS = 0x12;
constexpr uint8_t VAR = 0x13;
constexpr uint8_t ARRAY = 0x14;
constexpr uint8_t GENERICINST = 0x15;
constexpr uint8_t TYPEDBYREF = 0x16;
constexpr uint8_t I = 0x18;
constexpr uint8_t U = 0x19;
constexpr uint8_t FNPTR = 0x1b;
constexpr uint8_t OBJECT = 0x1c;
constexpr uint8_t SZARRAY = 0x1d;
constexpr uint8_t MVAR = 0x1e;
constexpr uint8_t CMOD_REQD = 0x1f;
constexpr uint8_t CMOD_OPT = 0x20;
constexpr uint8_t SENTINEL = 0x41;
constexpr uint8_t PINNED = 0x45;
} // namespace element_type

namespace calling_convention {
constexpr uint8_t KIND_MASK = 0x0f;
constexpr uint8_t VARARG = 0x05;
constexpr uint8_t FIELD = 0x06;
constexpr uint8_t PROPERTY = 0x08;
constexpr uint8_t GENERIC = 0x10;
constexpr uint8_t HAS_THIS = 0x20;
constexpr uint8_t EXPLICIT_THIS = 0x40;
} // namespace calling_convention

/// Short name of a primitive element type ("Int32"), or empty if not primitive.
[[nodiscard]] auto primitive_name(uint8_t element) -> std::string_view;

// ============================================================================
// Signature Tree
// ============================================================================

enum class TypeSigKind : uint8_t {
    Primitive,   ///< `element` holds the element type
    Named,       ///< CLASS / VALUETYPE, `type` holds the coded index
    GenericInst, ///< `type` is the generic definition, `args` the arguments
    SzArray,     ///< `args[0]` is the element type
    Array,       ///< `args[0]` element type, `rank` dimensions
    Pointer,     ///< `args[0]` pointee
    ByRef,       ///< `args[0]` referent
    TypeVar,     ///< `number` is the type generic parameter index
    MethodVar,   ///< `number` is the method generic parameter index
    FnPtr,
};

struct TypeSig {
    TypeSigKind kind = TypeSigKind::Primitive;
    uint8_t element = 0;
    CodedIndex type;
    bool value_type = false;
    std::vector<TypeSig> args;
    uint32_t rank = 0;
    uint32_t number = 0;
};

struct MethodSig {
    bool has_this = false;
    uint32_t generic_count = 0;
    TypeSig return_type;
    std::vector<TypeSig> params;
};

struct PropertySig {
    bool has_this = false;
    TypeSig type;
    std::vector<TypeSig> params;
};

// ============================================================================
// Decoders
// ============================================================================

[[nodiscard]] auto decode_method_sig(ByteReader blob) -> Result<MethodSig, MetadataError>;

[[nodiscard]] auto decode_property_sig(ByteReader blob) -> Result<PropertySig, MetadataError>;

[[nodiscard]] auto decode_type_spec(ByteReader blob) -> Result<TypeSig, MetadataError>;

/// Decodes one `Type` (II.23.2.12) at the reader's position.
[[nodiscard]] auto decode_type(ByteReader& blob) -> Result<TypeSig, MetadataError>;

/// Decodes a TypeDefOrRefOrSpecEncoded value (II.23.2.8).
[[nodiscard]] auto decode_type_def_or_ref_encoded(uint32_t encoded) -> CodedIndex;

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_SIGNATURE_HPP
