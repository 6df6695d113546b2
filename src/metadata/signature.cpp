#include "metadata/signature.hpp"

namespace apidiff::metadata {

namespace {

namespace et = element_type;
namespace cc = calling_convention;

/// Nesting limit for `Type` productions (generic args, arrays, pointers).
constexpr int MAX_DEPTH = 64;
/// Sanity limit on parameter counts, far above anything a compiler emits.
constexpr uint32_t MAX_PARAMS = 0x10000;

auto sig_error(std::string message, const ByteReader& r) -> MetadataError {
    return MetadataError{std::move(message), r.failed() ? r.fail_offset() : r.pos()};
}

void skip_custom_mods(ByteReader& r) {
    while (!r.at_end()) {
        uint8_t b = r.data()[r.pos()];
        if (b != et::CMOD_REQD && b != et::CMOD_OPT) {
            return;
        }
        r.u8();
        r.compressed_u32();
    }
}

auto decode_type_at(ByteReader& r, int depth) -> Result<TypeSig, MetadataError>;
auto decode_method_at(ByteReader& blob, int depth) -> Result<MethodSig, MetadataError>;

auto wrap(TypeSigKind kind, ByteReader& r, int depth) -> Result<TypeSig, MetadataError> {
    auto inner = decode_type_at(r, depth + 1);
    if (is_err(inner)) {
        return unwrap_err(inner);
    }
    TypeSig sig;
    sig.kind = kind;
    sig.args.push_back(std::move(unwrap(inner)));
    return sig;
}

/// Decodes a RetType or Param: custom mods, optional BYREF, then a Type.
auto decode_param(ByteReader& r, int depth) -> Result<TypeSig, MetadataError> {
    skip_custom_mods(r);
    return decode_type_at(r, depth);
}

auto decode_type_at(ByteReader& r, int depth) -> Result<TypeSig, MetadataError> {
    if (depth > MAX_DEPTH) {
        return sig_error("signature nested too deeply", r);
    }
    skip_custom_mods(r);
    uint8_t element = r.u8();
    if (r.failed()) {
        return sig_error("truncated signature", r);
    }

    if (!primitive_name(element).empty()) {
        TypeSig sig;
        sig.element = element;
        return sig;
    }

    switch (element) {
    case et::CLASS:
    case et::VALUETYPE: {
        TypeSig sig;
        sig.kind = TypeSigKind::Named;
        sig.value_type = element == et::VALUETYPE;
        sig.type = decode_type_def_or_ref_encoded(r.compressed_u32());
        if (r.failed() || sig.type.is_null()) {
            return sig_error("bad type reference in signature", r);
        }
        return sig;
    }
    case et::GENERICINST: {
        uint8_t flavor = r.u8();
        if (flavor != et::CLASS && flavor != et::VALUETYPE) {
            return sig_error("bad generic instantiation", r);
        }
        TypeSig sig;
        sig.kind = TypeSigKind::GenericInst;
        sig.value_type = flavor == et::VALUETYPE;
        sig.type = decode_type_def_or_ref_encoded(r.compressed_u32());
        uint32_t count = r.compressed_u32();
        if (r.failed() || sig.type.is_null() || count == 0 || count > MAX_PARAMS) {
            return sig_error("bad generic instantiation", r);
        }
        for (uint32_t i = 0; i < count; ++i) {
            auto arg = decode_type_at(r, depth + 1);
            if (is_err(arg)) {
                return unwrap_err(arg);
            }
            sig.args.push_back(std::move(unwrap(arg)));
        }
        return sig;
    }
    case et::SZARRAY:
        return wrap(TypeSigKind::SzArray, r, depth);
    case et::PTR:
        return wrap(TypeSigKind::Pointer, r, depth);
    case et::BYREF:
        return wrap(TypeSigKind::ByRef, r, depth);
    case et::ARRAY: {
        auto result = wrap(TypeSigKind::Array, r, depth);
        if (is_err(result)) {
            return result;
        }
        TypeSig& sig = unwrap(result);
        sig.rank = r.compressed_u32();
        uint32_t sizes = r.compressed_u32();
        for (uint32_t i = 0; i < sizes && !r.failed(); ++i) {
            r.compressed_u32();
        }
        uint32_t bounds = r.compressed_u32();
        for (uint32_t i = 0; i < bounds && !r.failed(); ++i) {
            r.compressed_i32();
        }
        if (r.failed() || sig.rank == 0) {
            return sig_error("bad array shape", r);
        }
        return result;
    }
    case et::VAR:
    case et::MVAR: {
        TypeSig sig;
        sig.kind = element == et::VAR ? TypeSigKind::TypeVar : TypeSigKind::MethodVar;
        sig.number = r.compressed_u32();
        if (r.failed()) {
            return sig_error("truncated generic parameter", r);
        }
        return sig;
    }
    case et::FNPTR: {
        auto inner = decode_method_at(r, depth + 1);
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        TypeSig sig;
        sig.kind = TypeSigKind::FnPtr;
        return sig;
    }
    default:
        return sig_error("unsupported element type 0x" + std::to_string(element), r);
    }
}

auto decode_method_at(ByteReader& blob, int depth) -> Result<MethodSig, MetadataError> {
    MethodSig sig;
    uint8_t conv = blob.u8();
    uint8_t kind = conv & cc::KIND_MASK;
    if (blob.failed() || kind == cc::FIELD || kind == cc::PROPERTY || kind > cc::VARARG) {
        return sig_error("not a method signature", blob);
    }
    sig.has_this = (conv & cc::HAS_THIS) != 0;
    if ((conv & cc::GENERIC) != 0) {
        sig.generic_count = blob.compressed_u32();
    }
    uint32_t count = blob.compressed_u32();
    if (blob.failed() || count > MAX_PARAMS) {
        return sig_error("bad parameter count", blob);
    }

    auto ret = decode_param(blob, depth);
    if (is_err(ret)) {
        return unwrap_err(ret);
    }
    sig.return_type = std::move(unwrap(ret));

    for (uint32_t i = 0; i < count; ++i) {
        if (!blob.at_end() && blob.data()[blob.pos()] == et::SENTINEL) {
            blob.u8(); // vararg call sites only
        }
        auto param = decode_param(blob, depth);
        if (is_err(param)) {
            return unwrap_err(param);
        }
        sig.params.push_back(std::move(unwrap(param)));
    }
    return sig;
}

} // namespace

auto primitive_name(uint8_t element) -> std::string_view {
    switch (element) {
    case et::VOID:
        return "Void";
    case et::BOOLEAN:
        return "Boolean";
    case et::CHAR:
        return "Char";
    case et::I1:
        return "SByte";
    case et::U1:
        return "Byte";
    case et::I2:
        return "Int16";
    case et::U2:
        return "UInt16";
    case et::I4:
        return "Int32";
    case et::U4:
        return "UInt32";
    case et::I8:
        return "Int64";
    case et::U8:
        return "UInt64";
    case et::R4:
        return "Single";
    case et::R8:
        return "Double";
    case et::STRING:
        return "String";
    case et::TYPEDBYREF:
        return "TypedReference";
    case et::I:
        return "IntPtr";
    case et::U:
        return "UIntPtr";
    case et::OBJECT:
        return "Object";
    default:
        return {};
    }
}

auto decode_type_def_or_ref_encoded(uint32_t encoded) -> CodedIndex {
    static constexpr TableId TAGS[] = {TableId::TypeDef, TableId::TypeRef, TableId::TypeSpec};
    uint32_t tag = encoded & 0x3;
    uint32_t row = encoded >> 2;
    if (tag > 2 || row == 0) {
        return CodedIndex{};
    }
    return CodedIndex{TAGS[tag], row};
}

auto decode_type(ByteReader& blob) -> Result<TypeSig, MetadataError> {
    return decode_type_at(blob, 0);
}

auto decode_method_sig(ByteReader blob) -> Result<MethodSig, MetadataError> {
    return decode_method_at(blob, 0);
}

auto decode_property_sig(ByteReader blob) -> Result<PropertySig, MetadataError> {
    PropertySig sig;
    uint8_t conv = blob.u8();
    if (blob.failed() || (conv & cc::KIND_MASK) != cc::PROPERTY) {
        return sig_error("not a property signature", blob);
    }
    sig.has_this = (conv & cc::HAS_THIS) != 0;
    uint32_t count = blob.compressed_u32();
    if (blob.failed() || count > MAX_PARAMS) {
        return sig_error("bad parameter count", blob);
    }
    auto type = decode_param(blob, 0);
    if (is_err(type)) {
        return unwrap_err(type);
    }
    sig.type = std::move(unwrap(type));
    for (uint32_t i = 0; i < count; ++i) {
        auto param = decode_param(blob, 0);
        if (is_err(param)) {
            return unwrap_err(param);
        }
        sig.params.push_back(std::move(unwrap(param)));
    }
    return sig;
}

auto decode_type_spec(ByteReader blob) -> Result<TypeSig, MetadataError> {
    return decode_type_at(blob, 0);
}

} // namespace apidiff::metadata
