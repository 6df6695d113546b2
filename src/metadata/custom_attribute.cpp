#include "metadata/custom_attribute.hpp"

#include "log/log.hpp"
#include "metadata/signature.hpp"
#include "metadata/type_names.hpp"

namespace apidiff::metadata {

namespace {

constexpr uint16_t ATTRIBUTE_PROLOG = 0x0001;
constexpr uint8_t NULL_STRING = 0xFF;

auto constructor_signature(const Module& module, CodedIndex constructor)
    -> Result<MethodSig, MetadataError> {
    const auto& md = module.reader();
    uint32_t blob = constructor.table == TableId::MethodDef ? md.method_def(constructor.row).signature
                                                            : md.member_ref(constructor.row).signature;
    return decode_method_sig(md.blob_at(blob));
}

} // namespace

auto attribute_type_name(const Module& module, CodedIndex constructor)
    -> Result<std::string, MetadataError> {
    if (constructor.table == TableId::MethodDef) {
        uint32_t owner = module.method_owner(constructor.row);
        if (owner == 0) {
            return MetadataError{"attribute constructor has no declaring type", 0};
        }
        return module.type_full_name(owner);
    }
    if (constructor.table == TableId::MemberRef) {
        CodedIndex parent = module.reader().member_ref(constructor.row).parent;
        return definition_name(module, parent);
    }
    return MetadataError{"bad attribute constructor index", 0};
}

auto decode_leading_string(ByteReader value, bool has_string_argument)
    -> Result<std::string, MetadataError> {
    if (value.u16() != ATTRIBUTE_PROLOG) {
        return MetadataError{"bad custom attribute prolog", value.pos()};
    }
    if (!has_string_argument) {
        return std::string();
    }
    if (!value.at_end() && value.data()[value.pos()] == NULL_STRING) {
        return std::string();
    }
    uint32_t length = value.compressed_u32();
    std::string_view text = value.str(length);
    if (value.failed()) {
        return MetadataError{"truncated attribute string", value.fail_offset()};
    }
    return std::string(text);
}

auto find_obsolete(const Module& module, CodedIndex parent) -> std::optional<std::string> {
    const auto& md = module.reader();
    for (uint32_t row : module.custom_attributes_of(parent)) {
        auto attribute = md.custom_attribute(row);
        auto type_name = attribute_type_name(module, attribute.constructor);
        if (is_err(type_name) || unwrap(type_name) != OBSOLETE_ATTRIBUTE) {
            continue;
        }

        auto ctor = constructor_signature(module, attribute.constructor);
        bool has_string = is_ok(ctor) && !unwrap(ctor).params.empty() &&
                          unwrap(ctor).params[0].kind == TypeSigKind::Primitive &&
                          unwrap(ctor).params[0].element == element_type::STRING;

        auto message = decode_leading_string(md.blob_at(attribute.value), has_string);
        if (is_err(message)) {
            APIDIFF_LOG_DEBUG("metadata", "Unreadable Obsolete message in " << module.module_name()
                                              << ": " << unwrap_err(message).message);
            return std::string();
        }
        return std::move(unwrap(message));
    }
    return std::nullopt;
}

} // namespace apidiff::metadata
