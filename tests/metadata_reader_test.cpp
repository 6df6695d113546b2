//! # Metadata Reader Tests
//!
//! Loads synthesized modules and checks the PE walk, table decoding, the
//! module indexes and the load context. Malformed images must fail with a
//! `MetadataError` rather than read out of bounds.

#include "metadata/custom_attribute.hpp"
#include "metadata/load_context.hpp"
#include "metadata/module.hpp"
#include "metadata/signature.hpp"
#include "metadata/type_names.hpp"
#include "support/image_writer.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::metadata;
namespace test = apidiff::test;
namespace sig = apidiff::test::sig;
namespace flags = apidiff::test::flags;

namespace {

auto load_ok(const ByteBuffer& bytes, std::string name = "ExamplePkg") -> Box<Module> {
    auto result = Module::load(std::move(name), bytes);
    if (is_err(result)) {
        ADD_FAILURE() << unwrap_err(result).to_string();
        return nullptr;
    }
    return std::move(unwrap(result));
}

/// Widget (class, one method, one property) and Widget+Part (nested).
auto widget_image() -> ByteBuffer {
    test::ImageWriter w("ExamplePkg");
    auto object = w.system("Object");
    auto widget = w.add_type({
        .ns = "ExamplePkg",
        .name = "Widget",
        .extends = object,
        .methods = {{.name = "Run",
                     .signature = sig::method(sig::void_(), {sig::int32(), sig::string()}),
                     .params = {{"count"}, {"label", flags::PARAM_OPTIONAL | flags::PARAM_HAS_DEFAULT}}}},
        .properties = {{.name = "Size", .type = sig::int32(), .setter = true}},
    });
    w.add_type({
        .ns = "",
        .name = "Part",
        .flags = flags::NESTED_PUBLIC,
        .extends = object,
        .enclosing = widget.row,
    });
    return w.build();
}

} // namespace

// ============================================================================
// PE and Metadata Root
// ============================================================================

TEST(PeImageTest, FindsMetadataRoot) {
    auto bytes = widget_image();
    auto pe = PeImage::parse(bytes);
    ASSERT_TRUE(is_ok(pe)) << unwrap_err(pe).to_string();
    EXPECT_FALSE(unwrap(pe).is_pe32_plus());
    ASSERT_EQ(unwrap(pe).sections().size(), 1u);
    EXPECT_EQ(unwrap(pe).sections()[0].name, ".text");
    EXPECT_GT(unwrap(pe).metadata_size(), 0u);
    EXPECT_EQ(unwrap(pe).rva_to_offset(0x2000), std::optional<uint32_t>(0x200));
    EXPECT_FALSE(unwrap(pe).rva_to_offset(0x100).has_value());
}

TEST(MetadataReaderTest, ReadsVersionAndRowCounts) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    const auto& reader = module->reader();
    EXPECT_EQ(reader.version_string(), "v4.0.30319");
    EXPECT_EQ(reader.row_count(TableId::Module), 1u);
    EXPECT_EQ(reader.row_count(TableId::TypeDef), 3u); // <Module>, Widget, Part
    EXPECT_EQ(reader.row_count(TableId::Property), 1u);
    EXPECT_EQ(reader.row_count(TableId::NestedClass), 1u);
    EXPECT_EQ(reader.row_count(TableId::Field), 0u);
    EXPECT_EQ(reader.module_row().name, "ExamplePkg.dll");
}

TEST(MetadataReaderTest, DecodesTypeAndMethodRows) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    const auto& reader = module->reader();

    auto widget = reader.type_def(2);
    EXPECT_EQ(widget.name, "Widget");
    EXPECT_EQ(widget.namespace_name, "ExamplePkg");
    EXPECT_EQ(widget.extends.table, TableId::TypeRef);

    auto [first, last] = reader.method_range(2);
    // Run, get_Size, set_Size
    ASSERT_EQ(last - first, 3u);
    EXPECT_EQ(reader.method_def(first).name, "Run");

    auto [pfirst, plast] = reader.param_range(first);
    ASSERT_EQ(plast - pfirst, 2u);
    EXPECT_EQ(reader.param(pfirst).name, "count");
    EXPECT_EQ(reader.param(pfirst + 1).sequence, 2);
    EXPECT_NE(reader.param(pfirst + 1).flags & param_attributes::HAS_DEFAULT, 0);
}

TEST(MetadataReaderTest, DecodesMethodSignature) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    const auto& reader = module->reader();
    auto run = reader.method_def(reader.method_range(2).first);

    auto decoded = decode_method_sig(reader.blob_at(run.signature));
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded).to_string();
    const auto& method = unwrap(decoded);
    EXPECT_TRUE(method.has_this);
    EXPECT_EQ(method.return_type.element, element_type::VOID);
    ASSERT_EQ(method.params.size(), 2u);
    EXPECT_EQ(method.params[0].element, element_type::I4);
    EXPECT_EQ(method.params[1].element, element_type::STRING);
}

TEST(MetadataReaderTest, AssemblyAndReferences) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->assembly_name(), "ExamplePkg");
    EXPECT_EQ(module->reader().assembly().major, 1);
    ASSERT_EQ(module->reader().row_count(TableId::AssemblyRef), 1u);
    EXPECT_EQ(module->reader().assembly_ref(1).name, "System.Runtime");
}

// ============================================================================
// Module Indexes
// ============================================================================

TEST(ModuleTest, NestedTypeNames) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->type_full_name(2), "ExamplePkg.Widget");
    EXPECT_EQ(module->type_full_name(3), "ExamplePkg.Widget+Part");
    EXPECT_EQ(module->type_namespace(3), "ExamplePkg");
    EXPECT_EQ(module->enclosing_type(3), 2u);
    EXPECT_EQ(module->enclosing_type(2), 0u);
    EXPECT_EQ(module->find_type("ExamplePkg.Widget+Part"), 3u);
    EXPECT_EQ(module->find_type("ExamplePkg.Missing"), 0u);
}

TEST(ModuleTest, PropertyAccessors) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    auto [first, last] = module->properties_of(2);
    ASSERT_EQ(last - first, 1u);
    EXPECT_EQ(module->reader().property(first).name, "Size");

    auto accessors = module->accessors_of(first);
    ASSERT_NE(accessors.getter, 0u);
    ASSERT_NE(accessors.setter, 0u);
    EXPECT_EQ(module->reader().method_def(accessors.getter).name, "get_Size");
    EXPECT_TRUE(module->is_accessor(accessors.setter));
    EXPECT_FALSE(module->is_accessor(module->reader().method_range(2).first));
    EXPECT_EQ(module->method_owner(accessors.getter), 2u);
}

TEST(ModuleTest, TypeRefTargets) {
    auto module = load_ok(widget_image());
    ASSERT_NE(module, nullptr);
    const auto& target = module->type_ref_target(module->reader().type_def(2).extends.row);
    EXPECT_EQ(target.assembly_name, "System.Runtime");
    EXPECT_EQ(target.full_name, "System.Object");
}

TEST(ModuleTest, InterfacesAndGenericParameters) {
    test::ImageWriter w("ExamplePkg");
    auto object = w.system("Object");
    auto disposable = w.system("IDisposable");
    auto box = w.add_type({
        .ns = "ExamplePkg",
        .name = "Box`1",
        .extends = object,
        .interfaces = {disposable},
        .methods = {{.name = "Map",
                     .signature = sig::method(sig::method_var(0), {sig::type_var(0)}, false, 1),
                     .params = {{"value"}},
                     .generic_params = {"TResult"}}},
        .generic_params = {"T"},
    });
    auto module = load_ok(w.build());
    ASSERT_NE(module, nullptr);

    const auto& interfaces = module->interfaces_of(box.row);
    ASSERT_EQ(interfaces.size(), 1u);
    EXPECT_EQ(interfaces[0], disposable);

    EXPECT_EQ(module->generic_params_of(box), std::vector<std::string>{"T"});
    uint32_t map = module->reader().method_range(box.row).first;
    EXPECT_EQ(module->generic_params_of(CodedIndex{TableId::MethodDef, map}),
              std::vector<std::string>{"TResult"});

    auto context = GenericContext::for_type(*module, box.row).with_method(*module, map);
    auto decoded = decode_method_sig(module->reader().blob_at(module->reader().method_def(map).signature));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).generic_count, 1u);
    EXPECT_EQ(display_name(*module, unwrap(decoded).params[0], context, NameStyle::Full), "T");
    EXPECT_EQ(display_name(*module, unwrap(decoded).return_type, context, NameStyle::Full),
              "TResult");
}

// ============================================================================
// Type Names
// ============================================================================

TEST(TypeNamesTest, StripArity) {
    EXPECT_EQ(strip_arity("List`1"), "List");
    EXPECT_EQ(strip_arity("Dictionary`2"), "Dictionary");
    EXPECT_EQ(strip_arity("Plain"), "Plain");
    EXPECT_EQ(strip_arity("Odd`x"), "Odd`x");
    EXPECT_EQ(strip_arity("Trailing`"), "Trailing`");
}

TEST(TypeNamesTest, ShortAndFullGenericNames) {
    test::ImageWriter w("ExamplePkg");
    auto list = w.type_ref("System.Collections", "System.Collections.Generic", "List`1");
    auto dict = w.type_ref("System.Collections", "System.Collections.Generic", "Dictionary`2");
    ByteBuffer nested = sig::generic(dict, {sig::string(), sig::generic(list, {sig::int32()})});
    auto spec = w.type_spec(nested);
    w.add_type({.ns = "ExamplePkg", .name = "Holder", .extends = w.system("Object")});
    auto module = load_ok(w.build());
    ASSERT_NE(module, nullptr);

    GenericContext none;
    auto short_name = display_name(*module, spec, none, NameStyle::Short);
    auto full_name = display_name(*module, spec, none, NameStyle::Full);
    ASSERT_TRUE(is_ok(short_name));
    ASSERT_TRUE(is_ok(full_name));
    EXPECT_EQ(unwrap(short_name), "Dictionary<String,List<Int32>>");
    EXPECT_EQ(unwrap(full_name),
              "System.Collections.Generic.Dictionary<System.String,"
              "System.Collections.Generic.List<System.Int32>>");

    auto definition = definition_name(*module, spec);
    ASSERT_TRUE(is_ok(definition));
    EXPECT_EQ(unwrap(definition), "System.Collections.Generic.Dictionary`2");
}

// ============================================================================
// Custom Attributes
// ============================================================================

TEST(CustomAttributeTest, ObsoleteWithAndWithoutMessage) {
    test::ImageWriter w("ExamplePkg");
    auto object = w.system("Object");
    auto legacy = w.add_type({
        .ns = "ExamplePkg",
        .name = "Legacy",
        .extends = object,
        .methods = {{.name = "Old", .signature = sig::method(sig::void_(), {}), .obsolete = ""},
                    {.name = "Current", .signature = sig::method(sig::void_(), {})}},
        .obsolete = "Use Modern instead",
    });
    auto module = load_ok(w.build());
    ASSERT_NE(module, nullptr);

    auto type_message = find_obsolete(*module, legacy);
    ASSERT_TRUE(type_message.has_value());
    EXPECT_EQ(*type_message, "Use Modern instead");

    uint32_t old_row = module->reader().method_range(legacy.row).first;
    auto method_message = find_obsolete(*module, CodedIndex{TableId::MethodDef, old_row});
    ASSERT_TRUE(method_message.has_value());
    EXPECT_EQ(*method_message, "");

    EXPECT_FALSE(find_obsolete(*module, CodedIndex{TableId::MethodDef, old_row + 1}).has_value());
}

TEST(CustomAttributeTest, DecodeLeadingString) {
    ByteBuffer value = {0x01, 0x00, 0x03, 'a', 'b', 'c', 0x00, 0x00};
    auto message = decode_leading_string(ByteReader(value), true);
    ASSERT_TRUE(is_ok(message));
    EXPECT_EQ(unwrap(message), "abc");

    ByteBuffer null_string = {0x01, 0x00, 0xFF, 0x00, 0x00};
    auto empty = decode_leading_string(ByteReader(null_string), true);
    ASSERT_TRUE(is_ok(empty));
    EXPECT_EQ(unwrap(empty), "");

    ByteBuffer bad_prolog = {0x02, 0x00};
    EXPECT_TRUE(is_err(decode_leading_string(ByteReader(bad_prolog), true)));
}

// ============================================================================
// Malformed Images
// ============================================================================

TEST(MalformedImageTest, RejectsNonPeBytes) {
    EXPECT_TRUE(is_err(Module::load("junk", ByteBuffer{'n', 'o', 't', ' ', 'a', ' ', 'd', 'l', 'l'})));
    EXPECT_TRUE(is_err(Module::load("empty", ByteBuffer{})));
}

TEST(MalformedImageTest, RejectsTruncatedImages) {
    auto bytes = widget_image();
    auto pe = PeImage::parse(bytes);
    ASSERT_TRUE(is_ok(pe));
    size_t metadata_end = unwrap(pe).metadata_offset() + unwrap(pe).metadata_size();
    for (size_t cut : {size_t{0x40}, size_t{0x100}, size_t{0x250}, metadata_end - 1}) {
        ByteBuffer truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
        EXPECT_TRUE(is_err(Module::load("cut", truncated))) << "cut at " << cut;
    }
}

TEST(MalformedImageTest, RejectsBrokenMetadataSignature) {
    auto bytes = widget_image();
    auto pe = PeImage::parse(bytes);
    ASSERT_TRUE(is_ok(pe));
    // Corrupt "BSJB"
    bytes[unwrap(pe).metadata_offset()] = 'X';
    EXPECT_TRUE(is_err(Module::load("corrupt", bytes)));
}

TEST(MalformedImageTest, RandomCorruptionNeverCrashes) {
    auto original = widget_image();
    uint32_t state = 12345;
    for (int round = 0; round < 200; ++round) {
        ByteBuffer bytes = original;
        for (int flips = 0; flips < 8; ++flips) {
            state = state * 1103515245u + 12345u;
            size_t pos = 0x200 + (state >> 8) % (bytes.size() - 0x200);
            bytes[pos] = static_cast<uint8_t>(state >> 24);
        }
        auto result = Module::load("fuzz", bytes);
        if (is_ok(result)) {
            // Whatever loaded must be walkable
            const auto& module = *unwrap(result);
            for (uint32_t row = 1; row <= module.reader().row_count(TableId::TypeDef); ++row) {
                (void)module.type_full_name(row);
            }
        }
    }
    SUCCEED();
}

// ============================================================================
// Load Context
// ============================================================================

TEST(LoadContextTest, ResolvesAcrossModules) {
    test::ImageWriter core("ExamplePkg.Core");
    auto object = core.system("Object");
    core.add_type({.ns = "ExamplePkg", .name = "Base", .extends = object});

    test::ImageWriter app("ExamplePkg.App");
    auto base_ref = app.type_ref("ExamplePkg.Core", "ExamplePkg", "Base");
    auto missing_ref = app.type_ref("Elsewhere", "Other", "Thing");
    auto platform_ref = app.system("String");
    app.add_type({.ns = "ExamplePkg", .name = "Derived", .extends = base_ref});

    LoadContext context;
    ASSERT_TRUE(is_ok(context.add_module("ExamplePkg.Core", core.build())));
    auto added = context.add_module("ExamplePkg.App", app.build());
    ASSERT_TRUE(is_ok(added));
    const Module& app_module = *unwrap(added);

    auto resolved = context.resolve(app_module, base_ref);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->module->assembly_name(), "ExamplePkg.Core");
    EXPECT_EQ(resolved->module->type_full_name(resolved->row), "ExamplePkg.Base");

    EXPECT_FALSE(context.resolve(app_module, missing_ref).has_value());
    EXPECT_FALSE(context.resolve(app_module, platform_ref).has_value());
    EXPECT_NE(context.find_assembly("examplepkg.core"), nullptr);
}

TEST(LoadContextTest, SkipsBadAndDuplicateModules) {
    test::ImageWriter w("ExamplePkg");
    w.add_type({.ns = "ExamplePkg", .name = "A", .extends = w.system("Object")});
    auto image = w.build();

    LoadContext context;
    EXPECT_TRUE(is_ok(context.add_module("ExamplePkg", image)));
    EXPECT_TRUE(is_err(context.add_module("Broken", ByteBuffer{1, 2, 3})));
    EXPECT_TRUE(is_err(context.add_module("ExamplePkg.Copy", image)));

    EXPECT_EQ(context.modules().size(), 1u);
    ASSERT_EQ(context.skipped().size(), 2u);
    EXPECT_EQ(context.skipped()[0].module_name, "Broken");
}

TEST(LoadContextTest, PlatformBaseline) {
    EXPECT_TRUE(is_platform_assembly("System.Runtime"));
    EXPECT_TRUE(is_platform_assembly("MSCORLIB"));
    EXPECT_FALSE(is_platform_assembly("Newtonsoft.Json"));
}
