//! # Surface Serialization Tests

#include "json/json_parser.hpp"
#include "surface/surface_json.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::surface;

namespace {

auto sample_type() -> TypeSurface {
    TypeSurface type;
    type.full_name = "ExamplePkg.Widget";
    type.namespace_name = "ExamplePkg";
    type.name = "Widget";
    type.kind = "class";
    type.is_public = true;
    type.base_type = "System.Object";
    type.interfaces = {"System.IDisposable"};
    type.obsolete_message = "Use Gadget";

    MethodSurface run;
    run.name = "Run";
    run.signature = "Run(Int32)";
    run.return_type = "System.Threading.Tasks.Task";
    run.is_async = true;
    run.parameters.push_back(ParameterSurface{"count", "System.Int32", true});
    type.methods.push_back(run);

    MethodSurface create;
    create.name = "Create";
    create.signature = "Create()";
    create.return_type = "ExamplePkg.Widget";
    create.is_static = true;
    create.obsolete_message = "";
    type.methods.push_back(create);

    type.properties.push_back(PropertySurface{"Size", "System.Int32", true, false});
    return type;
}

} // namespace

TEST(SurfaceJsonTest, WritesCamelCaseFields) {
    auto json = to_json(sample_type());
    EXPECT_EQ(json.get("fullName")->as_string(), "ExamplePkg.Widget");
    EXPECT_EQ(json.get("baseType")->as_string(), "System.Object");
    EXPECT_TRUE(json.get("isPublic")->as_bool());

    const auto& run = (*json.get("methods"))[0];
    EXPECT_EQ(run.get("returnType")->as_string(), "System.Threading.Tasks.Task");
    EXPECT_TRUE(run.get("isAsync")->as_bool());
    EXPECT_EQ(run.get("obsoleteMessage"), nullptr);
    EXPECT_TRUE((*run.get("parameters"))[0].get("hasDefault")->as_bool());

    const auto& size = (*json.get("properties"))[0];
    EXPECT_TRUE(size.get("canRead")->as_bool());
    EXPECT_FALSE(size.get("canWrite")->as_bool());
}

TEST(SurfaceJsonTest, OmitsAbsentOptionals) {
    TypeSurface type;
    type.full_name = "I";
    type.name = "I";
    type.kind = "interface";
    auto json = to_json(type);
    EXPECT_FALSE(json.contains("baseType"));
    EXPECT_FALSE(json.contains("obsoleteMessage"));
}

TEST(SurfaceJsonTest, TypeSurvivesTextRoundTrip) {
    TypeSurface original = sample_type();
    auto parsed = json::parse_json(to_json(original).to_string_pretty());
    ASSERT_TRUE(is_ok(parsed));
    auto back = type_from_json(unwrap(parsed));
    ASSERT_TRUE(is_ok(back)) << unwrap_err(back).to_string();
    EXPECT_EQ(unwrap(back), original);
    // An empty obsolete message stays distinct from "not obsolete"
    ASSERT_TRUE(unwrap(back).methods[1].obsolete_message.has_value());
    EXPECT_EQ(*unwrap(back).methods[1].obsolete_message, "");
}

TEST(SurfaceJsonTest, SurfaceEnvelope) {
    ApiSurface surface;
    surface.package_id = "ExamplePkg";
    surface.version = "1.0.0";
    surface.archive_sha512 = "abc=";
    surface.types.push_back(sample_type());
    surface.skipped_modules = {"Native: not a PE image"};

    auto json = to_json(surface);
    EXPECT_EQ(json.get("typeCount")->as_i64(), 1);
    EXPECT_FALSE(json.contains("error"));

    auto back = surface_from_json(json);
    ASSERT_TRUE(is_ok(back));
    EXPECT_EQ(unwrap(back).package_id, "ExamplePkg");
    EXPECT_EQ(unwrap(back).skipped_modules, surface.skipped_modules);
    ASSERT_EQ(unwrap(back).types.size(), 1u);
    EXPECT_EQ(unwrap(back).types[0], surface.types[0]);
}

TEST(SurfaceJsonTest, RejectsWrongShapes) {
    auto not_object = type_from_json(json::json_int(3));
    ASSERT_TRUE(is_err(not_object));

    auto json = to_json(sample_type());
    json.as_object_mut().erase("kind");
    auto missing = type_from_json(json);
    ASSERT_TRUE(is_err(missing));
    EXPECT_NE(unwrap_err(missing).message.find("kind"), std::string::npos);

    EXPECT_TRUE(is_err(types_from_json(json::json_object())));
}
