//! # Nuspec Manifest Tests

#include "package/nuspec.hpp"
#include "package/zip_archive.hpp"
#include "support/zip_builder.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::package;

namespace {

using Strings = std::vector<std::string>;

auto ids_of(std::string_view xml) -> Strings {
    auto result = NuspecManifestReader::parse_dependency_ids(xml);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
    return is_ok(result) ? unwrap(result) : Strings{};
}

} // namespace

TEST(NuspecTest, GroupedDependenciesAreDeduplicated) {
    auto ids = ids_of(R"(<?xml version="1.0" encoding="utf-8"?>
<package xmlns="http://schemas.microsoft.com/packaging/2013/05/nuspec.xsd">
  <metadata>
    <id>ExamplePkg.All</id>
    <version>2.0.0</version>
    <dependencies>
      <group targetFramework="net8.0">
        <dependency id="ExamplePkg.Core" version="2.0.0" />
        <dependency id="ExamplePkg.Extras" version="2.0.0" />
      </group>
      <group targetFramework="netstandard2.0">
        <dependency id="ExamplePkg.Core" version="2.0.0" />
        <dependency id="System.Memory" version="4.5.5" />
      </group>
    </dependencies>
  </metadata>
</package>)");
    EXPECT_EQ(ids, (Strings{"ExamplePkg.Core", "ExamplePkg.Extras", "System.Memory"}));
}

TEST(NuspecTest, FlatDependencyList) {
    auto ids = ids_of(R"(<package><metadata><dependencies>
        <dependency id="Legacy.A" version="1.0" />
        <dependency id="" version="1.0" />
        <dependency id="Legacy.B" />
      </dependencies></metadata></package>)");
    EXPECT_EQ(ids, (Strings{"Legacy.A", "Legacy.B"}));
}

TEST(NuspecTest, PrefixedNamespace) {
    auto ids = ids_of(R"(<nu:package xmlns:nu="urn:nuspec"><nu:metadata><nu:dependencies>
        <nu:dependency id="Prefixed.Dep" />
      </nu:dependencies></nu:metadata></nu:package>)");
    EXPECT_EQ(ids, Strings{"Prefixed.Dep"});
}

TEST(NuspecTest, NoDependencies) {
    EXPECT_TRUE(ids_of("<package><metadata><id>Solo</id></metadata></package>").empty());
}

TEST(NuspecTest, Malformed) {
    auto broken = NuspecManifestReader::parse_dependency_ids("<package><metadata>");
    ASSERT_TRUE(is_err(broken));
    EXPECT_EQ(unwrap_err(broken).message.rfind("invalid nuspec: ", 0), 0u);

    auto wrong_root = NuspecManifestReader::parse_dependency_ids("<project><metadata/></project>");
    ASSERT_TRUE(is_err(wrong_root));
    EXPECT_NE(unwrap_err(wrong_root).message.find("missing <package><metadata>"),
              std::string::npos);
}

TEST(NuspecTest, ReadsRootManifestFromArchive) {
    auto bytes = test::ZipBuilder()
                     .add_text("content/Nested.nuspec", "<broken")
                     .add_text("ExamplePkg.All.NUSPEC",
                               "<package><metadata><dependencies>"
                               "<dependency id=\"ExamplePkg.Core\" />"
                               "</dependencies></metadata></package>")
                     .build();
    auto archive = ZipArchive::open(bytes);
    ASSERT_TRUE(is_ok(archive));

    NuspecManifestReader reader;
    auto ids = reader.dependency_ids(unwrap(archive));
    ASSERT_TRUE(is_ok(ids)) << unwrap_err(ids).message;
    EXPECT_EQ(unwrap(ids), Strings{"ExamplePkg.Core"});
}

TEST(NuspecTest, ArchiveWithoutManifest) {
    auto archive = ZipArchive::open(test::ZipBuilder().add_text("readme.txt", "hi").build());
    ASSERT_TRUE(is_ok(archive));

    NuspecManifestReader reader;
    auto ids = reader.dependency_ids(unwrap(archive));
    ASSERT_TRUE(is_err(ids));
    EXPECT_EQ(unwrap_err(ids).message, "archive has no .nuspec manifest");
}
