//! # Archive Extractor Tests
//!
//! Candidate classification and the one-module-per-name selection rules.

#include "package/archive_extractor.hpp"
#include "package/zip_archive.hpp"
#include "support/zip_builder.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::package;
using apidiff::test::ZipBuilder;

namespace {

auto open_zip(const ZipBuilder& builder) -> ZipArchive {
    auto result = ZipArchive::open(builder.build());
    if (is_err(result)) {
        ADD_FAILURE() << unwrap_err(result).message;
    }
    return std::move(unwrap(result));
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyEntryTest, LibRefAndRuntimesFolders) {
    auto lib = classify_entry("lib/net8.0/Foo.dll");
    ASSERT_TRUE(lib.has_value());
    EXPECT_EQ(lib->module_name, "Foo");
    EXPECT_EQ(lib->target_framework, "net8.0");
    EXPECT_EQ(lib->folder, AssetFolder::Lib);
    EXPECT_EQ(lib->priority, 100);

    auto ref = classify_entry("ref/netstandard2.0/Foo.dll");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->folder, AssetFolder::Ref);

    auto runtime = classify_entry("runtimes/win-x64/lib/net6.0/Foo.dll");
    ASSERT_TRUE(runtime.has_value());
    EXPECT_EQ(runtime->folder, AssetFolder::Runtimes);
    EXPECT_EQ(runtime->target_framework, "net6.0");
}

TEST(ClassifyEntryTest, ExtensionIsCaseInsensitive) {
    auto entry = classify_entry("LIB/net8.0/Foo.DLL");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->module_name, "Foo");
}

TEST(ClassifyEntryTest, RejectsNonCandidates) {
    for (const char* path : {
             "Foo.dll",
             "lib/Foo.dll",
             "lib/net8.0/Foo.xml",
             "lib/net8.0/Foo.pdb",
             "lib/net8.0/fr/Foo.resources.dll",
             "lib/uap10.0/Foo.dll",
             "analyzers/dotnet/cs/Foo.dll",
             "build/net8.0/Foo.dll",
             "content/net8.0/Foo.dll",
             "runtimes/win-x64/native/Foo.dll",
             "tools/net8.0/Foo.dll",
             "lib/net8.0/.dll",
         }) {
        EXPECT_FALSE(classify_entry(path).has_value()) << path;
    }
}

// ============================================================================
// Selection
// ============================================================================

TEST(SelectModulesTest, HighestPriorityTargetWins) {
    auto archive = open_zip(ZipBuilder()
                                .add_text("lib/netstandard2.0/Foo.dll", "ns20")
                                .add_text("lib/net8.0/Foo.dll", "net8")
                                .add_text("lib/net45/Foo.dll", "net45"));
    auto selection = select_modules(archive);
    EXPECT_TRUE(selection.failures.empty());
    ASSERT_EQ(selection.modules.size(), 1u);
    const auto& module = selection.modules[0];
    EXPECT_EQ(module.entry_path, "lib/net8.0/Foo.dll");
    EXPECT_EQ(module.target_framework, "net8.0");
    EXPECT_EQ(std::string(module.bytes.begin(), module.bytes.end()), "net8");
}

TEST(SelectModulesTest, LibBeatsRuntimesBeatsRefAtEqualPriority) {
    auto archive = open_zip(ZipBuilder()
                                .add_text("ref/net8.0/Foo.dll", "ref")
                                .add_text("runtimes/linux-x64/lib/net8.0/Foo.dll", "rt")
                                .add_text("lib/net8.0/Foo.dll", "lib"));
    EXPECT_EQ(selected_entry_paths(archive), std::vector<std::string>{"lib/net8.0/Foo.dll"});

    auto no_lib = open_zip(ZipBuilder()
                               .add_text("ref/net8.0/Foo.dll", "ref")
                               .add_text("runtimes/linux-x64/lib/net8.0/Foo.dll", "rt"));
    EXPECT_EQ(selected_entry_paths(no_lib),
              std::vector<std::string>{"runtimes/linux-x64/lib/net8.0/Foo.dll"});
}

TEST(SelectModulesTest, SmallestPathBreaksRemainingTies) {
    auto archive = open_zip(ZipBuilder()
                                .add_text("runtimes/win-x64/lib/net8.0/Foo.dll", "win")
                                .add_text("runtimes/linux-x64/lib/net8.0/Foo.dll", "linux"));
    EXPECT_EQ(selected_entry_paths(archive),
              std::vector<std::string>{"runtimes/linux-x64/lib/net8.0/Foo.dll"});
}

TEST(SelectModulesTest, OneModulePerNameSortedByName) {
    auto archive = open_zip(ZipBuilder()
                                .add_text("lib/net8.0/Zeta.dll", "z")
                                .add_text("lib/net8.0/Alpha.dll", "a")
                                .add_text("lib/netstandard2.0/Alpha.dll", "a-old")
                                .add_text("lib/net8.0/Alpha.xml", "doc"));
    auto selection = select_modules(archive);
    ASSERT_EQ(selection.modules.size(), 2u);
    EXPECT_EQ(selection.modules[0].module_name, "Alpha");
    EXPECT_EQ(selection.modules[1].module_name, "Zeta");
}

TEST(SelectModulesTest, NoCandidatesIsEmptyResult) {
    auto archive = open_zip(ZipBuilder()
                                .add_text("Meta.nuspec", "<package/>")
                                .add_text("lib/netstandard2.0/_._", ""));
    auto selection = select_modules(archive);
    EXPECT_TRUE(selection.modules.empty());
    EXPECT_TRUE(selection.failures.empty());
    EXPECT_FALSE(has_code_modules(archive));
}

TEST(SelectModulesTest, CorruptEntryDoesNotHideTheOthers) {
    auto bytes = ZipBuilder()
                     .add_text("lib/net8.0/Alpha.dll", "alpha", false)
                     .add_text("lib/net8.0/Beta.dll", "beta-body", false)
                     .add_text("lib/net8.0/Gamma.dll", "gamma", false)
                     .build();
    apidiff::test::flip_first_byte_of(bytes, "beta-body");
    auto archive = ZipArchive::open(std::move(bytes));
    ASSERT_TRUE(is_ok(archive));

    auto selection = select_modules(unwrap(archive));
    ASSERT_EQ(selection.modules.size(), 2u);
    EXPECT_EQ(selection.modules[0].module_name, "Alpha");
    EXPECT_EQ(selection.modules[1].module_name, "Gamma");
    ASSERT_EQ(selection.failures.size(), 1u);
    EXPECT_EQ(selection.failures[0].module_name, "Beta");
    EXPECT_EQ(selection.failures[0].message, "CRC mismatch: lib/net8.0/Beta.dll");
}

TEST(SelectModulesTest, HasCodeModules) {
    auto archive = open_zip(ZipBuilder().add_text("lib/net48/Foo.dll", "x"));
    EXPECT_TRUE(has_code_modules(archive));
}
