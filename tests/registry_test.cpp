//! # Registry Adapter Tests
//!
//! Local feed layouts, flat-container URLs and service index parsing.
//! Nothing here touches the network.

#include "package/registry.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::package;
namespace fs = std::filesystem;

namespace {

class LocalFeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() /
               ("apidiff_feed_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path& relative, std::string_view contents) {
        fs::path path = root / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << contents;
    }

    auto resolve(const std::string& id, const std::string& version)
        -> Result<ByteBuffer, RegistryError> {
        LocalFeedRegistry registry(root);
        return registry.resolve(PackageIdentity{id, version}, CancellationToken{});
    }

    fs::path root;
};

auto as_text(const ByteBuffer& bytes) -> std::string {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ============================================================================
// Local Feed
// ============================================================================

TEST_F(LocalFeedTest, HierarchicalLayout) {
    write("examplepkg/1.0.0/examplepkg.1.0.0.nupkg", "hier");
    auto result = resolve("ExamplePkg", "1.0.0");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(as_text(unwrap(result)), "hier");
}

TEST_F(LocalFeedTest, FlatLayoutIsCaseInsensitive) {
    write("ExamplePkg.2.0.0-Beta.nupkg", "flat");
    auto result = resolve("examplepkg", "2.0.0-beta");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    EXPECT_EQ(as_text(unwrap(result)), "flat");
}

TEST_F(LocalFeedTest, HierarchicalPreferredOverFlat) {
    write("examplepkg/1.0.0/examplepkg.1.0.0.nupkg", "hier");
    write("examplepkg.1.0.0.nupkg", "flat");
    auto result = resolve("ExamplePkg", "1.0.0");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(as_text(unwrap(result)), "hier");
}

TEST_F(LocalFeedTest, MissingPackageIsNotFound) {
    write("otherpkg.1.0.0.nupkg", "x");
    auto result = resolve("ExamplePkg", "9.9.9");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, RegistryError::Kind::NotFound);
    EXPECT_EQ(unwrap_err(result).message, "Package ExamplePkg 9.9.9 not found");
}

TEST_F(LocalFeedTest, MissingRootIsNetworkError) {
    LocalFeedRegistry registry(root / "does-not-exist");
    auto result = registry.resolve(PackageIdentity{"ExamplePkg", "1.0.0"}, CancellationToken{});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, RegistryError::Kind::Network);
}

TEST_F(LocalFeedTest, CancelledBeforeRead) {
    write("examplepkg.1.0.0.nupkg", "x");
    LocalFeedRegistry registry(root);
    CancellationToken cancel;
    cancel.cancel();
    auto result = registry.resolve(PackageIdentity{"ExamplePkg", "1.0.0"}, cancel);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, RegistryError::Kind::Cancelled);
    EXPECT_EQ(unwrap_err(result).message, "Operation cancelled");
}

TEST_F(LocalFeedTest, MakeRegistryPicksLocalFeedForDirectories) {
    auto registry = make_registry(root.string());
    EXPECT_NE(dynamic_cast<LocalFeedRegistry*>(registry.get()), nullptr);
}

// ============================================================================
// HTTP Registry Helpers
// ============================================================================

TEST(HttpRegistryTest, ArchiveUrlIsLowercase) {
    EXPECT_EQ(HttpRegistry::archive_url("https://api.nuget.org/v3-flatcontainer/",
                                        PackageIdentity{"Newtonsoft.Json", "13.0.3-Beta"}),
              "https://api.nuget.org/v3-flatcontainer/newtonsoft.json/13.0.3-beta/"
              "newtonsoft.json.13.0.3-beta.nupkg");
}

TEST(HttpRegistryTest, ArchiveUrlAddsMissingSlash) {
    EXPECT_EQ(HttpRegistry::archive_url("https://feed.example/flat", PackageIdentity{"A", "1.0.0"}),
              "https://feed.example/flat/a/1.0.0/a.1.0.0.nupkg");
}

TEST(HttpRegistryTest, FindsBaseAddressInServiceIndex) {
    const char* index = R"({
        "version": "3.0.0",
        "resources": [
            {"@id": "https://search.example/query", "@type": "SearchQueryService"},
            {"@id": "https://api.nuget.org/v3-flatcontainer/", "@type": "PackageBaseAddress/3.0.0"}
        ]
    })";
    auto address = HttpRegistry::find_base_address(index);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "https://api.nuget.org/v3-flatcontainer/");
}

TEST(HttpRegistryTest, ServiceIndexWithoutBaseAddress) {
    EXPECT_FALSE(HttpRegistry::find_base_address(R"({"resources": []})").has_value());
    EXPECT_FALSE(HttpRegistry::find_base_address("not json").has_value());
    EXPECT_FALSE(HttpRegistry::find_base_address(R"({"version": "3.0.0"})").has_value());
}

TEST(HttpRegistryTest, MakeRegistryFallsBackToServiceIndex) {
    auto registry = make_registry("https://api.nuget.org/v3/index.json");
    ASSERT_NE(dynamic_cast<HttpRegistry*>(registry.get()), nullptr);
    EXPECT_EQ(registry->describe(), "service index https://api.nuget.org/v3/index.json");

    auto fallback = make_registry("");
    EXPECT_EQ(fallback->describe(), std::string("service index ") + DEFAULT_SOURCE);
}

TEST(HttpRegistryTest, CancelledBeforeAnyRequest) {
    HttpRegistry registry("http://127.0.0.1:9/index.json");
    CancellationToken cancel;
    cancel.cancel();
    auto result = registry.resolve(PackageIdentity{"A", "1.0.0"}, cancel);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, RegistryError::Kind::Cancelled);
}
