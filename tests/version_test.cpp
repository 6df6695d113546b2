//! # Version Normalization Tests

#include "package/version.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::package;

namespace {

auto normalized(std::string_view text) -> std::string {
    auto result = normalize_version(text);
    EXPECT_TRUE(is_ok(result)) << text << ": "
                               << (is_err(result) ? unwrap_err(result).message : "");
    return is_ok(result) ? unwrap(result) : std::string();
}

} // namespace

TEST(VersionTest, PadsMissingComponents) {
    EXPECT_EQ(normalized("1"), "1.0.0");
    EXPECT_EQ(normalized("1.0"), "1.0.0");
    EXPECT_EQ(normalized("13.0.3"), "13.0.3");
}

TEST(VersionTest, StripsLeadingZeros) {
    EXPECT_EQ(normalized("1.02.3.0"), "1.2.3");
    EXPECT_EQ(normalized("01.000.7"), "1.0.7");
}

TEST(VersionTest, KeepsNonZeroRevision) {
    EXPECT_EQ(normalized("1.2.3.4"), "1.2.3.4");
}

TEST(VersionTest, LowercasesReleaseAndDropsBuildMetadata) {
    EXPECT_EQ(normalized("2.0.0-Beta.1+sha.abc"), "2.0.0-beta.1");
    EXPECT_EQ(normalized("8.0.0-RC.2.23479.6"), "8.0.0-rc.2.23479.6");
    EXPECT_EQ(normalized("1.0+build"), "1.0.0");
}

TEST(VersionTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(normalized("  3.1.4\t"), "3.1.4");
}

TEST(VersionTest, RejectsMalformedVersions) {
    for (const char* bad : {"", "   ", "1..2", "1.2.3.4.5", "v1.0", "1.0-", "1.0-beta..1",
                            "1.0-beta_1", "1.x"}) {
        EXPECT_TRUE(is_err(normalize_version(bad))) << "'" << bad << "'";
    }
}

TEST(VersionTest, ErrorNamesBadComponent) {
    auto result = normalize_version("1.x.0");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("'x'"), std::string::npos);
}
