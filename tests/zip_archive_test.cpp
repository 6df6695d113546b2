//! # ZIP Archive Tests

#include "package/zip_archive.hpp"
#include "support/zip_builder.hpp"

#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::package;
using apidiff::test::to_bytes;
using apidiff::test::ZipBuilder;

namespace {

auto open_ok(ByteBuffer bytes) -> ZipArchive {
    auto result = ZipArchive::open(std::move(bytes));
    if (is_err(result)) {
        ADD_FAILURE() << unwrap_err(result).message;
    }
    return std::move(unwrap(result));
}

auto read_text(const ZipArchive& archive, const std::string& path) -> std::string {
    auto bytes = archive.read_entry(path);
    EXPECT_TRUE(is_ok(bytes)) << (is_err(bytes) ? unwrap_err(bytes).message : "");
    if (is_err(bytes)) {
        return {};
    }
    const auto& data = unwrap(bytes);
    return std::string(data.begin(), data.end());
}

} // namespace

TEST(ZipArchiveTest, ListsEntriesInOrder) {
    auto zip = ZipBuilder()
                   .add_text("ExamplePkg.nuspec", "<package/>")
                   .add_text("lib/net8.0/ExamplePkg.dll", "MZ")
                   .add_text("lib/net8.0/ExamplePkg.xml", "<doc/>")
                   .build();
    auto archive = open_ok(zip);
    ASSERT_EQ(archive.entries().size(), 3u);
    EXPECT_EQ(archive.entries()[0], "ExamplePkg.nuspec");
    EXPECT_EQ(archive.entries()[2], "lib/net8.0/ExamplePkg.xml");
}

TEST(ZipArchiveTest, ReadsStoredAndDeflatedEntries) {
    std::string repeated(4096, 'a');
    auto zip = ZipBuilder()
                   .add_text("stored.txt", "plain contents", false)
                   .add_text("deflated.txt", repeated, true)
                   .add_text("empty.txt", "", true)
                   .build();
    auto archive = open_ok(zip);
    EXPECT_EQ(read_text(archive, "stored.txt"), "plain contents");
    EXPECT_EQ(read_text(archive, "deflated.txt"), repeated);
    EXPECT_EQ(read_text(archive, "empty.txt"), "");
}

TEST(ZipArchiveTest, SkipsDirectoryEntries) {
    auto zip = ZipBuilder().add_text("lib/", "", false).add_text("lib/a.txt", "x").build();
    auto archive = open_ok(zip);
    ASSERT_EQ(archive.entries().size(), 1u);
    EXPECT_EQ(archive.entries()[0], "lib/a.txt");
}

TEST(ZipArchiveTest, MissingEntryIsAnError) {
    auto archive = open_ok(ZipBuilder().add_text("a.txt", "x").build());
    auto result = archive.read_entry("b.txt");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("b.txt"), std::string::npos);
}

TEST(ZipArchiveTest, DetectsCorruptedStoredData) {
    auto zip = ZipBuilder().add_text("a.txt", "hello world", false).build();
    // Local header is 30 bytes plus the name; flip the first data byte
    zip[30 + 5] ^= 0xFF;
    auto archive = open_ok(zip);
    auto result = archive.read_entry("a.txt");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("CRC mismatch"), std::string::npos);
}

TEST(ZipArchiveTest, RejectsNonZipBytes) {
    EXPECT_TRUE(is_err(ZipArchive::open(to_bytes("definitely not a zip file at all"))));
    EXPECT_TRUE(is_err(ZipArchive::open(ByteBuffer{})));
}

TEST(ZipArchiveTest, RejectsTruncatedCentralDirectory) {
    auto zip = ZipBuilder().add_text("a.txt", "x").add_text("b.txt", "y").build();
    // Drop the local data and most of the central directory, keep the end record
    ByteBuffer tail(zip.end() - 22, zip.end());
    EXPECT_TRUE(is_err(ZipArchive::open(tail)));
}
