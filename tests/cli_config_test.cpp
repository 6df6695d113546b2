//! # CLI Configuration Tests

#include "cli/config.hpp"
#include "package/registry.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace apidiff;
using namespace apidiff::cli;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("APIDIFF_SOURCE");
        unsetenv("APIDIFF_SCRATCH");
        unsetenv("APIDIFF_LOG");
    }
    void TearDown() override {
        SetUp();
    }

    auto parse(std::vector<std::string> args) -> Result<Config, std::string> {
        storage = std::move(args);
        storage.insert(storage.begin(), "apidiff");
        argv.clear();
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        return parse_config(static_cast<int>(argv.size()), argv.data());
    }

    std::vector<std::string> storage;
    std::vector<char*> argv;
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    auto result = parse({});
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_TRUE(config.command.empty());
    EXPECT_EQ(config.source, package::DEFAULT_SOURCE);
    EXPECT_FALSE(config.scratch_root.empty());
    EXPECT_FALSE(config.include_non_public);
    EXPECT_FALSE(config.json);
    EXPECT_FALSE(config.help);
}

TEST_F(ConfigTest, CommandAndPositionals) {
    auto result = parse({"diff", "ExamplePkg", "1.0.0", "2.0.0", "--json"});
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_EQ(config.command, "diff");
    EXPECT_EQ(config.positional, (std::vector<std::string>{"ExamplePkg", "1.0.0", "2.0.0"}));
    EXPECT_TRUE(config.json);
}

TEST_F(ConfigTest, SourceAndScratchOptions) {
    auto result = parse({"--source=/srv/feed", "surface", "--scratch-dir=/tmp/x",
                         "--include-non-public", "ExamplePkg", "1.0.0"});
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_EQ(config.source, "/srv/feed");
    EXPECT_EQ(config.scratch_root, std::filesystem::path("/tmp/x"));
    EXPECT_TRUE(config.include_non_public);
    EXPECT_EQ(config.command, "surface");
}

TEST_F(ConfigTest, EnvironmentDefaults) {
    setenv("APIDIFF_SOURCE", "https://feed.example/v3/index.json", 1);
    setenv("APIDIFF_SCRATCH", "/var/tmp/apidiff-work", 1);
    auto result = parse({"mcp"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).source, "https://feed.example/v3/index.json");
    EXPECT_EQ(unwrap(result).scratch_root, std::filesystem::path("/var/tmp/apidiff-work"));

    auto overridden = parse({"mcp", "--source=/local"});
    ASSERT_TRUE(is_ok(overridden));
    EXPECT_EQ(unwrap(overridden).source, "/local");
}

TEST_F(ConfigTest, BlankEnvironmentIsIgnored) {
    setenv("APIDIFF_SOURCE", "   ", 1);
    auto result = parse({});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).source, package::DEFAULT_SOURCE);
}

TEST_F(ConfigTest, OptionsNeedValues) {
    auto source = parse({"--source="});
    ASSERT_TRUE(is_err(source));
    EXPECT_EQ(unwrap_err(source), "--source requires a value");

    auto scratch = parse({"--scratch-dir= "});
    ASSERT_TRUE(is_err(scratch));
    EXPECT_EQ(unwrap_err(scratch), "--scratch-dir requires a value");
}

TEST_F(ConfigTest, UnknownOption) {
    auto result = parse({"diff", "--frobnicate"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "Unknown option: --frobnicate");
}

TEST_F(ConfigTest, LogOptionsAreNotPositional) {
    auto result = parse({"--log-level=debug", "surface", "-v", "ExamplePkg", "--log-format=json"});
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_EQ(config.command, "surface");
    EXPECT_EQ(config.positional, std::vector<std::string>{"ExamplePkg"});
    EXPECT_EQ(config.log.format, apidiff::log::LogFormat::JSON);
}

TEST_F(ConfigTest, Help) {
    auto result = parse({"-h"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).help);
}
