//! # Target Framework Priority Tests

#include "package/tfm.hpp"

#include <gtest/gtest.h>

using namespace apidiff::package;

TEST(TfmPriorityTest, ModernNetTable) {
    EXPECT_EQ(tfm_priority("net10.0"), 110);
    EXPECT_EQ(tfm_priority("net9.0"), 105);
    EXPECT_EQ(tfm_priority("net8.0"), 100);
    EXPECT_EQ(tfm_priority("net5.0"), 85);
}

TEST(TfmPriorityTest, CoreAndStandard) {
    EXPECT_EQ(tfm_priority("netcoreapp3.1"), 77);
    EXPECT_EQ(tfm_priority("netstandard2.1"), 70);
    EXPECT_EQ(tfm_priority("netstandard2.0"), 60);
    EXPECT_EQ(tfm_priority("netstandard1.6"), 46);
}

TEST(TfmPriorityTest, Framework) {
    EXPECT_EQ(tfm_priority("net48"), 58);
    EXPECT_EQ(tfm_priority("net45"), 55);
    EXPECT_LT(tfm_priority("net35"), 40);
    EXPECT_GT(tfm_priority("net35"), 0);
}

TEST(TfmPriorityTest, OrderingMatchesPreference) {
    EXPECT_GT(tfm_priority("net8.0"), tfm_priority("netstandard2.1"));
    EXPECT_GT(tfm_priority("netstandard2.0"), tfm_priority("net45"));
    EXPECT_GT(tfm_priority("net48"), tfm_priority("netstandard1.6"));
    EXPECT_GT(tfm_priority("netcoreapp3.1"), tfm_priority("netstandard2.1"));
}

TEST(TfmPriorityTest, IgnoresCaseAndPlatformSuffix) {
    EXPECT_EQ(tfm_priority("NET8.0"), 100);
    EXPECT_EQ(tfm_priority("net8.0-windows10.0.19041"), 100);
    EXPECT_EQ(tfm_priority("net6.0-android"), tfm_priority("net6.0"));
}

TEST(TfmPriorityTest, UnknownFolders) {
    EXPECT_EQ(tfm_priority("portable-net45+win8"), 0);
    EXPECT_EQ(tfm_priority("uap10.0"), 0);
    EXPECT_EQ(tfm_priority("netmf"), 1);
}
