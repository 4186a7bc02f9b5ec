#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(rbp::NormalizeArchivePath("./manifest.json"), "manifest.json");
    EXPECT_EQ(rbp::NormalizeArchivePath("/lib//linux-x86_64///libplugin.so"),
              "lib/linux-x86_64/libplugin.so");
    EXPECT_EQ(rbp::NormalizeArchivePath("././lib/a.so"), "lib/a.so");
    EXPECT_EQ(rbp::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, IsSafeRelativePath) {
    EXPECT_TRUE(rbp::IsSafeRelativePath("lib/linux-x86_64/release/libplugin.so"));
    EXPECT_TRUE(rbp::IsSafeRelativePath("manifest.json"));
    EXPECT_TRUE(rbp::IsSafeRelativePath("a..b/c"));
    EXPECT_FALSE(rbp::IsSafeRelativePath(""));
    EXPECT_FALSE(rbp::IsSafeRelativePath("/etc/passwd"));
    EXPECT_FALSE(rbp::IsSafeRelativePath("../outside.so"));
    EXPECT_FALSE(rbp::IsSafeRelativePath("lib/../../outside.so"));
    EXPECT_FALSE(rbp::IsSafeRelativePath("lib/.."));
    EXPECT_FALSE(rbp::IsSafeRelativePath("lib\\win.dll"));
}

TEST(PathUtilsTest, FileNameOf) {
    EXPECT_EQ(rbp::FileNameOf("lib/linux-x86_64/libplugin.so"), "libplugin.so");
    EXPECT_EQ(rbp::FileNameOf("libplugin.so"), "libplugin.so");
    EXPECT_EQ(rbp::FileNameOf("lib/"), "");
}
