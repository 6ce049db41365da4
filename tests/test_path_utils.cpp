#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, TrimTrailingSlash) {
    EXPECT_EQ(uisync::TrimTrailingSlash("source/"), "source");
    EXPECT_EQ(uisync::TrimTrailingSlash("source//"), "source");
    EXPECT_EQ(uisync::TrimTrailingSlash("source"), "source");
    EXPECT_EQ(uisync::TrimTrailingSlash("/"), "/");
}

TEST(PathUtilsTest, JoinPath) {
    EXPECT_EQ(uisync::JoinPath("a", "b"), "a/b");
    EXPECT_EQ(uisync::JoinPath("a/", "b"), "a/b");
    EXPECT_EQ(uisync::JoinPath("", "b"), "b");
    EXPECT_EQ(uisync::JoinPath("a", ""), "a");
}

TEST(PathUtilsTest, IsSafePathComponent) {
    EXPECT_TRUE(uisync::IsSafePathComponent("Header"));
    EXPECT_TRUE(uisync::IsSafePathComponent("My Element.v2"));
    EXPECT_FALSE(uisync::IsSafePathComponent(""));
    EXPECT_FALSE(uisync::IsSafePathComponent("."));
    EXPECT_FALSE(uisync::IsSafePathComponent(".."));
    EXPECT_FALSE(uisync::IsSafePathComponent("a/b"));
    EXPECT_FALSE(uisync::IsSafePathComponent(std::string("a\0b", 3)));
}

TEST(PathUtilsTest, NormalizeRelativePathCleansInput) {
    EXPECT_EQ(uisync::NormalizeRelativePath("./Old/Tab/A.js"), "Old/Tab/A.js");
    EXPECT_EQ(uisync::NormalizeRelativePath("Old//Tab///A.js"), "Old/Tab/A.js");
    EXPECT_EQ(uisync::NormalizeRelativePath(""), "");
}
