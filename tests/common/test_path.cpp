/**
 * @file test_path.cpp
 * @brief Path normalization and containment tests
 */

#include "reposlice/common.hpp"

#include <gtest/gtest.h>

using namespace reposlice::common;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(normalize_path("/home/user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/project/"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/../user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/./project"), "/home/user/project");
}

TEST(PathNormalization, Backslashes)
{
    EXPECT_EQ(normalize_path("src\\main.cpp"), "src/main.cpp");
}

TEST(PathNormalization, DotDot)
{
    EXPECT_EQ(normalize_path("a/b/../c"), "a/c");
    EXPECT_EQ(normalize_path("a/b/c/../../d"), "a/d");
    EXPECT_EQ(normalize_path("../a/b"), "../a/b");
    EXPECT_EQ(normalize_path("/../a"), "/a");
}

TEST(PathNormalization, Dot)
{
    EXPECT_EQ(normalize_path("./a/b"), "a/b");
    EXPECT_EQ(normalize_path("a/./b"), "a/b");
    EXPECT_EQ(normalize_path("a/b/."), "a/b");
}

TEST(PathNormalization, Empty)
{
    EXPECT_EQ(normalize_path(""), ".");
}

TEST(PathNormalization, RelativeToRoot)
{
    EXPECT_EQ(normalize_path("/home/user/project/src/main.cpp", "/home/user/project"), "src/main.cpp");
    EXPECT_EQ(normalize_path("/home/user/project", "/home/user/project"), ".");
}

TEST(PathNormalization, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/home/user"));
    EXPECT_TRUE(is_absolute_path("C:/Users"));
    EXPECT_FALSE(is_absolute_path("relative/path"));
    EXPECT_FALSE(is_absolute_path("./relative"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(PathContainment, IsWithin)
{
    EXPECT_TRUE(is_within("/proj/src/a.c", "/proj"));
    EXPECT_TRUE(is_within("/proj", "/proj/"));
    EXPECT_TRUE(is_within("/proj/x/../a.c", "/proj"));
    EXPECT_FALSE(is_within("/project/a.c", "/proj"));
    EXPECT_FALSE(is_within("/proj/../other/a.c", "/proj"));
    EXPECT_TRUE(is_within("/anything", "/"));
}

TEST(TextHelpers, Trim)
{
    EXPECT_EQ(trim("  foo \t\n"), "foo");
    EXPECT_EQ(trim("foo"), "foo");
    EXPECT_EQ(trim(" \r\n "), "");
    EXPECT_EQ(trim(""), "");
}
