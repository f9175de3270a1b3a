#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, SanitizeFileNameStripsDirectories) {
    EXPECT_EQ(forge::SanitizeFileName("main.c"), "main.c");
    EXPECT_EQ(forge::SanitizeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(forge::SanitizeFileName("/abs/path/app.cpp"), "app.cpp");
    EXPECT_EQ(forge::SanitizeFileName("dir\\win.h"), "win.h");
    EXPECT_EQ(forge::SanitizeFileName("src/"), "src");
}

TEST(PathUtilsTest, SanitizeFileNameFallsBack) {
    EXPECT_EQ(forge::SanitizeFileName(""), "main.c");
    EXPECT_EQ(forge::SanitizeFileName(".."), "main.c");
    EXPECT_EQ(forge::SanitizeFileName("a/.."), "main.c");
    EXPECT_EQ(forge::SanitizeFileName("///"), "main.c");
    EXPECT_EQ(forge::SanitizeFileName(".", "x"), "x");
}

TEST(PathUtilsTest, HeaderDetection) {
    EXPECT_TRUE(forge::IsHeaderFile("config.h"));
    EXPECT_TRUE(forge::IsHeaderFile("driver.hpp"));
    EXPECT_FALSE(forge::IsHeaderFile("main.c"));
    EXPECT_FALSE(forge::IsHeaderFile("h"));
    EXPECT_FALSE(forge::IsHeaderFile("notes.hh.txt"));
}
