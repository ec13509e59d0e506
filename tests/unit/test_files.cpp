#include <gtest/gtest.h>
#include "util/files.hpp"
#include "TempProject.hpp"

using namespace pc::util;

TEST(FilesTest, Trim) {
    EXPECT_EQ(trim("  src/a.rs\t\r\n"), "src/a.rs");
    EXPECT_EQ(trim(" \t "), "");
}

TEST(FilesTest, EndsWith) {
    EXPECT_TRUE(endsWith("src/a.blp", ".blp"));
    EXPECT_FALSE(endsWith("src/a.blp.in", ".blp"));
    EXPECT_FALSE(endsWith("src/a.blp", ""));
}

TEST(FilesTest, LooksBinary) {
    EXPECT_FALSE(looksBinary("plain text\n"));
    EXPECT_TRUE(looksBinary(std::string_view("ab\0cd", 5)));
}

TEST(FilesTest, RandomSuffixLength) {
    EXPECT_EQ(generateRandomSuffix(12).size(), 12u);
    EXPECT_NE(generateRandomSuffix(), generateRandomSuffix());
}

TEST(FilesTest, ReadFileToString) {
    TempProject p;
    p.write("a.txt", "line 1\nline 2\n");
    EXPECT_EQ(readFileToString(p.root() / "a.txt"), "line 1\nline 2\n");
    EXPECT_THROW(readFileToString(p.root() / "missing.txt"), std::runtime_error);
}
