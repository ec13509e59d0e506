#include <gtest/gtest.h>
#include "check/PathCounter.hpp"

using namespace pc::check;

TEST(PathCounterTest, TakeCancelsOneOccurrence) {
    PathCounter c({"src/a.rs", "src/a.rs", "src/b.rs"});
    EXPECT_EQ(c.size(), 3u);
    EXPECT_TRUE(c.take("src/a.rs"));
    EXPECT_EQ(c.remaining(), (std::vector<std::string>{"src/a.rs", "src/b.rs"}));
    EXPECT_TRUE(c.take("src/a.rs"));
    EXPECT_FALSE(c.take("src/a.rs"));
    EXPECT_EQ(c.size(), 1u);
}

TEST(PathCounterTest, TakeUnknownPathFails) {
    PathCounter c;
    EXPECT_FALSE(c.take("src/missing.rs"));
    EXPECT_EQ(c.size(), 0u);
}

TEST(PathCounterTest, RemainingIsSortedWithMultiplicity) {
    PathCounter c;
    c.add("src/c.ui");
    c.add("src/a.rs");
    c.add("src/c.ui");
    EXPECT_EQ(c.remaining(), (std::vector<std::string>{"src/a.rs", "src/c.ui", "src/c.ui"}));
}
