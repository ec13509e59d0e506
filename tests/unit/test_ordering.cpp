#include <gtest/gtest.h>
#include "check/ordering.hpp"

using namespace pc::check;

TEST(OrderingTest, AscendingListPasses) {
    EXPECT_FALSE(firstOrderViolation({"src/a.rs", "src/b.rs", "src/c.ui"}).has_value());
}

TEST(OrderingTest, EmptyAndSingleEntryPass) {
    EXPECT_FALSE(firstOrderViolation({}).has_value());
    EXPECT_FALSE(firstOrderViolation({"src/a.rs"}).has_value());
}

TEST(OrderingTest, TransposedPairIsNamed) {
    const auto v = firstOrderViolation({"src/a.rs", "src/c.rs", "src/b.rs", "src/d.rs"});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->index, 1u);
    EXPECT_EQ(v->found, "src/c.rs");
    EXPECT_EQ(v->expected, "src/b.rs");
}

TEST(OrderingTest, OnlyFirstMismatchIsReported) {
    const auto v = firstOrderViolation({"src/b.rs", "src/a.rs", "src/d.rs", "src/c.rs"});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->index, 0u);
    EXPECT_EQ(v->found, "src/b.rs");
    EXPECT_EQ(v->expected, "src/a.rs");
}

TEST(OrderingTest, ComparisonIsByteWise) {
    // 'Z' (0x5a) sorts before 'a' (0x61), '-' before '/'
    EXPECT_FALSE(firstOrderViolation({"src/Zeta.rs", "src/alpha.rs"}).has_value());
    EXPECT_FALSE(firstOrderViolation({"src/a-b.rs", "src/a/b.rs"}).has_value());
    EXPECT_TRUE(firstOrderViolation({"src/alpha.rs", "src/Zeta.rs"}).has_value());
}

TEST(OrderingTest, DuplicatesAreInOrder) {
    EXPECT_FALSE(firstOrderViolation({"src/a.rs", "src/a.rs", "src/b.rs"}).has_value());
}

TEST(OrderingTest, SortedByteWiseIsStable) {
    EXPECT_EQ(sortedByteWise({"b", "a", "b", "A"}), (std::vector<std::string>{"A", "a", "b", "b"}));
}
