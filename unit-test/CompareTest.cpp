#include "gtest/gtest.h"
#include "judge/compare.hpp"

using namespace std;
using namespace codegrade;

TEST(CompareTest, TrimsOnlyTheEnds) {
    EXPECT_EQ(trim_output("  \n42\n\n"), "42");
    EXPECT_EQ(trim_output("\t1 2 3 \r\n"), "1 2 3");
    EXPECT_EQ(trim_output("a\n\nb"), "a\n\nb");
    EXPECT_EQ(trim_output(" \n\t"), "");
}

TEST(CompareTest, TrailingNewlineDoesNotMatter) {
    EXPECT_TRUE(outputs_match("5\n", "5"));
    EXPECT_TRUE(outputs_match("5", "  5  \n"));
    EXPECT_TRUE(outputs_match("", "\n"));
}

TEST(CompareTest, InnerWhitespaceMatters) {
    EXPECT_FALSE(outputs_match("1  2", "1 2"));
    EXPECT_FALSE(outputs_match("1\n2", "1 2"));
}

TEST(CompareTest, ComparisonIsCaseSensitive) {
    EXPECT_FALSE(outputs_match("Hello", "hello"));
    EXPECT_TRUE(outputs_match("Hello", "Hello"));
}
