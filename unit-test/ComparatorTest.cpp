#include "gtest/gtest.h"
#include "grader/comparator.hpp"

using namespace std;
using namespace bayview;

TEST(ComparatorTest, NormalizeTest) {
    EXPECT_EQ(normalize_output("1 2\r\n3\n"), "123");
    EXPECT_EQ(normalize_output("a\tb"), "a\tb");
    EXPECT_EQ(normalize_output(" \r\n"), "");
}

TEST(ComparatorTest, AcceptedTest) {
    EXPECT_EQ(compare_output("Hello, World!", "Hello, World!\n"), status::ACCEPTED);
    EXPECT_EQ(compare_output("1 2\r\n", "1 2\n"), status::ACCEPTED);
    EXPECT_EQ(compare_output("3\n\n\n", "3"), status::ACCEPTED);
    EXPECT_EQ(compare_output("", "\n"), status::ACCEPTED);
}

TEST(ComparatorTest, CollapseIgnoresTokenBoundaryTest) {
    EXPECT_EQ(compare_output("1 2", "12"), status::ACCEPTED);
    EXPECT_EQ(compare_output("12", "1\n2"), status::ACCEPTED);
}

TEST(ComparatorTest, WrongAnswerTest) {
    EXPECT_EQ(compare_output("3", "4"), status::WRONG_ANSWER);
    EXPECT_EQ(compare_output("", "3"), status::WRONG_ANSWER);
    EXPECT_EQ(compare_output("hello", "Hello"), status::WRONG_ANSWER);
    // 制表符不会被删除
    EXPECT_EQ(compare_output("1\t2", "12"), status::WRONG_ANSWER);
}

TEST(ComparatorTest, TokensTest) {
    EXPECT_EQ(compare_output("1  2\r\n", "1 2", compare_mode::TOKENS), status::ACCEPTED);
    EXPECT_EQ(compare_output("1\t2\n", "1 2\n", compare_mode::TOKENS), status::ACCEPTED);
    EXPECT_EQ(compare_output("\n\n", "", compare_mode::TOKENS), status::ACCEPTED);
    EXPECT_EQ(compare_output("1 2", "12", compare_mode::TOKENS), status::WRONG_ANSWER);
    EXPECT_EQ(compare_output("1 2 3", "1 2", compare_mode::TOKENS), status::WRONG_ANSWER);
}
