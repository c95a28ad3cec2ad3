#include <gtest/gtest.h>

#include "utils/Result.hpp"

using Utils::Result;

TEST(ResultTests, SuccessIsTruthyAndEmpty)
{
    const Result r = Result::success();
    EXPECT_TRUE(r);
    EXPECT_TRUE(r.errors.isEmpty());
    EXPECT_TRUE(r.errorString().isEmpty());
}

TEST(ResultTests, ErrorStringJoinsMessagesOnePerLine)
{
    const Result r = Result::failure(QStringList{"first", "second", "third"});
    EXPECT_FALSE(r);
    EXPECT_EQ(r.errorString(), "first\nsecond\nthird");
}

TEST(ResultTests, AddErrorFlipsState)
{
    Result r;
    r.addError("broken");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors, QStringList{"broken"});
}
