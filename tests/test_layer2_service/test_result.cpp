/**
 * @file test_result.cpp
 * @brief Layer 2 tests for Result<T, E>.
 */
#include "utils/result.hpp"
#include <gtest/gtest.h>

#include <string>

using irbridge::Result;

namespace
{
enum class TestError
{
    None,
    Timeout,
    Refused
};

using TestResult = Result<std::string, TestError>;
} // namespace

TEST(ResultTest, OkHoldsContent)
{
    auto r = TestResult::ok("hello");
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), "hello");
}

TEST(ResultTest, ErrorHoldsEnumAndCode)
{
    auto r = TestResult::error(TestError::Refused, 111);
    EXPECT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TestError::Refused);
    EXPECT_EQ(r.error_code(), 111);
}

TEST(ResultTest, ErrorCodeDefaultsToZero)
{
    auto r = TestResult::error(TestError::Timeout);
    EXPECT_EQ(r.error_code(), 0);
}

TEST(ResultTest, DefaultConstructedIsError)
{
    TestResult r;
    EXPECT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TestError::None);
}

TEST(ResultTest, ContentOnErrorThrows)
{
    auto r = TestResult::error(TestError::Timeout);
    EXPECT_THROW(static_cast<void>(r.content()), std::logic_error);
}

TEST(ResultTest, ErrorOnSuccessThrows)
{
    auto r = TestResult::ok("x");
    EXPECT_THROW(static_cast<void>(r.error()), std::logic_error);
    EXPECT_THROW(static_cast<void>(r.error_code()), std::logic_error);
}

TEST(ResultTest, MoveKeepsState)
{
    auto r = TestResult::ok("moved");
    TestResult other = std::move(r);
    ASSERT_TRUE(other.is_ok());
    EXPECT_EQ(std::move(other).content(), "moved");
}
