#include <gtest/gtest.h>
#include <cstdint>
#include <string_view>

import Core.Error;

using namespace Core;

TEST(CoreError, ErrorCodeToString)
{
    EXPECT_EQ(ErrorCodeToString(ErrorCode::Success), "Success");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::InvalidArgument), "InvalidArgument");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::OutOfRange), "OutOfRange");
    EXPECT_EQ(ErrorCodeToString(static_cast<ErrorCode>(12345)), "Unknown");
}

TEST(CoreError, CodesKeepTheirValues)
{
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::Success), 0u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::InvalidArgument), 300u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::OutOfRange), 303u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::Unknown), 999u);

    // Gaps in the validation range are not named codes
    EXPECT_EQ(ErrorCodeToString(static_cast<ErrorCode>(301)), "Unknown");
    EXPECT_EQ(ErrorCodeToString(static_cast<ErrorCode>(304)), "Unknown");
}

TEST(CoreError, OkHoldsValue)
{
    const int answer = 42;
    Expected<int> result = Ok(answer);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(CoreError, ErrHoldsCode)
{
    Expected<int> result = Err<int>(ErrorCode::OutOfRange);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::OutOfRange);
}

TEST(CoreError, ValueOrFallsBack)
{
    EXPECT_EQ(Err<int>(ErrorCode::InvalidArgument).value_or(7), 7);
    EXPECT_EQ(Ok(3).value_or(7), 3);
}
