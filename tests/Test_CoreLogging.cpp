#include <gtest/gtest.h>
#include <string>

import Core.Logging;

using namespace Core;

namespace
{
    // Restores the process-wide threshold after each test.
    class CoreLogging : public ::testing::Test
    {
    protected:
        void SetUp() override { m_Saved = Log::GetLevel(); }
        void TearDown() override { Log::SetLevel(m_Saved); }

    private:
        Log::Level m_Saved = Log::Level::Info;
    };
}

TEST(CoreLoggingLevels, IsEnabledFollowsSeverity)
{
    static_assert(Log::IsEnabled(Log::Level::Error, Log::Level::Info));
    static_assert(Log::IsEnabled(Log::Level::Info, Log::Level::Info));
    static_assert(!Log::IsEnabled(Log::Level::Debug, Log::Level::Info));
    static_assert(!Log::IsEnabled(Log::Level::Warning, Log::Level::Error));
    SUCCEED();
}

TEST_F(CoreLogging, DefaultLevelIsInfo)
{
    EXPECT_EQ(Log::GetLevel(), Log::Level::Info);
}

TEST_F(CoreLogging, InfoIsFormattedAndLabelled)
{
    Log::SetLevel(Log::Level::Info);

    ::testing::internal::CaptureStdout();
    Log::Info("offsets {} + {} = {}", 1, 2, 3);
    const std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find("offsets 1 + 2 = 3"), std::string::npos);
}

TEST_F(CoreLogging, MessagesBelowThresholdAreDropped)
{
    Log::SetLevel(Log::Level::Error);

    ::testing::internal::CaptureStdout();
    Log::Info("hidden info");
    Log::Warn("hidden warning");
    Log::Error("visible error {}", 7);
    const std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("[ERR]"), std::string::npos);
    EXPECT_NE(output.find("visible error 7"), std::string::npos);
}

TEST_F(CoreLogging, WarnAtInfoLevel)
{
    Log::SetLevel(Log::Level::Info);

    ::testing::internal::CaptureStdout();
    Log::Warn("careful");
    const std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[WARN]"), std::string::npos);
    EXPECT_NE(output.find("careful"), std::string::npos);
}
