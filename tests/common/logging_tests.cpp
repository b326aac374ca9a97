#include <gtest/gtest.h>
#include "stepdag/common/logging.hpp"
#include <sstream>

using namespace stepdag;

class LoggingTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_saved_level = log_level();
        set_log_stream(&m_stream);
    }

    void TearDown() override
    {
        set_log_stream(nullptr);
        set_log_level(m_saved_level);
    }

    std::ostringstream m_stream;
    LogLevel m_saved_level{LogLevel::Warning};
};

TEST_F(LoggingTests, LinesBelowLevel_AreDropped)
{
    set_log_level(LogLevel::Warning);
    STEPDAG_LOG_DEBUG("debug line");
    STEPDAG_LOG_INFO("info line");
    EXPECT_TRUE(m_stream.str().empty());
}

TEST_F(LoggingTests, LinesAtOrAboveLevel_AreTagged)
{
    set_log_level(LogLevel::Info);
    STEPDAG_LOG_INFO("uploading " << 2 << " artifacts");
    STEPDAG_LOG_ERROR("failed");
    EXPECT_EQ(m_stream.str(), "[INFO] uploading 2 artifacts\n[ERROR] failed\n");
}

TEST_F(LoggingTests, Off_DisablesEverything)
{
    set_log_level(LogLevel::Off);
    STEPDAG_LOG_ERROR("failed");
    EXPECT_TRUE(m_stream.str().empty());
}

TEST_F(LoggingTests, DisabledLine_DoesNotEvaluateExpression)
{
    set_log_level(LogLevel::Error);
    int evaluations = 0;
    auto count = [&evaluations]() {
        ++evaluations;
        return evaluations;
    };
    STEPDAG_LOG_DEBUG("value " << count());
    EXPECT_EQ(evaluations, 0);
}

TEST(LogLevelTests, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
