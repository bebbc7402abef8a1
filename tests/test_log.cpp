#include <gtest/gtest.h>

#include <string>

#include "log.hpp"

using namespace orbitwatch;

namespace {

class LogLevelGuard {
public:
    LogLevelGuard() : m_saved(GetLogLevel()) {}
    ~LogLevelGuard() { SetLogLevel(m_saved); }

private:
    LogLevel m_saved;
};

} // namespace

TEST(Log, WarningsGoToStderr) {
    LogLevelGuard guard;
    SetLogLevel(LogLevel::Info);

    ::testing::internal::CaptureStderr();
    ORBITWATCH_LOG_WARN("collision ahead");
    const std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[WARN] collision ahead"), std::string::npos);
}

TEST(Log, MessagesBelowTheLevelAreDropped) {
    LogLevelGuard guard;
    SetLogLevel(LogLevel::Error);

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    ORBITWATCH_LOG_INFO("quiet");
    ORBITWATCH_LOG_WARN("quiet");
    const std::string out = ::testing::internal::GetCapturedStdout();
    const std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(err.empty());
}

TEST(Log, OffSilencesEverything) {
    LogLevelGuard guard;
    SetLogLevel(LogLevel::Off);
    EXPECT_EQ(GetLogLevel(), LogLevel::Off);

    ::testing::internal::CaptureStderr();
    ORBITWATCH_LOG_ERROR("nothing");
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
    EXPECT_STREQ(ToString(LogLevel::Debug), "DEBUG");
}
