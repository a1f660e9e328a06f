#include "Logger.hpp"
#include <gtest/gtest.h>
#include <string>

TEST(Logger, EveryLevelGoesToStdout)
{
    Logger::Level saved = Logger::level();
    Logger::setLevel(Logger::DEBUG);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::debug("first");
    Logger::warn("track 3 speed sample discarded");
    Logger::error("invalid calibration: zero span");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();
    Logger::setLevel(saved);

    EXPECT_NE(out.find("[DEBUG] first"), std::string::npos);
    EXPECT_NE(out.find("[WARN] track 3 speed sample discarded"), std::string::npos);
    EXPECT_NE(out.find("[ERROR] invalid calibration: zero span"), std::string::npos);
    EXPECT_TRUE(err.empty());
}

TEST(Logger, BelowMinimumLevelIsSilent)
{
    Logger::Level saved = Logger::level();
    Logger::setLevel(Logger::WARNING);

    testing::internal::CaptureStdout();
    Logger::info("hidden");
    std::string out = testing::internal::GetCapturedStdout();
    Logger::setLevel(saved);

    EXPECT_TRUE(out.empty());
}
