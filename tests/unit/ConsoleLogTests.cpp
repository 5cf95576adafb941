#include <gtest/gtest.h>

#include <chrono>

#include "logs/ConsoleLog.h"

namespace {

TimePoint MakeTime() {
  using namespace std::chrono;
  return sys_days{2024y / May / 1} + 12h + 3min + 4s + 900ms;
}

}  // namespace

TEST(ConsoleLogTest, FormatLogPrefix_Levels) {
  EXPECT_EQ(FormatLogPrefix(LogLevel::Info, MakeTime()),
            "[2024-05-01 12:03:04] [INFO] ");
  EXPECT_EQ(FormatLogPrefix(LogLevel::Warn, MakeTime()),
            "[2024-05-01 12:03:04] [WARN] ");
  EXPECT_EQ(FormatLogPrefix(LogLevel::Error, MakeTime()),
            "[2024-05-01 12:03:04] [ERROR] ");
}

TEST(ConsoleLogTest, LogInfo_WritesPrefixedLineToStdout) {
  ::testing::internal::CaptureStdout();
  LogInfo("{} | EMA({}): {:.2f}", "BTC/USD", 9, 43251.174);
  const std::string output = ::testing::internal::GetCapturedStdout();

  EXPECT_NE(output.find("[INFO] BTC/USD | EMA(9): 43251.17\n"),
            std::string::npos);
}

TEST(ConsoleLogTest, LogError_WritesToStderr) {
  ::testing::internal::CaptureStderr();
  LogError("Fetch failed for {}: {}", "SOL/USD", "HTTP 500");
  const std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_NE(output.find("[ERROR] Fetch failed for SOL/USD: HTTP 500"),
            std::string::npos);
}
