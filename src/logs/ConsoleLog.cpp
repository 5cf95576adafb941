#include "ConsoleLog.h"

#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>

namespace {

std::mutex g_output_mutex;

std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

}  // namespace

std::string FormatLogPrefix(LogLevel level, TimePoint now) {
  return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] ",
                     std::chrono::floor<std::chrono::seconds>(now),
                     LevelName(level));
}

void WriteLogLine(LogLevel level, std::string_view message) {
  const std::string prefix = FormatLogPrefix(level, Clock::now());
  std::lock_guard lock(g_output_mutex);
  std::println(level == LogLevel::Info ? stdout : stderr, "{}{}", prefix,
               message);
}
