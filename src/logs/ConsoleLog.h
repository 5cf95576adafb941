#ifndef EMACROSSWATCH_CONSOLELOG_H
#define EMACROSSWATCH_CONSOLELOG_H

#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "common/Types.h"

enum class LogLevel { Info, Warn, Error };

// "[2024-05-01 12:00:00] [WARN] "
std::string FormatLogPrefix(LogLevel level, TimePoint now);

// Info goes to stdout, warnings and errors to stderr. Lines from
// concurrent fetch workers are not interleaved.
void WriteLogLine(LogLevel level, std::string_view message);

template <typename... Args>
void LogInfo(std::format_string<Args...> fmt, Args&&... args) {
  WriteLogLine(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void LogWarn(std::format_string<Args...> fmt, Args&&... args) {
  WriteLogLine(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void LogError(std::format_string<Args...> fmt, Args&&... args) {
  WriteLogLine(LogLevel::Error,
               std::format(fmt, std::forward<Args>(args)...));
}

#endif  // EMACROSSWATCH_CONSOLELOG_H
