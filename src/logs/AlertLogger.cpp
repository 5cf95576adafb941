#include "AlertLogger.h"

#include <chrono>
#include <format>
#include <stdexcept>

namespace {

// Error texts come from transports and may contain commas or quotes.
std::string QuoteCsv(const std::string& text) {
  if (text.find_first_of(",\"\n") == std::string::npos) {
    return text;
  }
  std::string quoted = "\"";
  for (const char c : text) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

AlertLogger::AlertLogger(const Config& config)
    : file_path_(config.alerts_log_path) {
  if (file_path_.empty()) {
    return;
  }
  auto error = openFile();
  if (error) {
    throw std::runtime_error(error.value());
  }
}

bool AlertLogger::isEnabled() const { return !file_path_.empty(); }

std::optional<std::string> AlertLogger::writeAlert(
    const Alert& alert, bool delivered, const std::string& error_text) {
  if (!isEnabled()) {
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);
  file_ << std::format("{:%Y-%m-%d %H:%M:%S},{},{},{},{},{:.6f},{:.6f},{},{}",
                       std::chrono::floor<std::chrono::seconds>(alert.time),
                       ToString(alert.symbol.provider), alert.symbol.code,
                       alert.symbol.label, ToString(alert.direction),
                       alert.fast_ema, alert.slow_ema,
                       delivered ? "yes" : "no", QuoteCsv(error_text))
        << std::endl;

  if (file_.fail()) {
    return std::format("AlertLogger: file write error");
  }

  return std::nullopt;
}

std::optional<std::string> AlertLogger::openFile() {
  std::error_code ec;
  if (file_path_.has_parent_path()) {
    fs::create_directories(file_path_.parent_path(), ec);
  }

  if (ec) {
    return std::format("AlertLogger: error on folder creation for path: {}",
                       file_path_.string());
  }

  file_.open(file_path_);

  if (!file_) {
    return std::format("AlertLogger: error on file open for path: {}",
                       file_path_.string());
  }

  file_ << std::format("{},{},{},{},{},{},{},{},{}\n", "Time", "Provider",
                       "Symbol", "Label", "Direction", "FastEma", "SlowEma",
                       "Delivered", "Error");

  if (file_.fail()) {
    return std::format("AlertLogger: file write error");
  }

  return std::nullopt;
}
