#ifndef EMACROSSWATCH_ALERTLOGGER_H
#define EMACROSSWATCH_ALERTLOGGER_H

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "common/Types.h"
#include "config/Config.h"
#include "notify/Notifier.h"

namespace fs = std::filesystem;

// CSV record of every dispatch attempt. An empty alerts_log_path disables
// the log; writeAlert() is then a no-op.
class AlertLogger {
 public:
  explicit AlertLogger(const Config& config);
  std::optional<std::string> writeAlert(const Alert& alert, bool delivered,
                                        const std::string& error_text);

  [[nodiscard]] bool isEnabled() const;

 private:
  std::optional<std::string> openFile();

  fs::path file_path_;
  std::ofstream file_;
  std::mutex mutex_;
};

#endif  // EMACROSSWATCH_ALERTLOGGER_H
