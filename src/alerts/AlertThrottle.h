#ifndef EMACROSSWATCH_ALERTTHROTTLE_H
#define EMACROSSWATCH_ALERTTHROTTLE_H

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common/Types.h"

// Per-symbol last-alert timestamps. An alert is allowed when the symbol has
// none recorded or strictly more than `interval` has elapsed since it.
// Callers record only after the notification was delivered.
class AlertThrottle {
 public:
  explicit AlertThrottle(std::chrono::nanoseconds interval);

  [[nodiscard]] bool isAllowed(const std::string& symbol_key,
                               TimePoint now) const;
  void recordAlert(const std::string& symbol_key, TimePoint now);

  [[nodiscard]] std::optional<TimePoint> getLastAlert(
      const std::string& symbol_key) const;
  [[nodiscard]] std::chrono::nanoseconds getInterval() const;

 private:
  std::chrono::nanoseconds interval_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, TimePoint> last_alert_;
};

#endif  // EMACROSSWATCH_ALERTTHROTTLE_H
