#include "AlertThrottle.h"

AlertThrottle::AlertThrottle(std::chrono::nanoseconds interval)
    : interval_(interval) {}

bool AlertThrottle::isAllowed(const std::string& symbol_key,
                              TimePoint now) const {
  std::lock_guard lock(mutex_);
  auto it = last_alert_.find(symbol_key);
  if (it == last_alert_.end()) {
    return true;
  }
  return now - it->second > interval_;
}

void AlertThrottle::recordAlert(const std::string& symbol_key, TimePoint now) {
  std::lock_guard lock(mutex_);
  last_alert_[symbol_key] = now;
}

std::optional<TimePoint> AlertThrottle::getLastAlert(
    const std::string& symbol_key) const {
  std::lock_guard lock(mutex_);
  auto it = last_alert_.find(symbol_key);
  if (it == last_alert_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::chrono::nanoseconds AlertThrottle::getInterval() const {
  return interval_;
}
