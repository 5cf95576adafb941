#include "Notifier.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace {

std::string DirectionLabel(CrossoverEvent direction) {
  std::string label(ToString(direction));
  std::ranges::transform(label, label.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return label;
}

}  // namespace

std::string FormatAlertSubject(const Alert& alert) {
  return std::format("{} EMA Crossover Alert - {}", alert.symbol.label,
                     DirectionLabel(alert.direction));
}

std::string FormatAlertBody(const Alert& alert) {
  return std::format("{} EMA({}) has crossed {} EMA({})", alert.symbol.label,
                     alert.fast_period,
                     alert.direction == CrossoverEvent::Bullish ? "above"
                                                                : "below",
                     alert.slow_period);
}

std::string FormatAlertText(const Alert& alert) {
  const auto time = std::chrono::floor<std::chrono::seconds>(alert.time);

  return std::format(
      "{}\n{}\n\nSignal: {}\nEMA({}): {:.2f}\nEMA({}): {:.2f}\n"
      "Timeframe: {}\nTime: {:%Y-%m-%d %H:%M:%S} UTC",
      FormatAlertSubject(alert), FormatAlertBody(alert),
      DirectionLabel(alert.direction), alert.fast_period, alert.fast_ema,
      alert.slow_period, alert.slow_ema, alert.timeframe, time);
}
