#ifndef EMACROSSWATCH_NOTIFIER_H
#define EMACROSSWATCH_NOTIFIER_H

#include <expected>
#include <string>

#include "common/Types.h"

struct Alert {
  SymbolConfig symbol;
  CrossoverEvent direction = CrossoverEvent::None;
  Price fast_ema = 0;
  Price slow_ema = 0;
  int fast_period = 0;
  int slow_period = 0;
  std::string timeframe;
  TimePoint time;
};

struct INotifier {
  virtual ~INotifier() = default;
  // Dispatch error on failure; the caller keeps the throttle window open.
  virtual std::expected<void, std::string> send(const Alert& alert) = 0;
};

// "<label> EMA Crossover Alert - BULLISH"
std::string FormatAlertSubject(const Alert& alert);
// "<label> EMA(9) has crossed above EMA(15)"
std::string FormatAlertBody(const Alert& alert);
std::string FormatAlertText(const Alert& alert);

#endif  // EMACROSSWATCH_NOTIFIER_H
