#ifndef EMACROSSWATCH_POLLSCHEDULER_H
#define EMACROSSWATCH_POLLSCHEDULER_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "alerts/AlertThrottle.h"
#include "common/Types.h"
#include "config/Config.h"
#include "logs/AlertLogger.h"
#include "market_data/MarketDataProvider.h"
#include "notify/Notifier.h"
#include "signals/CrossoverDetector.h"

using namespace std::chrono_literals;

enum class SymbolOutcome {
  InsufficientData,
  NoCrossover,
  Alerted,
  Throttled,
  FetchFailed,
  DispatchFailed
};

std::string_view ToString(SymbolOutcome outcome);

struct SymbolReport {
  SymbolConfig symbol;
  SymbolOutcome outcome = SymbolOutcome::NoCrossover;
  CrossoverResult crossover;
};

struct CycleReport {
  std::vector<SymbolReport> symbols;

  [[nodiscard]] std::size_t count(SymbolOutcome outcome) const;
};

// Polls every configured symbol once per poll_interval. A failure on one
// symbol is logged and never stops the rest of the cycle.
class PollScheduler {
 public:
  PollScheduler(const Config& config, MarketDataProviders& providers,
                INotifier& notifier, AlertLogger& alert_logger);

  CycleReport runCycle(TimePoint now);
  void run(const std::atomic<bool>& stop_requested);

  [[nodiscard]] const AlertThrottle& getThrottle() const;

  static std::string SymbolKey(const SymbolConfig& symbol);

 private:
  SymbolReport processSymbol(const SymbolConfig& symbol, TimePoint now);
  SymbolReport evaluateSymbol(const SymbolConfig& symbol, TimePoint now);
  SymbolOutcome dispatchAlert(const SymbolConfig& symbol,
                              const CrossoverResult& crossover,
                              TimePoint now);

  Config config_;
  CrossoverDetector detector_;
  AlertThrottle throttle_;
  MarketDataProviders& providers_;
  INotifier& notifier_;
  AlertLogger& alert_logger_;
};

#endif  // EMACROSSWATCH_POLLSCHEDULER_H
