#include "PollScheduler.h"

#include <algorithm>
#include <exception>
#include <format>
#include <optional>
#include <thread>

#include "logs/ConsoleLog.h"

namespace {

constexpr auto kSleepSlice = 250ms;

std::string FormatEma(std::optional<Price> value, int precision) {
  if (!value) {
    return "N/A";
  }
  return std::format("{:.{}f}", *value, precision);
}

}  // namespace

std::string_view ToString(SymbolOutcome outcome) {
  switch (outcome) {
    case SymbolOutcome::InsufficientData:
      return "insufficient data";
    case SymbolOutcome::NoCrossover:
      return "no crossover";
    case SymbolOutcome::Alerted:
      return "alerted";
    case SymbolOutcome::Throttled:
      return "throttled";
    case SymbolOutcome::FetchFailed:
      return "fetch failed";
    case SymbolOutcome::DispatchFailed:
      return "dispatch failed";
  }
  return "unknown";
}

std::size_t CycleReport::count(SymbolOutcome outcome) const {
  return static_cast<std::size_t>(
      std::ranges::count_if(symbols, [outcome](const SymbolReport& report) {
        return report.outcome == outcome;
      }));
}

PollScheduler::PollScheduler(const Config& config,
                             MarketDataProviders& providers,
                             INotifier& notifier, AlertLogger& alert_logger)
    : config_(config),
      detector_(config.fast_period, config.slow_period),
      throttle_(config.poll_interval),
      providers_(providers),
      notifier_(notifier),
      alert_logger_(alert_logger) {}

std::string PollScheduler::SymbolKey(const SymbolConfig& symbol) {
  return std::format("{}:{}", ToString(symbol.provider), symbol.code);
}

const AlertThrottle& PollScheduler::getThrottle() const { return throttle_; }

CycleReport PollScheduler::runCycle(TimePoint now) {
  CycleReport report;
  report.symbols.resize(config_.symbols.size());

  const std::size_t workers = std::min<std::size_t>(
      config_.fetch_workers, config_.symbols.size());

  if (workers <= 1) {
    for (std::size_t i = 0; i < config_.symbols.size(); ++i) {
      report.symbols[i] = processSymbol(config_.symbols[i], now);
    }
    return report;
  }

  // Each symbol is claimed by exactly one worker, so its throttle check and
  // record never race with another alert for the same symbol.
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= config_.symbols.size()) return;
      report.symbols[idx] = processSymbol(config_.symbols[idx], now);
    }
  };

  std::vector<std::jthread> threads;
  threads.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    threads.emplace_back(worker);
  }
  threads.clear();

  return report;
}

void PollScheduler::run(const std::atomic<bool>& stop_requested) {
  while (!stop_requested) {
    const auto cycle_start = std::chrono::steady_clock::now();
    const auto report = runCycle(Clock::now());

    LogInfo("Cycle done: {} alerted, {} throttled, {} insufficient data, "
            "{} fetch failed, {} dispatch failed",
            report.count(SymbolOutcome::Alerted),
            report.count(SymbolOutcome::Throttled),
            report.count(SymbolOutcome::InsufficientData),
            report.count(SymbolOutcome::FetchFailed),
            report.count(SymbolOutcome::DispatchFailed));

    const auto next_cycle = cycle_start + config_.poll_interval;
    LogInfo("Waiting {} before next multi-symbol scan...",
            std::chrono::duration_cast<std::chrono::seconds>(
                next_cycle - std::chrono::steady_clock::now()));

    while (!stop_requested) {
      const auto remaining = next_cycle - std::chrono::steady_clock::now();
      if (remaining <= 0ns) break;
      std::this_thread::sleep_for(
          std::min<std::chrono::steady_clock::duration>(remaining,
                                                        kSleepSlice));
    }
  }
}

SymbolReport PollScheduler::processSymbol(const SymbolConfig& symbol,
                                          TimePoint now) {
  try {
    return evaluateSymbol(symbol, now);
  } catch (const std::exception& e) {
    LogError("Unexpected error for {} ({} on {}): {}", symbol.label,
             symbol.code, ToString(symbol.provider), e.what());
    return {.symbol = symbol, .outcome = SymbolOutcome::FetchFailed};
  }
}

SymbolReport PollScheduler::evaluateSymbol(const SymbolConfig& symbol,
                                           TimePoint now) {
  SymbolReport report{.symbol = symbol};

  LogInfo("Fetching data for {} ({} on {})...", symbol.label, symbol.code,
          ToString(symbol.provider));

  auto provider = providers_.find(symbol.provider);
  if (provider == providers_.end() || !provider->second) {
    LogError("No market data provider configured for {} ({})", symbol.label,
             ToString(symbol.provider));
    report.outcome = SymbolOutcome::FetchFailed;
    return report;
  }

  auto candles = provider->second->fetchCandles(
      symbol.code, config_.candle_interval, config_.candle_limit);
  if (!candles) {
    LogError("Fetch failed for {} ({} on {}): {}", symbol.label, symbol.code,
             ToString(symbol.provider), candles.error());
    report.outcome = SymbolOutcome::FetchFailed;
    return report;
  }

  const PriceSeries closes = ExtractCloses(*candles);
  report.crossover = detector_.detect(closes);
  const auto& crossover = report.crossover;

  LogInfo("EMA check {} | prev_fast={} prev_slow={} curr_fast={} "
          "curr_slow={} crossover={}",
          symbol.label, FormatEma(crossover.previous_fast_ema, 6),
          FormatEma(crossover.previous_slow_ema, 6),
          FormatEma(crossover.fast_ema, 6), FormatEma(crossover.slow_ema, 6),
          ToString(crossover.event));

  if (!crossover.fast_ema || !crossover.slow_ema) {
    report.outcome = SymbolOutcome::InsufficientData;
    LogInfo("{} | {} of {} candles needed, waiting for more data",
            symbol.label, closes.size(), detector_.getWindowSize());
  } else if (crossover.event == CrossoverEvent::None) {
    report.outcome = SymbolOutcome::NoCrossover;
  } else {
    report.outcome = dispatchAlert(symbol, crossover, now);
  }

  LogInfo("{} | EMA({}): {} | EMA({}): {}", symbol.label,
          config_.fast_period, FormatEma(crossover.fast_ema, 2),
          config_.slow_period, FormatEma(crossover.slow_ema, 2));

  return report;
}

SymbolOutcome PollScheduler::dispatchAlert(const SymbolConfig& symbol,
                                           const CrossoverResult& crossover,
                                           TimePoint now) {
  const std::string key = SymbolKey(symbol);

  if (!throttle_.isAllowed(key, now)) {
    LogInfo("{} {} crossover suppressed, last alert within {}", symbol.label,
            ToString(crossover.event),
            std::chrono::duration_cast<std::chrono::seconds>(
                throttle_.getInterval()));
    return SymbolOutcome::Throttled;
  }

  const Alert alert{.symbol = symbol,
                    .direction = crossover.event,
                    .fast_ema = *crossover.fast_ema,
                    .slow_ema = *crossover.slow_ema,
                    .fast_period = config_.fast_period,
                    .slow_period = config_.slow_period,
                    .timeframe = config_.candle_interval,
                    .time = now};

  auto sent = notifier_.send(alert);
  const std::string error_text = sent ? std::string() : sent.error();

  if (auto err =
          alert_logger_.writeAlert(alert, sent.has_value(), error_text)) {
    LogWarn("{}", *err);
  }

  if (!sent) {
    LogError("Dispatch failed for {} ({} on {}) {} alert: {}", symbol.label,
             symbol.code, ToString(symbol.provider), ToString(alert.direction),
             sent.error());
    return SymbolOutcome::DispatchFailed;
  }

  throttle_.recordAlert(key, now);
  LogInfo("Alert sent | {} | {} | EMA({}): {:.2f} | EMA({}): {:.2f}",
          symbol.label, ToString(alert.direction), config_.fast_period,
          alert.fast_ema, config_.slow_period, alert.slow_ema);
  return SymbolOutcome::Alerted;
}
