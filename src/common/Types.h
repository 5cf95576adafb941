#ifndef EMACROSSWATCH_TYPES_H
#define EMACROSSWATCH_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using Price = double;
using TimestampMs = int64_t;
using PriceSeries = std::vector<Price>;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ProviderId { Binance, Bybit };

enum class CrossoverEvent { None, Bullish, Bearish };

struct Candle {
  TimestampMs timestamp;
  Price open;
  Price high;
  Price low;
  Price close;
};

struct SymbolConfig {
  ProviderId provider;
  std::string code;
  std::string label;
};

// Current EMA pair of the trailing window. Previous values are kept for
// status reporting only.
struct CrossoverResult {
  CrossoverEvent event = CrossoverEvent::None;
  std::optional<Price> fast_ema;
  std::optional<Price> slow_ema;
  std::optional<Price> previous_fast_ema;
  std::optional<Price> previous_slow_ema;
};

inline std::string_view ToString(ProviderId provider) {
  switch (provider) {
    case ProviderId::Binance:
      return "binance";
    case ProviderId::Bybit:
      return "bybit";
  }
  return "unknown";
}

inline std::optional<ProviderId> ParseProviderId(std::string_view name) {
  if (name == "binance") return ProviderId::Binance;
  if (name == "bybit") return ProviderId::Bybit;
  return std::nullopt;
}

inline std::string_view ToString(CrossoverEvent event) {
  switch (event) {
    case CrossoverEvent::None:
      return "none";
    case CrossoverEvent::Bullish:
      return "bullish";
    case CrossoverEvent::Bearish:
      return "bearish";
  }
  return "none";
}

#endif  // EMACROSSWATCH_TYPES_H
