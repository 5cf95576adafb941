#include "MarketDataProvider.h"

#include <algorithm>
#include <charconv>
#include <format>

#include "BinanceProvider.h"
#include "BybitProvider.h"

std::expected<MarketDataProviders, std::string> MakeMarketDataProviders(
    const Config& config, IHttpClient& http) {
  MarketDataProviders providers;

  for (const auto& symbol : config.symbols) {
    if (providers.contains(symbol.provider)) {
      continue;
    }

    switch (symbol.provider) {
      case ProviderId::Binance:
        if (!BinanceProvider::IsSupportedInterval(config.candle_interval)) {
          return std::unexpected(std::format(
              "Binance does not support candle interval '{}'",
              config.candle_interval));
        }
        providers.emplace(ProviderId::Binance,
                          std::make_unique<BinanceProvider>(
                              http, config.binance_base_url,
                              config.request_timeout));
        break;
      case ProviderId::Bybit: {
        if (!BybitProvider::ToBybitInterval(config.candle_interval)) {
          return std::unexpected(
              std::format("Bybit does not support candle interval '{}'",
                          config.candle_interval));
        }
        providers.emplace(ProviderId::Bybit,
                          std::make_unique<BybitProvider>(
                              http, config.bybit_base_url,
                              config.bybit_category, config.request_timeout));
        break;
      }
    }
  }

  return providers;
}

void NormalizeCandles(std::vector<Candle>& candles) {
  std::stable_sort(candles.begin(), candles.end(),
                   [](const Candle& a, const Candle& b) {
                     return a.timestamp < b.timestamp;
                   });

  // Reverse pass so the last occurrence of a timestamp survives unique().
  std::reverse(candles.begin(), candles.end());
  auto last = std::unique(candles.begin(), candles.end(),
                          [](const Candle& a, const Candle& b) {
                            return a.timestamp == b.timestamp;
                          });
  candles.erase(last, candles.end());
  std::reverse(candles.begin(), candles.end());
}

PriceSeries ExtractCloses(std::span<const Candle> candles) {
  PriceSeries closes;
  closes.reserve(candles.size());
  for (const auto& candle : candles) {
    closes.push_back(candle.close);
  }
  return closes;
}

std::expected<Price, std::string> ParsePriceField(std::string_view text) {
  Price value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::unexpected(std::format("Invalid price value: '{}'", text));
  }
  return value;
}
