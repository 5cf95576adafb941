#ifndef EMACROSSWATCH_MARKETDATAPROVIDER_H
#define EMACROSSWATCH_MARKETDATAPROVIDER_H

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/Types.h"
#include "config/Config.h"
#include "net/HttpClient.h"

struct IMarketDataProvider {
  virtual ~IMarketDataProvider() = default;

  // Candles ordered oldest to newest, or a fetch error.
  virtual std::expected<std::vector<Candle>, std::string> fetchCandles(
      const std::string& symbol, const std::string& interval,
      uint32_t limit) = 0;
  [[nodiscard]] virtual ProviderId getId() const = 0;
};

using MarketDataProviders =
    std::unordered_map<ProviderId, std::unique_ptr<IMarketDataProvider>>;

// Builds one provider per distinct provider referenced by config.symbols.
std::expected<MarketDataProviders, std::string> MakeMarketDataProviders(
    const Config& config, IHttpClient& http);

// Sorts by timestamp and keeps the last candle of any duplicate timestamp.
void NormalizeCandles(std::vector<Candle>& candles);

PriceSeries ExtractCloses(std::span<const Candle> candles);

std::expected<Price, std::string> ParsePriceField(std::string_view text);

#endif  // EMACROSSWATCH_MARKETDATAPROVIDER_H
