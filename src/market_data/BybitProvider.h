#ifndef EMACROSSWATCH_BYBITPROVIDER_H
#define EMACROSSWATCH_BYBITPROVIDER_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "MarketDataProvider.h"

// V5 klines from GET /v5/market/kline. The exchange returns the newest
// candle first; fetchCandles() returns them oldest first.
class BybitProvider : public IMarketDataProvider {
 public:
  BybitProvider(IHttpClient& http, std::string base_url, std::string category,
                std::chrono::nanoseconds timeout);

  std::expected<std::vector<Candle>, std::string> fetchCandles(
      const std::string& symbol, const std::string& interval,
      uint32_t limit) override;
  [[nodiscard]] ProviderId getId() const override;

  // "1m" -> "1", "1h" -> "60", "1d" -> "D" ...
  static std::optional<std::string> ToBybitInterval(std::string_view interval);
  static std::expected<std::vector<Candle>, std::string> ParseKlines(
      std::string_view body);

 private:
  IHttpClient& http_;
  std::string base_url_;
  std::string category_;
  std::chrono::nanoseconds timeout_;
};

#endif  // EMACROSSWATCH_BYBITPROVIDER_H
