#ifndef EMACROSSWATCH_BINANCEPROVIDER_H
#define EMACROSSWATCH_BINANCEPROVIDER_H

#include <chrono>
#include <string>
#include <string_view>

#include "MarketDataProvider.h"

// Spot klines from GET /api/v3/klines.
class BinanceProvider : public IMarketDataProvider {
 public:
  BinanceProvider(IHttpClient& http, std::string base_url,
                  std::chrono::nanoseconds timeout);

  std::expected<std::vector<Candle>, std::string> fetchCandles(
      const std::string& symbol, const std::string& interval,
      uint32_t limit) override;
  [[nodiscard]] ProviderId getId() const override;

  static bool IsSupportedInterval(std::string_view interval);
  static std::expected<std::vector<Candle>, std::string> ParseKlines(
      std::string_view body);

 private:
  IHttpClient& http_;
  std::string base_url_;
  std::chrono::nanoseconds timeout_;
};

#endif  // EMACROSSWATCH_BINANCEPROVIDER_H
