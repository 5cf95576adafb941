#include "BinanceProvider.h"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

constexpr std::array<std::string_view, 16> kIntervals = {
    "1s", "1m", "3m", "5m", "15m", "30m", "1h", "2h",
    "4h", "6h", "8h", "12h", "1d", "3d", "1w", "1M"};

// Binance sends prices as strings; tolerate plain numbers as well.
std::expected<Price, std::string> ReadPrice(const nlohmann::json& field) {
  if (field.is_string()) {
    return ParsePriceField(field.get_ref<const std::string&>());
  }
  if (field.is_number()) {
    return field.get<Price>();
  }
  return std::unexpected(
      std::format("Unexpected price field type: {}", field.type_name()));
}

// Error payloads look like {"code": -1121, "msg": "Invalid symbol."}.
std::string DescribeError(const nlohmann::json& json) {
  if (json.is_object() && json.contains("code") && json.contains("msg")) {
    return std::format("Binance error {}: {}", json["code"].dump(),
                       json["msg"].is_string()
                           ? json["msg"].get<std::string>()
                           : json["msg"].dump());
  }
  return std::format("Unexpected Binance response: {}", json.dump());
}

}  // namespace

BinanceProvider::BinanceProvider(IHttpClient& http, std::string base_url,
                                 std::chrono::nanoseconds timeout)
    : http_(http), base_url_(std::move(base_url)), timeout_(timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::expected<std::vector<Candle>, std::string> BinanceProvider::fetchCandles(
    const std::string& symbol, const std::string& interval, uint32_t limit) {
  const std::string url =
      std::format("{}/api/v3/klines?symbol={}&interval={}&limit={}", base_url_,
                  symbol, interval, limit);

  auto response = http_.get(url, timeout_);
  if (!response) {
    return std::unexpected(response.error());
  }

  if (response->status_code >= 400) {
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (!json.is_discarded() && json.is_object()) {
      return std::unexpected(std::format("HTTP {}: {}", response->status_code,
                                         DescribeError(json)));
    }
    return std::unexpected(std::format("HTTP {}", response->status_code));
  }

  auto candles = ParseKlines(response->body);
  if (!candles) {
    return candles;
  }
  NormalizeCandles(*candles);
  return candles;
}

ProviderId BinanceProvider::getId() const { return ProviderId::Binance; }

bool BinanceProvider::IsSupportedInterval(std::string_view interval) {
  return std::ranges::find(kIntervals, interval) != kIntervals.end();
}

std::expected<std::vector<Candle>, std::string> BinanceProvider::ParseKlines(
    std::string_view body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    return std::unexpected("Malformed JSON in Binance klines response");
  }
  if (!json.is_array()) {
    return std::unexpected(DescribeError(json));
  }

  std::vector<Candle> candles;
  candles.reserve(json.size());

  for (const auto& kline : json) {
    // [openTime, open, high, low, close, volume, closeTime, ...]
    if (!kline.is_array() || kline.size() < 5 || !kline[0].is_number_integer()) {
      return std::unexpected(
          std::format("Malformed Binance kline: {}", kline.dump()));
    }

    auto open = ReadPrice(kline[1]);
    auto high = ReadPrice(kline[2]);
    auto low = ReadPrice(kline[3]);
    auto close = ReadPrice(kline[4]);
    for (const auto* field : {&open, &high, &low, &close}) {
      if (!*field) {
        return std::unexpected(field->error());
      }
    }

    candles.push_back({.timestamp = kline[0].get<TimestampMs>(),
                       .open = *open,
                       .high = *high,
                       .low = *low,
                       .close = *close});
  }

  return candles;
}
