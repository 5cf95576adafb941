#include "BybitProvider.h"

#include <array>
#include <charconv>
#include <cstddef>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 13>
    kIntervals = {{{"1m", "1"},
                   {"3m", "3"},
                   {"5m", "5"},
                   {"15m", "15"},
                   {"30m", "30"},
                   {"1h", "60"},
                   {"2h", "120"},
                   {"4h", "240"},
                   {"6h", "360"},
                   {"12h", "720"},
                   {"1d", "D"},
                   {"1w", "W"},
                   {"1M", "M"}}};

}  // namespace

BybitProvider::BybitProvider(IHttpClient& http, std::string base_url,
                             std::string category,
                             std::chrono::nanoseconds timeout)
    : http_(http),
      base_url_(std::move(base_url)),
      category_(std::move(category)),
      timeout_(timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::expected<std::vector<Candle>, std::string> BybitProvider::fetchCandles(
    const std::string& symbol, const std::string& interval, uint32_t limit) {
  auto bybit_interval = ToBybitInterval(interval);
  if (!bybit_interval) {
    return std::unexpected(
        std::format("Unsupported Bybit interval: {}", interval));
  }

  const std::string url = std::format(
      "{}/v5/market/kline?category={}&symbol={}&interval={}&limit={}",
      base_url_, category_, symbol, *bybit_interval, limit);

  auto response = http_.get(url, timeout_);
  if (!response) {
    return std::unexpected(response.error());
  }
  if (response->status_code >= 400) {
    return std::unexpected(std::format("HTTP {}", response->status_code));
  }

  auto candles = ParseKlines(response->body);
  if (!candles) {
    return candles;
  }
  NormalizeCandles(*candles);
  return candles;
}

ProviderId BybitProvider::getId() const { return ProviderId::Bybit; }

std::optional<std::string> BybitProvider::ToBybitInterval(
    std::string_view interval) {
  for (const auto& [generic, bybit] : kIntervals) {
    if (generic == interval) {
      return std::string(bybit);
    }
  }
  return std::nullopt;
}

std::expected<std::vector<Candle>, std::string> BybitProvider::ParseKlines(
    std::string_view body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected("Malformed JSON in Bybit kline response");
  }

  // {"retCode": 0, "retMsg": "OK", "result": {"list": [[...], ...]}}
  const auto ret_code = json.find("retCode");
  if (ret_code == json.end() || !ret_code->is_number_integer()) {
    return std::unexpected("Bybit response is missing retCode");
  }
  if (ret_code->get<int>() != 0) {
    return std::unexpected(
        std::format("Bybit error {}: {}", ret_code->get<int>(),
                    json.value("retMsg", std::string("unknown error"))));
  }

  const auto result = json.find("result");
  if (result == json.end() || !result->is_object() ||
      !result->contains("list") || !(*result)["list"].is_array()) {
    return std::unexpected("Bybit response is missing result.list");
  }

  std::vector<Candle> candles;
  candles.reserve((*result)["list"].size());

  // [startTime, open, high, low, close, volume, turnover], all strings.
  for (const auto& kline : (*result)["list"]) {
    if (!kline.is_array() || kline.size() < 5) {
      return std::unexpected(
          std::format("Malformed Bybit kline: {}", kline.dump()));
    }
    bool all_strings = true;
    for (std::size_t i = 0; i < 5; ++i) {
      all_strings = all_strings && kline[i].is_string();
    }
    if (!all_strings) {
      return std::unexpected(
          std::format("Malformed Bybit kline: {}", kline.dump()));
    }

    const auto& start = kline[0].get_ref<const std::string&>();
    TimestampMs timestamp = 0;
    auto [ptr, ec] =
        std::from_chars(start.data(), start.data() + start.size(), timestamp);
    if (ec != std::errc() || ptr != start.data() + start.size()) {
      return std::unexpected(
          std::format("Invalid Bybit kline start time: '{}'", start));
    }

    auto open = ParsePriceField(kline[1].get_ref<const std::string&>());
    auto high = ParsePriceField(kline[2].get_ref<const std::string&>());
    auto low = ParsePriceField(kline[3].get_ref<const std::string&>());
    auto close = ParsePriceField(kline[4].get_ref<const std::string&>());
    for (const auto* field : {&open, &high, &low, &close}) {
      if (!*field) {
        return std::unexpected(field->error());
      }
    }

    candles.push_back({.timestamp = timestamp,
                       .open = *open,
                       .high = *high,
                       .low = *low,
                       .close = *close});
  }

  return candles;
}
