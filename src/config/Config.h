#ifndef EMACROSSWATCH_CONFIG_H
#define EMACROSSWATCH_CONFIG_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace std::chrono_literals;

#include "common/Types.h"

struct Config {
  // Indicators
  int fast_period = 9;
  int slow_period = 15;

  // Polling
  std::chrono::nanoseconds poll_interval = 1min;
  std::string candle_interval = "1m";
  uint32_t candle_limit = 500;
  std::chrono::nanoseconds request_timeout = 10s;
  uint32_t fetch_workers = 1;

  // Providers
  std::string binance_base_url = "https://api.binance.com";
  std::string bybit_base_url = "https://api.bybit.com";
  std::string bybit_category = "spot";

  // Telegram
  std::string telegram_base_url = "https://api.telegram.org";
  std::string telegram_bot_token;
  std::string telegram_chat_id;

  // Output
  std::filesystem::path alerts_log_path = "output/alerts.csv";

  std::vector<SymbolConfig> symbols;
};

#endif  // EMACROSSWATCH_CONFIG_H
