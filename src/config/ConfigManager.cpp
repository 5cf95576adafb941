#include "ConfigManager.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <regex>
#include <set>
#include <utility>

#include "ini.h"

namespace {

constexpr std::string_view kSymbolSectionPrefix = "symbol.";
constexpr uint32_t kMaxCandleLimit = 1000;

std::expected<std::chrono::nanoseconds, std::string> ParseDuration(
    std::string_view input) {
  if (input.empty()) {
    return std::unexpected("Empty duration string");
  }

  std::string s(input);
  // Remove whitespace
  std::erase_if(s, ::isspace);

  std::regex re(R"(^(\d+)(d|h|min|s|ms|us|ns)$)");
  std::smatch match;

  if (!std::regex_match(s, match, re)) {
    return std::unexpected(std::format("Invalid duration format: {}", input));
  }

  long long value = 0;
  const char* first = &*match[1].first;
  const char* last = first + match[1].length();
  auto result = std::from_chars(first, last, value);
  if (result.ec != std::errc()) {
    return std::unexpected(
        std::format("Invalid number in duration: {}", input));
  }

  std::string suffix = match[2].str();

  using namespace std::chrono;

  if (suffix == "ns") return nanoseconds(value);
  if (suffix == "us") return duration_cast<nanoseconds>(microseconds(value));
  if (suffix == "ms") return duration_cast<nanoseconds>(milliseconds(value));
  if (suffix == "s") return duration_cast<nanoseconds>(seconds(value));
  if (suffix == "min") return duration_cast<nanoseconds>(minutes(value));
  if (suffix == "h") return duration_cast<nanoseconds>(hours(value));
  if (suffix == "d") return duration_cast<nanoseconds>(days(value));

  return std::unexpected(std::format("Unknown time suffix: {}", suffix));
}

std::string DurationToString(std::chrono::nanoseconds ns) {
  using namespace std::chrono;

  if (ns.count() == 0) return "0ns";

  if (ns % days(1) == nanoseconds(0))
    return std::format("{}d", duration_cast<days>(ns).count());
  if (ns % hours(1) == nanoseconds(0))
    return std::format("{}h", duration_cast<hours>(ns).count());
  if (ns % minutes(1) == nanoseconds(0))
    return std::format("{}min", duration_cast<minutes>(ns).count());
  if (ns % seconds(1) == nanoseconds(0))
    return std::format("{}s", duration_cast<seconds>(ns).count());
  if (ns % milliseconds(1) == nanoseconds(0))
    return std::format("{}ms", duration_cast<milliseconds>(ns).count());
  if (ns % microseconds(1) == nanoseconds(0))
    return std::format("{}us", duration_cast<microseconds>(ns).count());

  return std::format("{}ns", ns.count());
}

template <typename T>
std::expected<T, std::string> ParseNumber(const std::string& str) {
  T value;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec == std::errc() && ptr == str.data() + str.size()) {
    return value;
  }
  return std::unexpected(std::format("Failed to parse number: {}", str));
}

std::expected<std::string, std::string> ParseString(const std::string& str) {
  return str;
}

std::expected<ProviderId, std::string> ParseProvider(const std::string& str) {
  if (auto provider = ParseProviderId(str)) {
    return *provider;
  }
  return std::unexpected(std::format("Unknown provider: {}", str));
}

std::expected<Config, std::string> ParseIni(mINI::INIStructure& ini) {
  Config config;

  auto parse_value = [&](const std::string& section, const std::string& key,
                         auto& target,
                         auto parser) -> std::optional<std::string> {
    if (ini.has(section) && ini[section].has(key)) {
      auto result = parser(ini[section][key]);
      if (result) {
        target = *result;
      } else {
        return std::format("Error parsing [{}] {}: {}", section, key,
                           result.error());
      }
    }
    return std::nullopt;
  };

  // Indicators
  if (auto err = parse_value("Indicators", "fast_period", config.fast_period,
                             ParseNumber<int>))
    return std::unexpected(*err);
  if (auto err = parse_value("Indicators", "slow_period", config.slow_period,
                             ParseNumber<int>))
    return std::unexpected(*err);

  // Polling
  if (auto err = parse_value("Polling", "poll_interval", config.poll_interval,
                             ParseDuration))
    return std::unexpected(*err);
  if (auto err = parse_value("Polling", "candle_interval",
                             config.candle_interval, ParseString))
    return std::unexpected(*err);
  if (auto err = parse_value("Polling", "candle_limit", config.candle_limit,
                             ParseNumber<uint32_t>))
    return std::unexpected(*err);
  if (auto err = parse_value("Polling", "request_timeout",
                             config.request_timeout, ParseDuration))
    return std::unexpected(*err);
  if (auto err = parse_value("Polling", "fetch_workers", config.fetch_workers,
                             ParseNumber<uint32_t>))
    return std::unexpected(*err);

  // Providers
  if (auto err = parse_value("Binance", "base_url", config.binance_base_url,
                             ParseString))
    return std::unexpected(*err);
  if (auto err = parse_value("Bybit", "base_url", config.bybit_base_url,
                             ParseString))
    return std::unexpected(*err);
  if (auto err = parse_value("Bybit", "category", config.bybit_category,
                             ParseString))
    return std::unexpected(*err);

  // Telegram
  if (auto err = parse_value("Telegram", "base_url", config.telegram_base_url,
                             ParseString))
    return std::unexpected(*err);
  if (auto err = parse_value("Telegram", "bot_token",
                             config.telegram_bot_token, ParseString))
    return std::unexpected(*err);
  if (auto err = parse_value("Telegram", "chat_id", config.telegram_chat_id,
                             ParseString))
    return std::unexpected(*err);

  if (ini.has("Output") && ini["Output"].has("alerts_log_path")) {
    config.alerts_log_path = ini["Output"]["alerts_log_path"];
  }

  // Symbols, in file order
  for (const auto& [section, values] : ini) {
    if (!section.starts_with(kSymbolSectionPrefix)) {
      continue;
    }
    if (!values.has("provider") || !values.has("code")) {
      return std::unexpected(
          std::format("[{}] requires both provider and code", section));
    }

    auto provider = ParseProvider(values.get("provider"));
    if (!provider) {
      return std::unexpected(
          std::format("Error parsing [{}] provider: {}", section,
                      provider.error()));
    }

    SymbolConfig symbol{*provider, values.get("code"), values.get("label")};
    if (symbol.code.empty()) {
      return std::unexpected(std::format("[{}] code is empty", section));
    }
    if (symbol.label.empty()) {
      symbol.label = symbol.code;
    }
    config.symbols.push_back(std::move(symbol));
  }

  return config;
}

}  // namespace

std::expected<Config, std::string> ConfigManager::Load(
    const std::filesystem::path& path) {
  mINI::INIFile file(path.string());
  mINI::INIStructure ini;

  if (!file.read(ini)) {
    return std::unexpected(
        std::format("Failed to read config file: {}", path.string()));
  }

  auto config = ParseIni(ini);
  if (!config) {
    return config;
  }

  if (auto env = ApplyEnvironment(*config); !env) {
    return std::unexpected(env.error());
  }

  if (auto valid = Validate(*config); !valid) {
    return std::unexpected(valid.error());
  }

  return config;
}

std::expected<void, std::string> ConfigManager::ApplyEnvironment(
    Config& config) {
  if (const char* token = std::getenv("TELEGRAM_BOT_TOKEN");
      token != nullptr && *token != '\0') {
    config.telegram_bot_token = token;
  }
  if (const char* chat_id = std::getenv("TELEGRAM_CHAT_ID");
      chat_id != nullptr && *chat_id != '\0') {
    config.telegram_chat_id = chat_id;
  }
  if (const char* minutes = std::getenv("POLL_INTERVAL_MINUTES");
      minutes != nullptr && *minutes != '\0') {
    auto value = ParseNumber<int>(minutes);
    if (!value || *value < 1) {
      return std::unexpected(std::format(
          "POLL_INTERVAL_MINUTES must be a positive integer, got: {}",
          minutes));
    }
    config.poll_interval = std::chrono::minutes(*value);
  }
  return {};
}

std::expected<void, std::string> ConfigManager::Validate(
    const Config& config) {
  if (config.fast_period < 1)
    return std::unexpected("fast_period must be >= 1");
  if (config.slow_period <= config.fast_period)
    return std::unexpected("slow_period must be > fast_period");

  if (config.poll_interval < std::chrono::seconds(1))
    return std::unexpected("poll_interval must be >= 1s");
  if (config.request_timeout < std::chrono::seconds(1))
    return std::unexpected("request_timeout must be >= 1s");
  if (config.candle_interval.empty())
    return std::unexpected("candle_interval must not be empty");

  // One extra candle beyond the detector window feeds the previous sample.
  const auto min_limit = static_cast<uint32_t>(config.slow_period) + 6;
  if (config.candle_limit < min_limit)
    return std::unexpected(
        std::format("candle_limit must be >= slow_period + 6 ({})", min_limit));
  if (config.candle_limit > kMaxCandleLimit)
    return std::unexpected(
        std::format("candle_limit must be <= {}", kMaxCandleLimit));
  if (config.fetch_workers < 1)
    return std::unexpected("fetch_workers must be >= 1");

  if (config.symbols.empty())
    return std::unexpected(
        "At least one [symbol.<name>] section is required");

  std::set<std::pair<ProviderId, std::string>> seen;
  for (const auto& symbol : config.symbols) {
    if (!seen.emplace(symbol.provider, symbol.code).second) {
      return std::unexpected(std::format("Duplicate symbol {} on {}",
                                         symbol.code,
                                         ToString(symbol.provider)));
    }
  }

  if (config.telegram_bot_token.empty())
    return std::unexpected(
        "Telegram bot_token is required ([Telegram] bot_token or "
        "TELEGRAM_BOT_TOKEN)");
  if (config.telegram_chat_id.empty())
    return std::unexpected(
        "Telegram chat_id is required ([Telegram] chat_id or "
        "TELEGRAM_CHAT_ID)");

  return {};
}

std::expected<Config, std::string> ConfigManager::CreateDefaultConfig(
    const std::filesystem::path& path) {
  Config config;  // Default values
  mINI::INIFile file(path.string());
  mINI::INIStructure ini;

  ini["Indicators"]["fast_period"] = std::to_string(config.fast_period);
  ini["Indicators"]["slow_period"] = std::to_string(config.slow_period);

  ini["Polling"]["poll_interval"] = DurationToString(config.poll_interval);
  ini["Polling"]["candle_interval"] = config.candle_interval;
  ini["Polling"]["candle_limit"] = std::to_string(config.candle_limit);
  ini["Polling"]["request_timeout"] = DurationToString(config.request_timeout);
  ini["Polling"]["fetch_workers"] = std::to_string(config.fetch_workers);

  ini["Binance"]["base_url"] = config.binance_base_url;
  ini["Bybit"]["base_url"] = config.bybit_base_url;
  ini["Bybit"]["category"] = config.bybit_category;

  ini["Telegram"]["base_url"] = config.telegram_base_url;
  ini["Telegram"]["bot_token"] = "";
  ini["Telegram"]["chat_id"] = "";

  ini["Output"]["alerts_log_path"] = config.alerts_log_path.string();

  const std::pair<std::string, std::string> default_symbols[] = {
      {"BTCUSDT", "BTC/USD"}, {"SOLUSDT", "SOL/USD"}, {"ETHUSDT", "ETH/USD"}};
  for (const auto& [code, label] : default_symbols) {
    auto& section = ini[std::format("symbol.{}", code.substr(0, 3))];
    section["provider"] = std::string(ToString(ProviderId::Binance));
    section["code"] = code;
    section["label"] = label;
  }

  if (!file.generate(ini, true)) {
    return std::unexpected("Failed to write default config file");
  }

  return Load(path);
}
