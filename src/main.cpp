#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <print>
#include <string_view>

#include "config/ConfigManager.h"
#include "logs/AlertLogger.h"
#include "market_data/MarketDataProvider.h"
#include "monitor/PollScheduler.h"
#include "net/CurlHttpClient.h"
#include "notify/TelegramNotifier.h"

namespace {

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) { g_stop_requested = true; }

}  // namespace

std::filesystem::path GetExecutableDirectory(const char* argv0) {
  const std::filesystem::path exe_path(argv0);

  if (exe_path.is_absolute()) {
    return exe_path.parent_path();
  }

  return std::filesystem::absolute(exe_path).parent_path();
}

std::expected<Config, std::string> LoadOrCreateConfig(
    const std::filesystem::path& config_path) {
  std::error_code ec;
  bool file_exists = std::filesystem::exists(config_path, ec);

  if (ec) {
    return std::unexpected(std::format("Cannot access path '{}': {}",
                                       config_path.string(), ec.message()));
  }

  if (file_exists) {
    return ConfigManager::Load(config_path);
  }

  std::println("Configuration file not found, creating default: {}",
               config_path.string());
  return ConfigManager::CreateDefaultConfig(config_path);
}

void PrintUsage() {
  std::println("Usage: EmaCrossWatch [CONFIG_PATH]");
  std::println("");
  std::println("Arguments:");
  std::println("  CONFIG_PATH    Optional path to configuration file");
  std::println(
      "                 (default: config.ini in executable directory)");
  std::println("");
  std::println("Description:");
  std::println("  Polls candle data for the configured symbols, watches the");
  std::println("  fast/slow EMA pair and sends a Telegram alert when they");
  std::println("  cross.");
  std::println("");
  std::println("  A missing configuration file is created with defaults.");
  std::println("  Telegram credentials may be given in the [Telegram]");
  std::println("  section or via TELEGRAM_BOT_TOKEN and TELEGRAM_CHAT_ID.");
  std::println("  POLL_INTERVAL_MINUTES overrides [Polling] poll_interval.");
  std::println("");
  std::println("Examples:");
  std::println("  EmaCrossWatch                  # Use default config.ini");
  std::println("  EmaCrossWatch my_config.ini    # Use custom configuration");
}

void PrintStartupSummary(const Config& config) {
  std::println("Indicators: EMA({}) and EMA({})", config.fast_period,
               config.slow_period);
  std::println("Candle interval: {} | Poll interval: {}",
               config.candle_interval,
               std::chrono::duration_cast<std::chrono::seconds>(
                   config.poll_interval));
  for (const auto& symbol : config.symbols) {
    std::println("  {} ({} on {})", symbol.label, symbol.code,
                 ToString(symbol.provider));
  }
  std::println("========================================");
  std::println("");
}

int main(int argc, char* argv[]) {
  std::println("========================================");
  std::println("EMA Crossover Alert Monitor");
  std::println("========================================");
  std::println("");

  if (argc > 2) {
    std::println("Error: Too many arguments provided");
    std::println("");
    PrintUsage();
    return 1;
  }

  if (argc == 2 && (std::string_view(argv[1]) == "--help" ||
                    std::string_view(argv[1]) == "-h")) {
    PrintUsage();
    return 0;
  }

  std::filesystem::path config_path;

  if (argc == 2) {
    config_path = argv[1];
  } else {
    config_path = GetExecutableDirectory(argv[0]) / "config.ini";
  }

  std::println("Using configuration file: {}", config_path.string());
  std::println("");

  auto config_result = LoadOrCreateConfig(config_path);

  if (!config_result) {
    std::println(stderr, "Configuration error: {}", config_result.error());
    return 1;
  }

  const Config config = config_result.value();
  PrintStartupSummary(config);

  try {
    CurlGlobal curl_global;
    CurlHttpClient http;

    auto providers = MakeMarketDataProviders(config, http);
    if (!providers) {
      std::println(stderr, "Configuration error: {}", providers.error());
      return 1;
    }

    TelegramNotifier notifier(config, http);
    AlertLogger alert_logger(config);
    PollScheduler scheduler(config, *providers, notifier, alert_logger);

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    scheduler.run(g_stop_requested);
  } catch (const std::exception& e) {
    std::println(stderr, "Fatal error: {}", e.what());
    return 1;
  }

  std::println("Monitor stopped.");
  return 0;
}
