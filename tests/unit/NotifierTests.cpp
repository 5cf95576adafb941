#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "Mocks.h"
#include "notify/Notifier.h"
#include "notify/TelegramNotifier.h"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

Alert MakeAlert(CrossoverEvent direction) {
  using namespace std::chrono;
  Alert alert;
  alert.symbol = {ProviderId::Binance, "BTCUSDT", "BTC/USD"};
  alert.direction = direction;
  alert.fast_ema = 43251.174;
  alert.slow_ema = 43249.5;
  alert.fast_period = 9;
  alert.slow_period = 15;
  alert.timeframe = "1m";
  alert.time = sys_days{2024y / January / 15} + 13h + 45min + 30s + 250ms;
  return alert;
}

Config MakeTelegramConfig() {
  Config config;
  config.telegram_base_url = "https://api.telegram.org/";
  config.telegram_bot_token = "123:ABC";
  config.telegram_chat_id = "-100200300";
  config.request_timeout = std::chrono::seconds(5);
  return config;
}

}  // namespace

// ============================================================================
// Message Formatting Tests
// ============================================================================

TEST(NotifierTest, FormatAlertSubject) {
  EXPECT_EQ(FormatAlertSubject(MakeAlert(CrossoverEvent::Bullish)),
            "BTC/USD EMA Crossover Alert - BULLISH");
  EXPECT_EQ(FormatAlertSubject(MakeAlert(CrossoverEvent::Bearish)),
            "BTC/USD EMA Crossover Alert - BEARISH");
}

TEST(NotifierTest, FormatAlertBody) {
  EXPECT_EQ(FormatAlertBody(MakeAlert(CrossoverEvent::Bullish)),
            "BTC/USD EMA(9) has crossed above EMA(15)");
  EXPECT_EQ(FormatAlertBody(MakeAlert(CrossoverEvent::Bearish)),
            "BTC/USD EMA(9) has crossed below EMA(15)");
}

TEST(NotifierTest, FormatAlertText_FullMessage) {
  EXPECT_EQ(FormatAlertText(MakeAlert(CrossoverEvent::Bullish)),
            "BTC/USD EMA Crossover Alert - BULLISH\n"
            "BTC/USD EMA(9) has crossed above EMA(15)\n"
            "\n"
            "Signal: BULLISH\n"
            "EMA(9): 43251.17\n"
            "EMA(15): 43249.50\n"
            "Timeframe: 1m\n"
            "Time: 2024-01-15 13:45:30 UTC");
}

TEST(NotifierTest, FormatAlertText_UsesConfiguredPeriods) {
  auto alert = MakeAlert(CrossoverEvent::Bearish);
  alert.fast_period = 3;
  alert.slow_period = 5;
  alert.timeframe = "4h";

  const auto text = FormatAlertText(alert);

  EXPECT_THAT(text, HasSubstr("EMA(3) has crossed below EMA(5)"));
  EXPECT_THAT(text, HasSubstr("Signal: BEARISH\nEMA(3): "));
  EXPECT_THAT(text, HasSubstr("Timeframe: 4h"));
}

// ============================================================================
// TelegramNotifier Tests
// ============================================================================

TEST(TelegramNotifierTest, BuildPayload) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);
  const auto alert = MakeAlert(CrossoverEvent::Bullish);

  auto payload = nlohmann::json::parse(notifier.buildPayload(alert));

  EXPECT_EQ(payload["chat_id"], "-100200300");
  EXPECT_EQ(payload["text"], FormatAlertText(alert));
  EXPECT_EQ(payload["parse_mode"], "Markdown");
}

TEST(TelegramNotifierTest, Send_PostsToBotUrl) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);
  std::string body;

  EXPECT_CALL(http, postJson("https://api.telegram.org/bot123:ABC/sendMessage",
                             _, std::chrono::nanoseconds(std::chrono::seconds(5))))
      .WillOnce(::testing::DoAll(
          SaveArg<1>(&body),
          Return(HttpResponse{200, R"({"ok": true, "result": {}})"})));

  auto result = notifier.send(MakeAlert(CrossoverEvent::Bullish));

  EXPECT_TRUE(result.has_value());
  EXPECT_THAT(body, HasSubstr("-100200300"));
}

TEST(TelegramNotifierTest, Send_ApiRejects) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);

  EXPECT_CALL(http, postJson(_, _, _))
      .WillOnce(Return(HttpResponse{
          400,
          R"({"ok": false, "error_code": 400, "description": "Bad Request: chat not found"})"}));

  auto result = notifier.send(MakeAlert(CrossoverEvent::Bullish));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(),
            "Telegram error (HTTP 400): Bad Request: chat not found");
}

TEST(TelegramNotifierTest, Send_OkFalseWithSuccessStatus) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);

  EXPECT_CALL(http, postJson(_, _, _))
      .WillOnce(Return(HttpResponse{200, R"({"ok": false})"}));

  auto result = notifier.send(MakeAlert(CrossoverEvent::Bearish));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Telegram error (HTTP 200): unexpected response");
}

TEST(TelegramNotifierTest, Send_NonJsonBody) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);

  EXPECT_CALL(http, postJson(_, _, _))
      .WillOnce(Return(HttpResponse{502, "Bad Gateway"}));

  auto result = notifier.send(MakeAlert(CrossoverEvent::Bullish));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Telegram error (HTTP 502): unexpected response");
}

TEST(TelegramNotifierTest, Send_TransportError) {
  MockHttpClient http;
  TelegramNotifier notifier(MakeTelegramConfig(), http);

  EXPECT_CALL(http, postJson(_, _, _))
      .WillOnce(Return(std::unexpected<std::string>(
          "HTTP POST failed: Couldn't resolve host name")));

  auto result = notifier.send(MakeAlert(CrossoverEvent::Bullish));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(),
            "Telegram request failed: HTTP POST failed: Couldn't resolve host "
            "name");
}
