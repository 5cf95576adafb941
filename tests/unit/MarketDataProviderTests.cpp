#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "Mocks.h"
#include "market_data/MarketDataProvider.h"

using ::testing::HasSubstr;

// ============================================================================
// NormalizeCandles Tests
// ============================================================================

TEST(MarketDataProviderTest, NormalizeCandles_SortsOldestFirst) {
  std::vector<Candle> candles = {{3000, 3, 3, 3, 3.0},
                                 {1000, 1, 1, 1, 1.0},
                                 {2000, 2, 2, 2, 2.0}};

  NormalizeCandles(candles);

  ASSERT_EQ(candles.size(), 3u);
  EXPECT_EQ(candles[0].timestamp, 1000);
  EXPECT_EQ(candles[1].timestamp, 2000);
  EXPECT_EQ(candles[2].timestamp, 3000);
}

TEST(MarketDataProviderTest, NormalizeCandles_DuplicateTimestamp_KeepsLast) {
  std::vector<Candle> candles = {{1000, 1, 1, 1, 1.0},
                                 {2000, 2, 2, 2, 2.0},
                                 {2000, 2, 2, 2, 2.5},
                                 {3000, 3, 3, 3, 3.0}};

  NormalizeCandles(candles);

  ASSERT_EQ(candles.size(), 3u);
  EXPECT_EQ(candles[1].timestamp, 2000);
  EXPECT_DOUBLE_EQ(candles[1].close, 2.5);
}

TEST(MarketDataProviderTest, NormalizeCandles_Empty_StaysEmpty) {
  std::vector<Candle> candles;

  NormalizeCandles(candles);

  EXPECT_TRUE(candles.empty());
}

// ============================================================================
// ExtractCloses Tests
// ============================================================================

TEST(MarketDataProviderTest, ExtractCloses_PreservesOrder) {
  const std::vector<Candle> candles = {{1000, 10, 12, 9, 11.0},
                                       {2000, 11, 13, 10, 12.5},
                                       {3000, 12, 12, 8, 9.75}};

  auto closes = ExtractCloses(candles);

  EXPECT_THAT(closes, ::testing::ElementsAre(11.0, 12.5, 9.75));
}

TEST(MarketDataProviderTest, ExtractCloses_Empty_ReturnsEmpty) {
  EXPECT_TRUE(ExtractCloses({}).empty());
}

// ============================================================================
// ParsePriceField Tests
// ============================================================================

TEST(MarketDataProviderTest, ParsePriceField_ValidDecimal) {
  auto price = ParsePriceField("43251.17000000");

  ASSERT_TRUE(price.has_value());
  EXPECT_DOUBLE_EQ(*price, 43251.17);
}

TEST(MarketDataProviderTest, ParsePriceField_Invalid_ReturnsError) {
  EXPECT_FALSE(ParsePriceField("").has_value());
  EXPECT_FALSE(ParsePriceField("abc").has_value());
  EXPECT_FALSE(ParsePriceField("12.5x").has_value());
  EXPECT_THAT(ParsePriceField("12.5x").error(), HasSubstr("12.5x"));
}

// ============================================================================
// MakeMarketDataProviders Tests
// ============================================================================

TEST(MarketDataProviderTest, MakeProviders_OnlyReferencedProviders) {
  MockHttpClient http;
  Config config;
  config.symbols = {{ProviderId::Binance, "BTCUSDT", "BTC/USD"},
                    {ProviderId::Binance, "ETHUSDT", "ETH/USD"}};

  auto providers = MakeMarketDataProviders(config, http);

  ASSERT_TRUE(providers.has_value()) << providers.error();
  EXPECT_EQ(providers->size(), 1u);
  ASSERT_TRUE(providers->contains(ProviderId::Binance));
  EXPECT_EQ(providers->at(ProviderId::Binance)->getId(), ProviderId::Binance);
}

TEST(MarketDataProviderTest, MakeProviders_BothProviders) {
  MockHttpClient http;
  Config config;
  config.symbols = {{ProviderId::Binance, "BTCUSDT", "BTC/USD"},
                    {ProviderId::Bybit, "SOLUSDT", "SOL/USD"}};

  auto providers = MakeMarketDataProviders(config, http);

  ASSERT_TRUE(providers.has_value()) << providers.error();
  EXPECT_EQ(providers->size(), 2u);
  EXPECT_EQ(providers->at(ProviderId::Bybit)->getId(), ProviderId::Bybit);
}

TEST(MarketDataProviderTest, MakeProviders_UnsupportedBinanceInterval_Fails) {
  MockHttpClient http;
  Config config;
  config.candle_interval = "7m";
  config.symbols = {{ProviderId::Binance, "BTCUSDT", "BTC/USD"}};

  auto providers = MakeMarketDataProviders(config, http);

  ASSERT_FALSE(providers.has_value());
  EXPECT_THAT(providers.error(), HasSubstr("7m"));
}

TEST(MarketDataProviderTest, MakeProviders_UnsupportedBybitInterval_Fails) {
  MockHttpClient http;
  Config config;
  config.candle_interval = "8h";  // Binance has it, Bybit does not
  config.symbols = {{ProviderId::Binance, "BTCUSDT", "BTC/USD"},
                    {ProviderId::Bybit, "BTCUSDT", "BTC/USD"}};

  auto providers = MakeMarketDataProviders(config, http);

  ASSERT_FALSE(providers.has_value());
  EXPECT_THAT(providers.error(), HasSubstr("Bybit"));
}
