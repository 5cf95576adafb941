#include <gtest/gtest.h>

#include "common/Types.h"

// ============================================================================
// Provider Tests
// ============================================================================

TEST(TypesTest, ProviderId_ToString) {
  EXPECT_EQ(ToString(ProviderId::Binance), "binance");
  EXPECT_EQ(ToString(ProviderId::Bybit), "bybit");
}

TEST(TypesTest, ParseProviderId_KnownNames) {
  EXPECT_EQ(ParseProviderId("binance"), ProviderId::Binance);
  EXPECT_EQ(ParseProviderId("bybit"), ProviderId::Bybit);
}

TEST(TypesTest, ParseProviderId_UnknownName_ReturnsNullopt) {
  EXPECT_FALSE(ParseProviderId("kraken").has_value());
  EXPECT_FALSE(ParseProviderId("").has_value());
  EXPECT_FALSE(ParseProviderId("Binance").has_value());
}

// ============================================================================
// CrossoverEvent Tests
// ============================================================================

TEST(TypesTest, CrossoverEvent_ToString) {
  EXPECT_EQ(ToString(CrossoverEvent::None), "none");
  EXPECT_EQ(ToString(CrossoverEvent::Bullish), "bullish");
  EXPECT_EQ(ToString(CrossoverEvent::Bearish), "bearish");
}

TEST(TypesTest, CrossoverResult_DefaultIsUndefinedNone) {
  CrossoverResult result;

  EXPECT_EQ(result.event, CrossoverEvent::None);
  EXPECT_FALSE(result.fast_ema.has_value());
  EXPECT_FALSE(result.slow_ema.has_value());
  EXPECT_FALSE(result.previous_fast_ema.has_value());
  EXPECT_FALSE(result.previous_slow_ema.has_value());
}

TEST(TypesTest, Candle_ConstructionAndFields) {
  Candle candle{1700000000000, 100.0, 110.0, 95.0, 105.0};

  EXPECT_EQ(candle.timestamp, 1700000000000);
  EXPECT_DOUBLE_EQ(candle.open, 100.0);
  EXPECT_DOUBLE_EQ(candle.high, 110.0);
  EXPECT_DOUBLE_EQ(candle.low, 95.0);
  EXPECT_DOUBLE_EQ(candle.close, 105.0);
}
