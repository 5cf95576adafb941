#include "CrossoverDetector.h"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "indicators/PeriodEMA.h"

CrossoverDetector::CrossoverDetector(int fast_period, int slow_period)
    : fast_period_(fast_period), slow_period_(slow_period) {
  if (fast_period <= 0) {
    throw std::invalid_argument(
        std::format("fast period must be positive, got {}", fast_period));
  }
  if (slow_period <= fast_period) {
    throw std::invalid_argument(
        std::format("slow period ({}) must be greater than fast period ({})",
                    slow_period, fast_period));
  }
}

CrossoverResult CrossoverDetector::detect(
    std::span<const Price> closes) const {
  CrossoverResult result;

  const std::size_t window = getWindowSize();
  if (closes.size() < window) {
    return result;
  }

  const auto current = closes.last(window);
  result.fast_ema = CalculateEma(current, fast_period_);
  result.slow_ema = CalculateEma(current, slow_period_);

  // closes[-(window + 1) : -1], clipped at the start of the series.
  const auto without_latest = closes.first(closes.size() - 1);
  const auto previous =
      without_latest.last(std::min(window, without_latest.size()));
  if (previous.size() >= static_cast<std::size_t>(slow_period_)) {
    result.previous_fast_ema = CalculateEma(previous, fast_period_);
    result.previous_slow_ema = CalculateEma(previous, slow_period_);
  }

  if (!result.previous_fast_ema || !result.previous_slow_ema) {
    return result;
  }

  const Price fast_now = *result.fast_ema;
  const Price slow_now = *result.slow_ema;
  const Price fast_before = *result.previous_fast_ema;
  const Price slow_before = *result.previous_slow_ema;

  if (fast_before <= slow_before && fast_now > slow_now) {
    result.event = CrossoverEvent::Bullish;
  } else if (fast_before >= slow_before && fast_now < slow_now) {
    result.event = CrossoverEvent::Bearish;
  }

  return result;
}

std::size_t CrossoverDetector::getWindowSize() const {
  return static_cast<std::size_t>(slow_period_) + kStabilityMargin;
}

int CrossoverDetector::getFastPeriod() const { return fast_period_; }

int CrossoverDetector::getSlowPeriod() const { return slow_period_; }
