#include "PeriodEMA.h"

#include <format>
#include <stdexcept>

PeriodEMA::PeriodEMA(int period) : period_(period) {
  if (period <= 0) {
    throw std::invalid_argument(
        std::format("EMA period must be positive, got {}", period));
  }
  multiplier_ = 2.0 / (static_cast<double>(period) + 1.0);
}

std::optional<Price> PeriodEMA::update(Price price) {
  const auto period = static_cast<std::size_t>(period_);

  if (samples_ < period) {
    seed_sum_ += price;
    ++samples_;
    if (samples_ < period) {
      return std::nullopt;
    }
    current_ema_ = seed_sum_ / static_cast<double>(period_);
    return current_ema_;
  }

  ++samples_;
  current_ema_ = (price - current_ema_) * multiplier_ + current_ema_;
  return current_ema_;
}

std::optional<Price> PeriodEMA::getCurrentValue() const {
  if (samples_ < static_cast<std::size_t>(period_)) {
    return std::nullopt;
  }
  return current_ema_;
}

int PeriodEMA::getPeriod() const { return period_; }

std::optional<Price> CalculateEma(std::span<const Price> prices, int period) {
  PeriodEMA ema(period);
  std::optional<Price> result;
  for (const Price price : prices) {
    result = ema.update(price);
  }
  return result;
}
