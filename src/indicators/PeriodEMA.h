#ifndef EMACROSSWATCH_PERIODEMA_H
#define EMACROSSWATCH_PERIODEMA_H

#include <cstddef>
#include <optional>
#include <span>

#include "common/Types.h"

// Sample-count EMA with a simple-moving-average seed over the first
// `period` prices, then ema += (price - ema) * 2 / (period + 1).
class PeriodEMA {
 public:
  explicit PeriodEMA(int period);
  std::optional<Price> update(Price price);

  [[nodiscard]] std::optional<Price> getCurrentValue() const;
  [[nodiscard]] int getPeriod() const;

 private:
  int period_;
  double multiplier_;
  std::size_t samples_ = 0;
  Price seed_sum_ = 0;
  Price current_ema_ = 0;
};

// Left-to-right fold over the whole sequence. std::nullopt while the
// sequence is shorter than the period. Throws std::invalid_argument for
// period <= 0.
std::optional<Price> CalculateEma(std::span<const Price> prices, int period);

#endif  // EMACROSSWATCH_PERIODEMA_H
