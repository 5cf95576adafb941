#ifndef EMACROSSWATCH_CROSSOVERDETECTOR_H
#define EMACROSSWATCH_CROSSOVERDETECTOR_H

#include <cstddef>
#include <span>

#include "common/Types.h"

// Classifies the fast/slow EMA transition between the trailing window of
// (slow + 5) closes and the same-sized window ending one close earlier.
class CrossoverDetector {
 public:
  static constexpr std::size_t kStabilityMargin = 5;

  CrossoverDetector(int fast_period, int slow_period);

  [[nodiscard]] CrossoverResult detect(std::span<const Price> closes) const;

  [[nodiscard]] std::size_t getWindowSize() const;
  [[nodiscard]] int getFastPeriod() const;
  [[nodiscard]] int getSlowPeriod() const;

 private:
  int fast_period_;
  int slow_period_;
};

#endif  // EMACROSSWATCH_CROSSOVERDETECTOR_H
