/**
 * @file metric.cpp
 * @brief Реализация трёхточечной метрики
 */

#include "linkage/metric.hpp"

#include <algorithm>
#include <cmath>

namespace linkage {

std::optional<TriplePoint> TriplePoint::create(double lo, double mid,
                                               double hi) noexcept {
  // Сравнения с NaN ложны, поэтому NaN тоже отсекается
  if (!(lo >= 0.0 && lo <= mid && mid <= hi && hi <= 1.0)) {
    return std::nullopt;
  }
  return TriplePoint{lo, mid, hi};
}

double TriplePoint::value(double x) const noexcept {
  if (std::isnan(x) || x <= lo_) {
    return 0.0;
  }
  if (x <= mid_) {
    return 0.5 * (x - lo_) / (mid_ - lo_);
  }
  if (x <= hi_) {
    return std::clamp(0.5 + 0.5 * (x - mid_) / (hi_ - mid_), 0.5, 1.0);
  }
  return 1.0;
}

} // namespace linkage
