/**
 * @file metric.hpp
 * @brief Трёхточечная метрика: доля чистых нажатий -> severity [0, 1]
 *
 * Кусочно-линейная функция с точками lo <= mid <= hi:
 *   x <= lo        -> 0.0
 *   lo < x <= mid  -> [0.0, 0.5]
 *   mid < x <= hi  -> [0.5, 1.0]
 *   x > hi         -> 1.0
 */

#pragma once

#include <optional>

namespace linkage {

class TriplePoint {
public:
  /**
   * @brief Строит метрику
   * @return std::nullopt (InvalidRange), если не 0 <= lo <= mid <= hi <= 1
   */
  [[nodiscard]] static std::optional<TriplePoint> create(double lo, double mid,
                                                         double hi) noexcept;

  /// Равномерная метрика (0.25, 0.5, 0.75)
  [[nodiscard]] static constexpr TriplePoint default_metric() noexcept {
    return TriplePoint{0.25, 0.5, 0.75};
  }

  /// Значение метрики для доли x
  [[nodiscard]] double value(double x) const noexcept;

  [[nodiscard]] constexpr double lo() const noexcept { return lo_; }
  [[nodiscard]] constexpr double mid() const noexcept { return mid_; }
  [[nodiscard]] constexpr double hi() const noexcept { return hi_; }

private:
  constexpr TriplePoint(double lo, double mid, double hi) noexcept
      : lo_{lo}, mid_{mid}, hi_{hi} {}

  double lo_;
  double mid_;
  double hi_;
};

} // namespace linkage
