#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace gazeclean {

// Numerically-stable running mean/variance accumulator (Welford's algorithm).
//
// Notes:
// - add(x) ignores non-finite values, so NaN gaps in a gaze trace (lost
//   tracking) and the undefined tail of a windowed average do not poison the
//   statistics.
// - variance_population() uses n in the denominator and returns NaN if n < 1.
class RunningStats {
public:
  void add(double x) {
    if (!std::isfinite(x)) return;
    ++n_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    m2_ += delta * (x - mean_);
  }

  void add_all(const std::vector<double>& xs) {
    for (double x : xs) add(x);
  }

  size_t n() const { return n_; }
  double mean() const { return (n_ == 0) ? std::numeric_limits<double>::quiet_NaN() : mean_; }

  double variance_population() const {
    if (n_ < 1) return std::numeric_limits<double>::quiet_NaN();
    return m2_ / static_cast<double>(n_);
  }

  double stddev_population() const {
    const double v = variance_population();
    return std::isfinite(v) ? std::sqrt(v) : v;
  }

private:
  size_t n_{0};
  double mean_{0.0};
  double m2_{0.0};
};

} // namespace gazeclean
