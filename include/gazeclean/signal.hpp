#pragma once

#include <cstddef>
#include <vector>

namespace gazeclean {

// Shared signal helpers for gaze/pupil traces.
//
// All helpers work on row order (unit spacing), not on time keys.

// Discrete gradient with unit spacing.
//
// - interior: central difference (x[i+1] - x[i-1]) / 2
// - edges: one-sided difference
// - fewer than 2 samples: all zeros
std::vector<double> gradient(const std::vector<double>& x);

// Look-ahead moving average: out[i] = mean(x[i .. i+kernel-1]).
//
// Positions where fewer than kernel values remain (the last kernel-1 rows) are
// NaN, as are windows containing a NaN. Throws std::runtime_error if kernel < 1.
std::vector<double> lookahead_moving_average(const std::vector<double>& x, size_t kernel);

// |x - mean| / stddev with population statistics over the finite values of x.
//
// Non-finite inputs stay NaN. When the variance is zero or undefined (flat or
// empty signal) every output is +infinity, i.e. no value ever falls below a
// threshold.
std::vector<double> abs_zscore(const std::vector<double>& x);

struct LowpassOptions {
  // Butterworth order (>= 1).
  size_t order{5};

  // Cutoff as a fraction of the Nyquist frequency of the sample grid, in (0, 1).
  double cutoff{0.01};
};

// Zero-phase Butterworth low-pass of one trace.
//
// Throws std::runtime_error on invalid options or when x contains non-finite
// values (mask + interpolate gaps first).
std::vector<double> lowpass_filter(const std::vector<double>& x, const LowpassOptions& opt);

} // namespace gazeclean
