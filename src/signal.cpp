#include "gazeclean/signal.hpp"

#include "gazeclean/biquad.hpp"
#include "gazeclean/running_stats.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace gazeclean {

std::vector<double> gradient(const std::vector<double>& x) {
  const size_t n = x.size();
  std::vector<double> g(n, 0.0);
  if (n < 2) return g;

  g[0] = x[1] - x[0];
  for (size_t i = 1; i + 1 < n; ++i) {
    g[i] = 0.5 * (x[i + 1] - x[i - 1]);
  }
  g[n - 1] = x[n - 1] - x[n - 2];
  return g;
}

std::vector<double> lookahead_moving_average(const std::vector<double>& x, size_t kernel) {
  if (kernel < 1) throw std::runtime_error("lookahead_moving_average: kernel must be >= 1");

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const size_t n = x.size();
  std::vector<double> out(n, nan);
  if (n < kernel) return out;

  // Sliding sum over x[i .. i+kernel-1], walking backwards from the end.
  // Non-finite values are counted so windows touching them come out NaN.
  double sum = 0.0;
  size_t bad = 0;
  for (size_t j = n - kernel; j < n; ++j) {
    if (std::isfinite(x[j])) sum += x[j];
    else ++bad;
  }

  const double k = static_cast<double>(kernel);
  for (size_t i = n - kernel + 1; i-- > 0;) {
    if (i + kernel < n) {
      const double in = x[i];
      const double outgoing = x[i + kernel];
      if (std::isfinite(in)) sum += in;
      else ++bad;
      if (std::isfinite(outgoing)) sum -= outgoing;
      else --bad;
    }
    out[i] = (bad == 0) ? sum / k : nan;
  }
  return out;
}

std::vector<double> abs_zscore(const std::vector<double>& x) {
  RunningStats rs;
  rs.add_all(x);

  const double mean = rs.mean();
  const double sd = rs.stddev_population();
  const bool degenerate = !(std::isfinite(sd) && sd > 0.0);

  std::vector<double> z(x.size(), std::numeric_limits<double>::quiet_NaN());
  for (size_t i = 0; i < x.size(); ++i) {
    if (!std::isfinite(x[i])) continue;
    z[i] = degenerate ? std::numeric_limits<double>::infinity() : std::fabs((x[i] - mean) / sd);
  }
  return z;
}

std::vector<double> lowpass_filter(const std::vector<double>& x, const LowpassOptions& opt) {
  for (double v : x) {
    if (!std::isfinite(v)) {
      throw std::runtime_error("lowpass_filter: trace contains missing values; interpolate first");
    }
  }

  const std::vector<BiquadCoeffs> stages = design_butterworth_lowpass(opt.order, opt.cutoff);

  std::vector<double> y = x;
  filtfilt_inplace(&y, stages);
  return y;
}

} // namespace gazeclean
