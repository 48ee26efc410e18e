#include "gazeclean/signal.hpp"

#include "test_support.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

static bool approx(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace gazeclean;

  // 1) gradient: one-sided at the edges, central inside
  {
    const std::vector<double> g = gradient({1.0, 2.0, 4.0, 7.0, 11.0});
    assert(g.size() == 5);
    assert(approx(g[0], 1.0));
    assert(approx(g[1], 1.5));
    assert(approx(g[2], 2.5));
    assert(approx(g[3], 3.5));
    assert(approx(g[4], 4.0));

    assert(gradient({}).empty());
    const std::vector<double> one = gradient({5.0});
    assert(one.size() == 1 && one[0] == 0.0);
  }

  // 2) look-ahead moving average
  {
    const std::vector<double> m = lookahead_moving_average({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    assert(m.size() == 5);
    assert(approx(m[0], 2.0));
    assert(approx(m[1], 3.0));
    assert(approx(m[2], 4.0));
    assert(std::isnan(m[3]));
    assert(std::isnan(m[4]));

    const std::vector<double> same = lookahead_moving_average({1.0, -2.0, 3.0}, 1);
    assert(approx(same[0], 1.0) && approx(same[1], -2.0) && approx(same[2], 3.0));

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> gap = lookahead_moving_average({1.0, nan, 3.0, 4.0, 5.0, 6.0}, 2);
    assert(std::isnan(gap[0]));
    assert(std::isnan(gap[1]));
    assert(approx(gap[2], 3.5));
    assert(approx(gap[4], 5.5));
    assert(std::isnan(gap[5]));

    const std::vector<double> short_in = lookahead_moving_average({1.0, 2.0}, 5);
    assert(short_in.size() == 2 && std::isnan(short_in[0]) && std::isnan(short_in[1]));

    bool threw = false;
    try {
      (void)lookahead_moving_average({1.0}, 0);
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  // 3) |z| with population statistics; NaN ignored
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> z = abs_zscore({1.0, 3.0, nan});
    assert(approx(z[0], 1.0));
    assert(approx(z[1], 1.0));
    assert(std::isnan(z[2]));

    // Flat input: zero variance => never below any threshold
    const std::vector<double> flat = abs_zscore({2.0, 2.0, 2.0});
    for (double v : flat) assert(std::isinf(v) && v > 0.0);
  }

  // 4) low-pass: slow drift kept, fast oscillation removed
  {
    const size_t n = 2000;
    const double pi = 3.141592653589793238462643383279502884;
    std::vector<double> slow(n);
    std::vector<double> fast(n);
    for (size_t i = 0; i < n; ++i) {
      slow[i] = 5.0 + std::sin(2.0 * pi * 0.002 * static_cast<double>(i));
      fast[i] = 5.0 + std::sin(2.0 * pi * 0.2 * static_cast<double>(i));
    }

    LowpassOptions opt;
    opt.cutoff = 0.05;
    opt.order = 4;
    const std::vector<double> ys = lowpass_filter(slow, opt);
    const std::vector<double> yf = lowpass_filter(fast, opt);

    double err_slow = 0.0;
    double dev_fast = 0.0;
    for (size_t i = 200; i < n - 200; ++i) {
      err_slow = std::max(err_slow, std::fabs(ys[i] - slow[i]));
      dev_fast = std::max(dev_fast, std::fabs(yf[i] - 5.0));
    }
    assert(err_slow < 0.05);
    assert(dev_fast < 0.01);

    bool threw = false;
    try {
      (void)lowpass_filter({1.0, std::numeric_limits<double>::quiet_NaN(), 2.0}, opt);
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_signal OK\n";
  return 0;
}
