#include "gazeclean/sample_ops.hpp"

#include "test_support.hpp"
#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gazeclean;

static bool near(double a, double b, double eps = 1e-12) { return std::fabs(a - b) <= eps; }

static SampleTable make_table(const std::vector<double>& t,
                              const std::vector<std::string>& names,
                              const std::vector<std::vector<double>>& cols) {
  SampleTable s;
  s.time = t;
  s.channel_names = names;
  s.data = cols;
  return s;
}

static std::vector<double> iota_times(size_t n) {
  std::vector<double> t;
  for (size_t i = 0; i < n; ++i) t.push_back(static_cast<double>(i));
  return t;
}

static bool same_column(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::isnan(a[i]) != std::isnan(b[i])) return false;
    if (!std::isnan(a[i]) && a[i] != b[i]) return false;
  }
  return true;
}

int main() {
  const double nan = std::nan("");

  // 1) Row expansion is half-open and clipped to the table.
  {
    const SampleTable s = make_table(iota_times(10), {"x"}, {std::vector<double>(10, 1.0)});
    assert((event_row_positions(s, {{8.0, 100.0, "EBLINK"}}) == std::vector<size_t>{8, 9}));
    assert((event_row_positions(s, {{2.0, 2.0, "A"}, {3.0, 2.0, "B"}}) == std::vector<size_t>{2, 3, 4}));
    assert(event_row_positions(s, {{20.0, 5.0, "A"}}).empty());
    assert((event_row_keys(s, {{2.5, 2.0, "A"}}) == std::vector<double>{3.0, 4.0}));
  }

  // 2) Masking touches only the named fields and is idempotent.
  {
    const SampleTable s = make_table(iota_times(5), {"x", "y"},
                                     {{1, 2, 3, 4, 5}, {6, 7, 8, 9, 10}});
    const SampleTable once = mask_rows(s, {"x"}, {1, 3, 99});
    assert(std::isnan(once.data[0][1]));
    assert(std::isnan(once.data[0][3]));
    assert(once.data[0][0] == 1.0);
    assert(once.data[1][1] == 7.0);
    assert(s.data[0][1] == 2.0);

    const SampleTable twice = mask_rows(once, {"x"}, {1, 3});
    assert(same_column(once.data[0], twice.data[0]));

    bool threw = false;
    try {
      (void)mask_rows(s, {"nope"}, {0});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // 3) Interpolation: interior linear, edges filled with the nearest value.
  {
    const SampleTable s = make_table(iota_times(5), {"p"}, {{nan, nan, 5.0, 10.0, nan}});
    const SampleTable out = interpolate_missing(s, {"p"});
    assert((out.data[0] == std::vector<double>{5.0, 5.0, 5.0, 10.0, 10.0}));
    assert(std::isnan(s.data[0][0]));

    const SampleTable gap = make_table(iota_times(5), {"p"}, {{0.0, nan, nan, nan, 8.0}});
    const SampleTable g = interpolate_missing(gap, {"p"});
    assert(near(g.data[0][1], 2.0));
    assert(near(g.data[0][2], 4.0));
    assert(near(g.data[0][3], 6.0));

    InterpolateOptions no_edges;
    no_edges.fill_edges = false;
    const SampleTable ne = interpolate_missing(s, {"p"}, no_edges);
    assert(std::isnan(ne.data[0][0]));
    assert(std::isnan(ne.data[0][4]));

    // A column with no finite value stays as it is.
    const SampleTable empty = make_table(iota_times(3), {"p"}, {{nan, nan, nan}});
    assert(std::isnan(interpolate_missing(empty, {"p"}).data[0][1]));

    // Nothing missing: unchanged.
    const SampleTable full = make_table(iota_times(3), {"p"}, {{1.0, 4.0, 2.0}});
    assert(interpolate_missing(full, {"p"}).data == full.data);
  }

  // 4) Time-weighted interpolation for uneven sampling.
  {
    const SampleTable s = make_table({0.0, 1.0, 3.0}, {"p"}, {{0.0, nan, 3.0}});
    assert(near(interpolate_missing(s, {"p"}).data[0][1], 1.5));
    InterpolateOptions opt;
    opt.use_time_index = true;
    assert(near(interpolate_missing(s, {"p"}, opt).data[0][1], 1.0));
  }

  // 5) Zeros are masked per field, then filled back in.
  {
    const SampleTable s = make_table(iota_times(4), {"pup_l", "gaze_x"},
                                     {{10.0, 0.0, 0.0, 10.0}, {0.0, 1.0, 2.0, 3.0}});
    const SampleTable masked = mask_zeros(s, {"pup_l"});
    assert(std::isnan(masked.data[0][1]));
    assert(std::isnan(masked.data[0][2]));
    assert(masked.data[1][0] == 0.0);

    const SampleTable filled = interp_zeros(s, {"pup_l"});
    assert((filled.data[0] == std::vector<double>{10.0, 10.0, 10.0, 10.0}));
    assert(filled.data[1][0] == 0.0);
  }

  // 6) Blink masking and interpolation end to end.
  {
    std::vector<double> pup = {5, 5, 0, 0, 0, 5, 5, 5, 5, 5};
    const SampleTable s = make_table(iota_times(10), {"pup_l"}, {pup});
    const EventTable evs = {{2.0, 1.0, "EBLINK"}, {1.0, 3.0, "ESACC"}, {6.0, 2.0, "ESACC"}};
    BlinkMaskOptions opt;
    opt.find_recovery = false;

    const SampleTable masked = mask_eyelink_blinks(s, evs, {"pup_l"}, opt);
    assert(masked.data[0][0] == 5.0);
    assert(std::isnan(masked.data[0][1]));
    assert(std::isnan(masked.data[0][2]));
    assert(std::isnan(masked.data[0][3]));
    assert(masked.data[0][4] == 0.0);

    const SampleTable filled = interp_eyelink_blinks(s, evs, {"pup_l"}, opt);
    assert(near(filled.data[0][1], 3.75));
    assert(near(filled.data[0][2], 2.5));
    assert(near(filled.data[0][3], 1.25));

    // No blink events: the table comes back unchanged.
    const SampleTable none = mask_eyelink_blinks(s, {{1.0, 3.0, "ESACC"}}, {"pup_l"}, opt);
    assert(none.data == s.data);
  }

  // 7) Low-pass of a constant trace keeps it constant; NaN is rejected.
  {
    const SampleTable s = make_table(iota_times(200), {"p"}, {std::vector<double>(200, 7.0)});
    const SampleTable out = lowpass_fields(s, {"p"});
    for (double v : out.data[0]) assert(near(v, 7.0, 1e-9));

    SampleTable bad = s;
    bad.data[0][10] = nan;
    bool threw = false;
    try {
      lowpass_fields_inplace(&bad, {"p"});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_sample_ops OK\n";
  return 0;
}
