#include "gazeclean/running_stats.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <limits>

static bool approx(double a, double b, double eps = 1e-12) {
  return (a > b ? a - b : b - a) <= eps;
}

int main() {
  using namespace gazeclean;

  {
    RunningStats rs;
    rs.add(1.0);
    rs.add(2.0);
    rs.add(3.0);
    rs.add(4.0);

    assert(rs.n() == 4);
    assert(approx(rs.mean(), 2.5, 1e-12));

    // Population variance of [1,2,3,4] is 1.25.
    assert(approx(rs.variance_population(), 1.25, 1e-12));
    assert(approx(rs.stddev_population(), std::sqrt(1.25), 1e-12));
  }

  {
    RunningStats rs;
    rs.add(std::numeric_limits<double>::quiet_NaN());
    rs.add(std::numeric_limits<double>::infinity());
    rs.add(-std::numeric_limits<double>::infinity());
    rs.add(10.0);
    assert(rs.n() == 1);
    assert(approx(rs.mean(), 10.0, 1e-12));
    assert(approx(rs.variance_population(), 0.0, 1e-12));
  }

  {
    // Pupil traces with dropouts: only finite samples count.
    RunningStats rs;
    rs.add_all({3000.0, std::numeric_limits<double>::quiet_NaN(), 3010.0, 3020.0});
    assert(rs.n() == 3);
    assert(approx(rs.mean(), 3010.0, 1e-9));
    assert(approx(rs.variance_population(), 200.0 / 3.0, 1e-9));
  }

  {
    RunningStats rs;
    assert(std::isnan(rs.mean()));
    rs.add_all({});
    assert(rs.n() == 0);
  }

  std::cout << "test_running_stats OK\n";
  return 0;
}
