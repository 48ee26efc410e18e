#include "gazeclean/interval_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace gazeclean {

double IntervalIndex::key_at(size_t pos) const {
  if (pos >= time_.size()) {
    throw std::out_of_range("IntervalIndex::key_at: position " + std::to_string(pos) +
                            " outside table of " + std::to_string(time_.size()) + " rows");
  }
  return time_[pos];
}

bool IntervalIndex::in_range(double key) const {
  if (time_.empty() || !std::isfinite(key)) return false;
  return key >= time_.front() && key <= time_.back();
}

size_t IntervalIndex::floor_position(double key) const {
  if (time_.empty()) return 0;
  if (std::isnan(key)) return 0;
  const auto it = std::upper_bound(time_.begin(), time_.end(), key);
  if (it == time_.begin()) return 0;
  return static_cast<size_t>(std::distance(time_.begin(), it)) - 1;
}

size_t IntervalIndex::ceil_position(double key) const {
  if (time_.empty()) return 0;
  if (std::isnan(key)) return last_position();
  const auto it = std::lower_bound(time_.begin(), time_.end(), key);
  if (it == time_.end()) return last_position();
  return static_cast<size_t>(std::distance(time_.begin(), it));
}

bool IntervalIndex::find_exact(double key, size_t* pos) const {
  if (time_.empty() || !std::isfinite(key)) return false;
  const auto it = std::lower_bound(time_.begin(), time_.end(), key);
  if (it == time_.end() || *it != key) return false;
  if (pos) *pos = static_cast<size_t>(std::distance(time_.begin(), it));
  return true;
}

bool IntervalIndex::last_covered_position(double onset, double duration, size_t* pos) const {
  if (time_.empty()) return false;
  const double end = onset + duration;
  if (!std::isfinite(end)) return false;

  if (end > time_.back()) {
    if (pos) *pos = last_position();
    return true;
  }

  const size_t c = ceil_position(end);
  if (c == 0) return false;
  if (pos) *pos = c - 1;
  return true;
}

std::vector<double> IntervalIndex::last_covered_keys(const EventTable& events) const {
  std::vector<double> out;
  out.reserve(events.size());
  for (const auto& ev : events) {
    size_t p = 0;
    if (last_covered_position(ev.onset, ev.duration, &p)) {
      out.push_back(time_[p]);
    } else {
      out.push_back(std::numeric_limits<double>::quiet_NaN());
    }
  }
  return out;
}

bool IntervalIndex::rows_in_span(double onset, double duration, size_t* first, size_t* last) const {
  size_t a = 0;
  size_t b = 0;
  const double end = onset + duration;
  if (!time_.empty() && std::isfinite(onset) && std::isfinite(end) && end > onset) {
    a = static_cast<size_t>(
        std::distance(time_.begin(), std::lower_bound(time_.begin(), time_.end(), onset)));
    b = static_cast<size_t>(
        std::distance(time_.begin(), std::lower_bound(time_.begin(), time_.end(), end)));
  }
  if (first) *first = a;
  if (last) *last = (b > a) ? b : a;
  return b > a;
}

} // namespace gazeclean
