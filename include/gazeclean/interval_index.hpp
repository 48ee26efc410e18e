#pragma once

#include "gazeclean/types.hpp"

#include <cstddef>
#include <vector>

namespace gazeclean {

// Translation between time keys and row positions of a SampleTable.
//
// The index borrows the table; it must not outlive it. Lookups never throw for
// keys outside the recorded range: they clamp to the nearest boundary row and
// callers use in_range() when they need to tell the difference.
class IntervalIndex {
public:
  explicit IntervalIndex(const SampleTable& samples) : time_(samples.time) {}

  // The index borrows the table's time column; a temporary would dangle.
  explicit IntervalIndex(SampleTable&&) = delete;

  size_t size() const { return time_.size(); }
  bool empty() const { return time_.empty(); }
  size_t last_position() const { return time_.empty() ? 0 : time_.size() - 1; }

  // Time key of a row. Throws std::out_of_range for an invalid position.
  double key_at(size_t pos) const;

  bool in_range(double key) const;

  // Last row with time <= key (0 when key precedes the table).
  size_t floor_position(double key) const;

  // First row with time >= key (last row when key follows the table).
  size_t ceil_position(double key) const;

  // Exact lookup; false when key is not a time key of the table.
  bool find_exact(double key, size_t* pos) const;

  // Position of the last sample covered by an event [onset, onset + duration).
  //
  // The end time normally has a sample at or after it; the ceiling row is then
  // stepped back by one so the sample at the end itself is not counted. When
  // the end lies past the last time key the last row is used as-is.
  //
  // Returns false when the end cannot be resolved: empty table, non-finite
  // arithmetic, or no sample before the end.
  bool last_covered_position(double onset, double duration, size_t* pos) const;

  // Time key of the last covered sample for every event (NaN if unresolvable).
  std::vector<double> last_covered_keys(const EventTable& events) const;

  // Half-open row range [*first, *last) of rows with time in [onset, onset + duration).
  // Returns false (and an empty range) when no row falls inside the span.
  bool rows_in_span(double onset, double duration, size_t* first, size_t* last) const;

private:
  const std::vector<double>& time_;
};

} // namespace gazeclean
