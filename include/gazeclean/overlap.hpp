#pragma once

#include "gazeclean/types.hpp"

#include <vector>

namespace gazeclean {

// Inclusive interval overlap: touching endpoints count.
//
// Symmetric in its two intervals. NaN bounds never overlap.
inline bool intervals_overlap(double a_onset, double a_end, double b_onset, double b_end) {
  return b_onset <= a_end && b_end >= a_onset;
}

// Events of outer that overlap at least one (inner_onsets[i], inner_last_ends[i]) pair.
//
// outer spans are [onset, onset + duration]. Pairs whose end is NaN are skipped.
// O(|outer| * |inner|); event counts are small compared with sample counts.
// Throws std::runtime_error if the two inner vectors differ in length.
EventTable find_containing(const EventTable& outer,
                           const std::vector<double>& inner_onsets,
                           const std::vector<double>& inner_last_ends);

// Events of outer that contain or overlap events of inner.
//
// Inner spans run from their onset to the time key of their last covered
// sample (see IntervalIndex::last_covered_position). This is how EyeLink
// saccades that embed a blink are found: data in such saccades is unreliable
// even outside the blink itself.
EventTable find_nested_events(const SampleTable& samples,
                              const EventTable& outer,
                              const EventTable& inner);

} // namespace gazeclean
