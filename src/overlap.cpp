#include "gazeclean/overlap.hpp"

#include "gazeclean/interval_index.hpp"

#include <cmath>
#include <stdexcept>

namespace gazeclean {

EventTable find_containing(const EventTable& outer,
                           const std::vector<double>& inner_onsets,
                           const std::vector<double>& inner_last_ends) {
  if (inner_onsets.size() != inner_last_ends.size()) {
    throw std::runtime_error("find_containing: onset and end vectors differ in length");
  }

  EventTable out;
  if (outer.empty() || inner_onsets.empty()) return out;

  for (const auto& ev : outer) {
    const double ev_end = ev.end();
    for (size_t i = 0; i < inner_onsets.size(); ++i) {
      if (std::isnan(inner_last_ends[i])) continue;
      if (intervals_overlap(ev.onset, ev_end, inner_onsets[i], inner_last_ends[i])) {
        out.push_back(ev);
        break;
      }
    }
  }
  return out;
}

EventTable find_nested_events(const SampleTable& samples,
                              const EventTable& outer,
                              const EventTable& inner) {
  if (outer.empty() || inner.empty()) return {};

  const IntervalIndex index(samples);
  std::vector<double> onsets;
  onsets.reserve(inner.size());
  for (const auto& ev : inner) onsets.push_back(ev.onset);

  return find_containing(outer, onsets, index.last_covered_keys(inner));
}

} // namespace gazeclean
