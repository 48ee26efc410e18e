#include "gazeclean/blink_mask.hpp"

#include "gazeclean/event_ops.hpp"
#include "gazeclean/overlap.hpp"
#include "gazeclean/sample_ops.hpp"

#include <utility>

namespace gazeclean {

BlinkMaskReport eyelink_mask_report(const SampleTable& samples,
                                    const EventTable& events,
                                    const BlinkMaskOptions& opt) {
  BlinkMaskReport rep;

  EventTable blinks = select_events(events, opt.blink_kind);
  if (blinks.empty()) return rep;

  const EventTable saccades = find_nested_events(samples, select_events(events, opt.saccade_kind), blinks);

  rep.n_blinks = blinks.size();
  rep.n_saccades = saccades.size();
  rep.intervals = std::move(blinks);
  rep.intervals.insert(rep.intervals.end(), saccades.begin(), saccades.end());

  if (opt.find_recovery) {
    rep.recovery = adjust_recovery_ends_inplace(samples, &rep.intervals, opt.recovery);
  }
  return rep;
}

EventTable eyelink_mask_events(const SampleTable& samples,
                               const EventTable& events,
                               const BlinkMaskOptions& opt) {
  return eyelink_mask_report(samples, events, opt).intervals;
}

std::vector<size_t> eyelink_mask_rows(const SampleTable& samples,
                                      const EventTable& events,
                                      const BlinkMaskOptions& opt) {
  return event_row_positions(samples, eyelink_mask_events(samples, events, opt));
}

} // namespace gazeclean
