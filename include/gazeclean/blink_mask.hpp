#pragma once

#include "gazeclean/recovery.hpp"
#include "gazeclean/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gazeclean {

// Untrustworthy intervals of an EyeLink recording.
//
// Per the EyeLink documentation, blink events are untrustworthy and so is the
// whole of any saccade that contains a blink. Optionally each interval's end is
// pushed forward to the pupil recovery point (see recovery.hpp).

struct BlinkMaskOptions {
  std::string blink_kind{"EBLINK"};
  std::string saccade_kind{"ESACC"};

  // Extend interval ends with adjust_recovery_ends_inplace().
  bool find_recovery{true};
  RecoveryOptions recovery{};
};

struct BlinkMaskReport {
  // Blink events first, then the saccades that overlap a blink; each keeps
  // its own onset and (possibly extended) duration.
  EventTable intervals;

  size_t n_blinks{0};
  size_t n_saccades{0};

  // One entry per interval when find_recovery is set, empty otherwise.
  std::vector<RecoveryResult> recovery;
};

BlinkMaskReport eyelink_mask_report(const SampleTable& samples,
                                    const EventTable& events,
                                    const BlinkMaskOptions& opt = {});

// Unified interval set; empty when there are no blink events.
EventTable eyelink_mask_events(const SampleTable& samples,
                               const EventTable& events,
                               const BlinkMaskOptions& opt = {});

// Row positions covered by eyelink_mask_events().
std::vector<size_t> eyelink_mask_rows(const SampleTable& samples,
                                      const EventTable& events,
                                      const BlinkMaskOptions& opt = {});

} // namespace gazeclean
