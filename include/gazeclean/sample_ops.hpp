#pragma once

#include "gazeclean/blink_mask.hpp"
#include "gazeclean/signal.hpp"
#include "gazeclean/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gazeclean {

// Row-level cleaning operations on a SampleTable.
//
// Functions returning a SampleTable work on a copy and never modify their
// input; the *_inplace variants modify the table they are given. Field names
// must exist in the table (std::runtime_error otherwise).

// Ascending, de-duplicated row positions whose time lies in
// [onset, onset + duration) of at least one event. Spans running past the
// table only contribute the rows that exist.
std::vector<size_t> event_row_positions(const SampleTable& samples, const EventTable& events);

// Same rows as event_row_positions(), as time keys.
std::vector<double> event_row_keys(const SampleTable& samples, const EventTable& events);

// Set fields to NaN at the given rows. Out-of-range rows are ignored.
void mask_rows_inplace(SampleTable* samples,
                       const std::vector<std::string>& fields,
                       const std::vector<size_t>& rows);
SampleTable mask_rows(const SampleTable& samples,
                      const std::vector<std::string>& fields,
                      const std::vector<size_t>& rows);

// Replace exact zeros (the EyeLink "no pupil" value) with NaN, per field.
SampleTable mask_zeros(const SampleTable& samples, const std::vector<std::string>& fields);

struct InterpolateOptions {
  // Weight by time key instead of row order (for non-uniform sampling).
  bool use_time_index{false};

  // Fill leading gaps with the first valid value and trailing gaps with the
  // last one (backward fill, then forward fill).
  bool fill_edges{true};
};

// Linear interpolation across NaN gaps, per field. A field without any finite
// value is left as it is.
void interpolate_missing_inplace(SampleTable* samples,
                                 const std::vector<std::string>& fields,
                                 const InterpolateOptions& opt = {});
SampleTable interpolate_missing(const SampleTable& samples,
                                const std::vector<std::string>& fields,
                                const InterpolateOptions& opt = {});

// mask_zeros() followed by interpolate_missing().
SampleTable interp_zeros(const SampleTable& samples,
                         const std::vector<std::string>& fields,
                         const InterpolateOptions& opt = {});

// NaN over every untrustworthy EyeLink interval (see blink_mask.hpp).
SampleTable mask_eyelink_blinks(const SampleTable& samples,
                                const EventTable& events,
                                const std::vector<std::string>& fields,
                                const BlinkMaskOptions& opt = {});

// mask_eyelink_blinks() followed by interpolate_missing().
SampleTable interp_eyelink_blinks(const SampleTable& samples,
                                  const EventTable& events,
                                  const std::vector<std::string>& fields,
                                  const BlinkMaskOptions& opt = {},
                                  const InterpolateOptions& interp = {});

// Zero-phase Butterworth low-pass of each field (see signal.hpp).
void lowpass_fields_inplace(SampleTable* samples,
                            const std::vector<std::string>& fields,
                            const LowpassOptions& opt = {});
SampleTable lowpass_fields(const SampleTable& samples,
                           const std::vector<std::string>& fields,
                           const LowpassOptions& opt = {});

} // namespace gazeclean
