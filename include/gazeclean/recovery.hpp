#pragma once

#include "gazeclean/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gazeclean {

// Recovery-point search for contamination events (blinks and the saccades
// around them).
//
// EyeLink reports blink ends too early: the pupil trace keeps relaxing back to
// baseline for a while. The true recovery point is where the smoothed
// derivative of the pupil channel settles, measured as a global |z-score| of a
// look-ahead moving average of the gradient dropping below z_thresh.
//
// Durations only ever grow.

// Channel names recognized as pupil size (EyeLink area/diameter columns).
std::vector<std::string> default_pupil_fields();

struct RecoveryOptions {
  // |z| of the smoothed gradient must drop below this value.
  double z_thresh{0.1};

  // Rows searched from the reported end s: positions [s, min(s + window, last)).
  // The upper bound is excluded, so the last row of the table is never a
  // recovery point and an end on the last row performs no search.
  size_t window{1000};

  // Rows averaged together (x[i .. i+kernel_size-1]) before z-scoring.
  size_t kernel_size{100};

  // Recognized pupil channels. The first table column (in column order) that
  // appears here drives the search.
  std::vector<std::string> pupil_fields = default_pupil_fields();
};

enum class RecoveryStatus {
  kExtended,             // recovery point found past the reported end
  kAlreadyRecovered,     // threshold met at or before the reported end
  kThresholdNotReached,  // no qualifying row within the window
  kWindowCollapsed,      // reported end is the last row; nothing to search
  kEndUnresolved,        // end time maps to no row (non-finite, before the table)
  kNoPupilChannel,       // table has no recognized pupil channel
};

const char* recovery_status_name(RecoveryStatus s);

struct RecoveryResult {
  RecoveryStatus status{RecoveryStatus::kEndUnresolved};

  double onset{0.0};
  double original_duration{0.0};
  double duration{0.0};  // >= original_duration

  // Row of the reported end (last covered sample) and of the new end; only
  // meaningful when the end was resolved.
  size_t end_position{0};
  size_t recovery_position{0};

  bool changed() const { return duration > original_duration; }
};

// |z| of the look-ahead smoothed pupil gradient for every row.
//
// Returns false (and leaves out untouched) when the table has no recognized
// pupil channel. field receives the chosen channel name when non-null.
bool recovery_signal(const SampleTable& samples,
                     const RecoveryOptions& opt,
                     std::vector<double>* out,
                     std::string* field = nullptr);

// Compute adjusted durations without touching events.
//
// One result per event, in order. Failures are per event; the batch never
// throws for an individual event. Throws std::runtime_error for invalid
// options or an invalid sample table.
std::vector<RecoveryResult> compute_recovery_ends(const SampleTable& samples,
                                                  const EventTable& events,
                                                  const RecoveryOptions& opt = {});

// Apply compute_recovery_ends() to events in place (onsets are preserved) and
// return the per-event results.
std::vector<RecoveryResult> adjust_recovery_ends_inplace(const SampleTable& samples,
                                                         EventTable* events,
                                                         const RecoveryOptions& opt = {});

} // namespace gazeclean
