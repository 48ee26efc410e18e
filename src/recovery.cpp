#include "gazeclean/recovery.hpp"

#include "gazeclean/interval_index.hpp"
#include "gazeclean/signal.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace gazeclean {

std::vector<std::string> default_pupil_fields() {
  return {"pup_l", "pup_r", "pa_left", "pa_right"};
}

const char* recovery_status_name(RecoveryStatus s) {
  switch (s) {
    case RecoveryStatus::kExtended: return "extended";
    case RecoveryStatus::kAlreadyRecovered: return "already_recovered";
    case RecoveryStatus::kThresholdNotReached: return "threshold_not_reached";
    case RecoveryStatus::kWindowCollapsed: return "window_collapsed";
    case RecoveryStatus::kEndUnresolved: return "end_unresolved";
    case RecoveryStatus::kNoPupilChannel: return "no_pupil_channel";
  }
  return "unknown";
}

static void validate_options(const RecoveryOptions& opt) {
  if (opt.kernel_size < 1) throw std::runtime_error("RecoveryOptions: kernel_size must be >= 1");
  if (!std::isfinite(opt.z_thresh)) throw std::runtime_error("RecoveryOptions: z_thresh must be finite");
}

bool recovery_signal(const SampleTable& samples,
                     const RecoveryOptions& opt,
                     std::vector<double>* out,
                     std::string* field) {
  validate_options(opt);

  const std::unordered_set<std::string> known(opt.pupil_fields.begin(), opt.pupil_fields.end());
  int ch = -1;
  for (size_t c = 0; c < samples.channel_names.size(); ++c) {
    if (known.count(samples.channel_names[c]) != 0) {
      ch = static_cast<int>(c);
      break;
    }
  }
  if (ch < 0) return false;

  const std::vector<double>& trace = samples.data[static_cast<size_t>(ch)];
  if (out) *out = abs_zscore(lookahead_moving_average(gradient(trace), opt.kernel_size));
  if (field) *field = samples.channel_names[static_cast<size_t>(ch)];
  return true;
}

std::vector<RecoveryResult> compute_recovery_ends(const SampleTable& samples,
                                                  const EventTable& events,
                                                  const RecoveryOptions& opt) {
  validate_sample_table(samples);
  validate_options(opt);

  std::vector<RecoveryResult> results;
  results.reserve(events.size());
  for (const auto& ev : events) {
    RecoveryResult r;
    r.onset = ev.onset;
    r.original_duration = ev.duration;
    r.duration = ev.duration;
    results.push_back(r);
  }
  if (events.empty()) return results;

  std::vector<double> z;
  if (!recovery_signal(samples, opt, &z)) {
    for (auto& r : results) r.status = RecoveryStatus::kNoPupilChannel;
    return results;
  }

  const IntervalIndex index(samples);
  const size_t last = index.last_position();

  for (auto& r : results) {
    size_t s = 0;
    if (!index.last_covered_position(r.onset, r.original_duration, &s)) {
      r.status = RecoveryStatus::kEndUnresolved;
      continue;
    }
    r.end_position = s;
    r.recovery_position = s;

    const size_t e = (opt.window > last - s) ? last : s + opt.window;
    if (e == s) {
      r.status = RecoveryStatus::kWindowCollapsed;
      continue;
    }

    // First row in [s, e) where the settled-derivative criterion holds.
    size_t hit = e;
    for (size_t p = s; p < e; ++p) {
      if (z[p] < opt.z_thresh) {
        hit = p;
        break;
      }
    }
    if (hit == e) {
      r.status = RecoveryStatus::kThresholdNotReached;
      continue;
    }

    r.recovery_position = hit;
    const double candidate = index.key_at(hit) - r.onset;
    if (candidate > r.original_duration) {
      r.duration = candidate;
      r.status = RecoveryStatus::kExtended;
    } else {
      r.status = RecoveryStatus::kAlreadyRecovered;
    }
  }

  return results;
}

std::vector<RecoveryResult> adjust_recovery_ends_inplace(const SampleTable& samples,
                                                         EventTable* events,
                                                         const RecoveryOptions& opt) {
  if (!events) throw std::runtime_error("adjust_recovery_ends_inplace: events is null");

  std::vector<RecoveryResult> results = compute_recovery_ends(samples, *events, opt);
  for (size_t i = 0; i < events->size(); ++i) {
    GazeEvent& ev = (*events)[i];
    ev.duration = std::max(ev.duration, results[i].duration);
  }
  return results;
}

} // namespace gazeclean
