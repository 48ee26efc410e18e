#include "gazeclean/sample_ops.hpp"

#include "gazeclean/interval_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace gazeclean {
namespace {

std::vector<size_t> resolve_fields(const SampleTable& samples,
                                   const std::vector<std::string>& fields,
                                   const char* what) {
  std::vector<size_t> out;
  out.reserve(fields.size());
  for (const auto& f : fields) {
    const int ch = samples.channel_index(f);
    if (ch < 0) throw std::runtime_error(std::string(what) + ": unknown field '" + f + "'");
    out.push_back(static_cast<size_t>(ch));
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

// Linear interpolation of the NaN runs between finite values of y.
// x is the abscissa (row order or time keys).
void interpolate_trace(std::vector<double>* y, const std::vector<double>* x, bool fill_edges) {
  const size_t n = y->size();
  auto abscissa = [x](size_t i) { return x ? (*x)[i] : static_cast<double>(i); };

  size_t first_valid = n;
  size_t prev = n;
  for (size_t i = 0; i < n; ++i) {
    if (!std::isfinite((*y)[i])) continue;
    if (first_valid == n) first_valid = i;
    if (prev != n && i > prev + 1) {
      const double x0 = abscissa(prev);
      const double x1 = abscissa(i);
      const double y0 = (*y)[prev];
      const double y1 = (*y)[i];
      for (size_t k = prev + 1; k < i; ++k) {
        const double t = (abscissa(k) - x0) / (x1 - x0);
        (*y)[k] = y0 + t * (y1 - y0);
      }
    }
    prev = i;
  }

  if (first_valid == n || !fill_edges) return;

  for (size_t i = 0; i < first_valid; ++i) (*y)[i] = (*y)[first_valid];
  for (size_t i = prev + 1; i < n; ++i) (*y)[i] = (*y)[prev];
}

} // namespace

std::vector<size_t> event_row_positions(const SampleTable& samples, const EventTable& events) {
  const IntervalIndex index(samples);
  std::vector<size_t> rows;
  for (const auto& ev : events) {
    size_t a = 0;
    size_t b = 0;
    if (!index.rows_in_span(ev.onset, ev.duration, &a, &b)) continue;
    for (size_t p = a; p < b; ++p) rows.push_back(p);
  }
  std::sort(rows.begin(), rows.end());
  rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
  return rows;
}

std::vector<double> event_row_keys(const SampleTable& samples, const EventTable& events) {
  const std::vector<size_t> rows = event_row_positions(samples, events);
  std::vector<double> keys;
  keys.reserve(rows.size());
  for (size_t r : rows) keys.push_back(samples.time[r]);
  return keys;
}

void mask_rows_inplace(SampleTable* samples,
                       const std::vector<std::string>& fields,
                       const std::vector<size_t>& rows) {
  if (!samples) throw std::runtime_error("mask_rows_inplace: samples is null");
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (size_t ch : resolve_fields(*samples, fields, "mask_rows")) {
    auto& col = samples->data[ch];
    for (size_t r : rows) {
      if (r < col.size()) col[r] = nan;
    }
  }
}

SampleTable mask_rows(const SampleTable& samples,
                      const std::vector<std::string>& fields,
                      const std::vector<size_t>& rows) {
  SampleTable out = samples;
  mask_rows_inplace(&out, fields, rows);
  return out;
}

SampleTable mask_zeros(const SampleTable& samples, const std::vector<std::string>& fields) {
  SampleTable out = samples;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (size_t ch : resolve_fields(out, fields, "mask_zeros")) {
    for (double& v : out.data[ch]) {
      if (v == 0.0) v = nan;
    }
  }
  return out;
}

void interpolate_missing_inplace(SampleTable* samples,
                                 const std::vector<std::string>& fields,
                                 const InterpolateOptions& opt) {
  if (!samples) throw std::runtime_error("interpolate_missing_inplace: samples is null");
  const std::vector<size_t> chans = resolve_fields(*samples, fields, "interpolate_missing");
  if (opt.use_time_index) validate_sample_table(*samples);

  for (size_t ch : chans) {
    interpolate_trace(&samples->data[ch], opt.use_time_index ? &samples->time : nullptr, opt.fill_edges);
  }
}

SampleTable interpolate_missing(const SampleTable& samples,
                                const std::vector<std::string>& fields,
                                const InterpolateOptions& opt) {
  SampleTable out = samples;
  interpolate_missing_inplace(&out, fields, opt);
  return out;
}

SampleTable interp_zeros(const SampleTable& samples,
                         const std::vector<std::string>& fields,
                         const InterpolateOptions& opt) {
  SampleTable out = mask_zeros(samples, fields);
  interpolate_missing_inplace(&out, fields, opt);
  return out;
}

SampleTable mask_eyelink_blinks(const SampleTable& samples,
                                const EventTable& events,
                                const std::vector<std::string>& fields,
                                const BlinkMaskOptions& opt) {
  return mask_rows(samples, fields, eyelink_mask_rows(samples, events, opt));
}

SampleTable interp_eyelink_blinks(const SampleTable& samples,
                                  const EventTable& events,
                                  const std::vector<std::string>& fields,
                                  const BlinkMaskOptions& opt,
                                  const InterpolateOptions& interp) {
  SampleTable out = mask_eyelink_blinks(samples, events, fields, opt);
  interpolate_missing_inplace(&out, fields, interp);
  return out;
}

void lowpass_fields_inplace(SampleTable* samples,
                            const std::vector<std::string>& fields,
                            const LowpassOptions& opt) {
  if (!samples) throw std::runtime_error("lowpass_fields_inplace: samples is null");
  for (size_t ch : resolve_fields(*samples, fields, "lowpass_fields")) {
    samples->data[ch] = lowpass_filter(samples->data[ch], opt);
  }
}

SampleTable lowpass_fields(const SampleTable& samples,
                           const std::vector<std::string>& fields,
                           const LowpassOptions& opt) {
  SampleTable out = samples;
  lowpass_fields_inplace(&out, fields, opt);
  return out;
}

} // namespace gazeclean
