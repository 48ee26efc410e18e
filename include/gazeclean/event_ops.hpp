#pragma once

#include "gazeclean/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace gazeclean {

// Small helpers for working with EventTable vectors.
//
// Event tables come from recorder logs and CSV sidecars. Within one kind the
// onset is the key, so duplicates (same kind, same onset) are collapsed.

namespace detail {

inline std::string trim_ws(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

// Quantize a time key to 1e-6 of its unit to avoid float equality issues.
inline int64_t quantize_key(double t) {
  if (!std::isfinite(t)) return 0;
  return static_cast<int64_t>(std::llround(t * 1e6));
}

} // namespace detail

// Sort events deterministically.
//
// Ordering:
//   1) onset (ascending)
//   2) kind (ascending)
//   3) duration (descending)
inline void sort_events(EventTable* events) {
  if (!events) return;
  std::stable_sort(events->begin(), events->end(), [](const GazeEvent& a, const GazeEvent& b) {
    const int64_t aon = detail::quantize_key(a.onset);
    const int64_t bon = detail::quantize_key(b.onset);
    if (aon != bon) return aon < bon;
    if (a.kind != b.kind) return a.kind < b.kind;
    return detail::quantize_key(a.duration) > detail::quantize_key(b.duration);
  });
}

// Normalize events in-place:
// - drops events with a non-finite onset
// - clamps negative/NaN durations to 0
// - trims kind
inline void normalize_events(EventTable* events) {
  if (!events) return;
  EventTable out;
  out.reserve(events->size());
  for (auto& ev : *events) {
    if (!std::isfinite(ev.onset)) continue;
    if (!std::isfinite(ev.duration) || ev.duration < 0.0) ev.duration = 0.0;
    ev.kind = detail::trim_ws(ev.kind);
    out.push_back(std::move(ev));
  }
  events->swap(out);
}

// Collapse events sharing (kind, onset); the longest duration wins.
inline void deduplicate_events(EventTable* events) {
  if (!events) return;
  if (events->empty()) return;
  normalize_events(events);
  sort_events(events);

  EventTable out;
  out.reserve(events->size());
  for (const auto& ev : *events) {
    if (!out.empty() && out.back().kind == ev.kind &&
        detail::quantize_key(out.back().onset) == detail::quantize_key(ev.onset)) {
      continue;
    }
    out.push_back(ev);
  }
  events->swap(out);
}

// Events of one kind, in table order.
inline EventTable select_events(const EventTable& events, const std::string& kind) {
  EventTable out;
  for (const auto& ev : events) {
    if (ev.kind == kind) out.push_back(ev);
  }
  return out;
}

} // namespace gazeclean
