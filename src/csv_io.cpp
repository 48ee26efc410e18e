#include "gazeclean/csv_io.hpp"

#include "gazeclean/event_ops.hpp"
#include "gazeclean/utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <stdexcept>
#include <vector>

namespace gazeclean {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& header, const std::string& path) {
  if (ends_with(to_lower(path), ".tsv")) return '\t';

  // Tie-breaker is conservative: prefer comma, then semicolon, then tab.
  const size_t n_comma = count_delim_outside_quotes(header, ',');
  const size_t n_semi = count_delim_outside_quotes(header, ';');
  const size_t n_tab = count_delim_outside_quotes(header, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) best = '\t';
  return best;
}

int find_col(const std::vector<std::string>& header, const std::vector<std::string>& names) {
  for (const auto& want : names) {
    for (size_t i = 0; i < header.size(); ++i) {
      if (to_lower(trim(header[i])) == want) return static_cast<int>(i);
    }
  }
  return -1;
}

bool is_missing_cell(const std::string& s) {
  const std::string low = to_lower(trim(s));
  return low.empty() || low == "nan" || low == "na" || low == "n/a" || low == ".";
}

bool parse_number(const std::string& s, double* out) {
  if (!out || is_missing_cell(s)) return false;
  try {
    *out = to_double(s);
  } catch (const std::runtime_error&) {
    return false;
  }
  return std::isfinite(*out);
}

// Read the first non-blank, non-comment line (BOM stripped). Empty if none.
std::string read_header_line(std::istream& f) {
  std::string line;
  while (std::getline(f, line)) {
    std::string t = trim(strip_utf8_bom(line));
    if (t.empty() || t[0] == '#') continue;
    return t;
  }
  return std::string();
}

} // namespace

std::string csv_escape(const std::string& s) {
  bool need = false;
  for (char c : s) {
    if (c == '"' || c == ',' || c == '\n' || c == '\r') {
      need = true;
      break;
    }
  }
  if (!need) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

SampleTable read_sample_table_csv(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to read sample table: " + path);

  const std::string header_line = read_header_line(f);
  if (header_line.empty()) throw std::runtime_error("Sample table has no header: " + path);

  const char delim = detect_delim(header_line, path);
  const std::vector<std::string> header = split_csv_row(header_line, delim);
  if (header.size() < 2) {
    throw std::runtime_error("Sample table needs a time column and at least one channel: " + path);
  }

  int col_time = find_col(header, {"time", "timestamp", "time_ms", "onset"});
  if (col_time < 0) col_time = 0;

  SampleTable out;
  std::vector<size_t> cols;
  for (size_t i = 0; i < header.size(); ++i) {
    if (static_cast<int>(i) == col_time) continue;
    out.channel_names.push_back(trim(header[i]));
    cols.push_back(i);
  }
  out.data.resize(cols.size());

  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::string line;
  while (std::getline(f, line)) {
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;

    std::vector<std::string> row = split_csv_row(t, delim);
    if (row.size() < header.size()) row.resize(header.size());

    double tk = 0.0;
    if (!parse_number(row[static_cast<size_t>(col_time)], &tk)) continue;

    out.time.push_back(tk);
    for (size_t c = 0; c < cols.size(); ++c) {
      double v = nan;
      const std::string& cell = row[cols[c]];
      if (!is_missing_cell(cell)) v = to_double(cell);
      out.data[c].push_back(v);
    }
  }

  validate_sample_table(out);
  return out;
}

void write_sample_table_csv(const std::string& path, const SampleTable& samples) {
  validate_sample_table(samples);

  std::ofstream o(path);
  o.imbue(std::locale::classic());
  if (!o) throw std::runtime_error("Failed to write CSV: " + path);

  o << "time";
  for (const auto& name : samples.channel_names) o << "," << csv_escape(name);
  o << "\n";

  o << std::setprecision(12);
  for (size_t r = 0; r < samples.n_rows(); ++r) {
    o << samples.time[r];
    for (size_t c = 0; c < samples.n_channels(); ++c) {
      o << ",";
      const double v = samples.data[c][r];
      if (std::isfinite(v)) o << v;
    }
    o << "\n";
  }
}

EventTable read_events_table(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to read events table: " + path);

  const std::string header_line = read_header_line(f);
  if (header_line.empty()) return {};

  const char delim = detect_delim(header_line, path);
  const std::vector<std::string> header = split_csv_row(header_line, delim);

  const int col_onset = find_col(header, {"onset", "start", "onset_ms"});
  const int col_dur = find_col(header, {"duration", "duration_ms"});
  const int col_kind = find_col(header, {"kind", "type", "event", "trial_type"});

  if (col_onset < 0) {
    throw std::runtime_error("Events table missing required onset column: " + path);
  }
  if (col_kind < 0) {
    throw std::runtime_error("Events table missing required kind column: " + path);
  }

  EventTable events;
  std::string line;
  while (std::getline(f, line)) {
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;

    std::vector<std::string> row = split_csv_row(t, delim);
    if (row.size() < header.size()) row.resize(header.size());

    GazeEvent ev;
    if (!parse_number(row[static_cast<size_t>(col_onset)], &ev.onset)) continue;
    if (col_dur >= 0 && !parse_number(row[static_cast<size_t>(col_dur)], &ev.duration)) {
      ev.duration = 0.0;
    }
    ev.kind = trim(row[static_cast<size_t>(col_kind)]);
    events.push_back(ev);
  }

  deduplicate_events(&events);
  return events;
}

void write_events_csv(const std::string& path, const EventTable& events) {
  std::ofstream o(path);
  o.imbue(std::locale::classic());
  if (!o) throw std::runtime_error("Failed to write events CSV: " + path);

  o << "onset,duration,kind\n";
  o << std::setprecision(12);
  for (const auto& ev : events) {
    o << ev.onset << "," << ev.duration << "," << csv_escape(ev.kind) << "\n";
  }
}

void write_recovery_report_csv(const std::string& path,
                               const EventTable& intervals,
                               const std::vector<RecoveryResult>& results) {
  if (intervals.size() != results.size()) {
    throw std::runtime_error("write_recovery_report_csv: intervals and results differ in length");
  }

  std::ofstream o(path);
  o.imbue(std::locale::classic());
  if (!o) throw std::runtime_error("Failed to write recovery report: " + path);

  o << "onset,kind,original_duration,duration,status\n";
  o << std::setprecision(12);
  for (size_t i = 0; i < results.size(); ++i) {
    const RecoveryResult& r = results[i];
    o << r.onset << "," << csv_escape(intervals[i].kind) << ","
      << r.original_duration << "," << r.duration << ","
      << recovery_status_name(r.status) << "\n";
  }
}

} // namespace gazeclean
