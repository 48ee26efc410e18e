#pragma once

#include "gazeclean/recovery.hpp"
#include "gazeclean/types.hpp"

#include <string>
#include <vector>

namespace gazeclean {

// Minimal CSV helpers used by the CLI tools.
//
// Notes:
// - Numeric output uses the classic "C" locale so tables stay parseable
//   regardless of the process locale.
// - Readers auto-detect comma, semicolon and tab delimiters, skip '#' comment
//   lines and tolerate a UTF-8 BOM on the header line.

// Escape a string for inclusion in a CSV cell.
std::string csv_escape(const std::string& s);

// Read a sample table.
//
// The first column whose header is time / timestamp / time_ms / onset is the
// index (the first column otherwise); every other column is a channel. Empty
// cells, "nan", "na", "n/a" and "." (EyeLink's lost-sample marker) are NaN.
// Rows with an unparseable time are skipped. The result is validated
// (strictly increasing time).
SampleTable read_sample_table_csv(const std::string& path);

// Write a sample table as time,<ch1>,<ch2>,...; NaN is written as an empty cell.
void write_sample_table_csv(const std::string& path, const SampleTable& samples);

// Read an event table with columns onset, duration, kind.
//
// Column names are matched case-insensitively; kind may also be called type,
// event or trial_type. A missing duration column means 0. Rows with an
// invalid onset are skipped. The result is normalized and de-duplicated
// (see event_ops.hpp).
EventTable read_events_table(const std::string& path);

// Write onset,duration,kind.
void write_events_csv(const std::string& path, const EventTable& events);

// Write onset,kind,original_duration,duration,status; one row per interval
// (results[i] belongs to intervals[i]). Throws std::runtime_error when the two
// tables differ in length.
void write_recovery_report_csv(const std::string& path,
                               const EventTable& intervals,
                               const std::vector<RecoveryResult>& results);

} // namespace gazeclean
