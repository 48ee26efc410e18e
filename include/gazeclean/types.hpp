#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gazeclean {

// One device-reported event (EyeLink "EBLINK", "ESACC", "EFIX", ...).
//
// Notes:
// - onset and duration share the units of SampleTable::time (typically ms).
// - onset + duration is the reported end; it may lie past the last sample.
struct GazeEvent {
  double onset{0.0};
  double duration{0.0};
  std::string kind;

  double end() const { return onset + duration; }
};

using EventTable = std::vector<GazeEvent>;

// Time-indexed sample table.
//
// - time is strictly increasing and unique (not necessarily uniform).
// - data[ch][row] holds the value of channel ch at time[row].
// - missing values are NaN.
struct SampleTable {
  std::vector<double> time;
  std::vector<std::string> channel_names;      // size = n_channels
  std::vector<std::vector<double>> data;       // data[ch][row]

  size_t n_rows() const { return time.size(); }
  size_t n_channels() const { return data.size(); }

  // Index of the channel called name, or -1.
  int channel_index(const std::string& name) const {
    for (size_t i = 0; i < channel_names.size(); ++i) {
      if (channel_names[i] == name) return static_cast<int>(i);
    }
    return -1;
  }

  bool has_channel(const std::string& name) const { return channel_index(name) >= 0; }
};

// Throws std::runtime_error when the table breaks the invariants above.
void validate_sample_table(const SampleTable& samples);

} // namespace gazeclean
