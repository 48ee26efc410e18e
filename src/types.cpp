#include "gazeclean/types.hpp"

#include <cmath>
#include <stdexcept>

namespace gazeclean {

void validate_sample_table(const SampleTable& samples) {
  if (samples.channel_names.size() != samples.data.size()) {
    throw std::runtime_error("validate_sample_table: channel name count does not match channel count");
  }
  const size_t n = samples.n_rows();
  for (size_t c = 0; c < samples.data.size(); ++c) {
    if (samples.data[c].size() != n) {
      throw std::runtime_error("validate_sample_table: channel '" + samples.channel_names[c] +
                               "' length does not match the time index");
    }
  }
  for (size_t i = 0; i < n; ++i) {
    if (!std::isfinite(samples.time[i])) {
      throw std::runtime_error("validate_sample_table: non-finite time key at row " + std::to_string(i));
    }
    if (i > 0 && !(samples.time[i] > samples.time[i - 1])) {
      throw std::runtime_error("validate_sample_table: time index must be strictly increasing (row " +
                               std::to_string(i) + ")");
    }
  }
}

} // namespace gazeclean
