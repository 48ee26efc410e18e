#include "gazeclean/blink_mask.hpp"

#include "test_support.hpp"
#include <cstddef>
#include <iostream>
#include <vector>

using namespace gazeclean;

static SampleTable uniform_table(size_t n) {
  SampleTable s;
  s.channel_names = {"gaze_x", "pup_l"};
  s.data.resize(2);
  for (size_t i = 0; i < n; ++i) {
    s.time.push_back(static_cast<double>(i));
    s.data[0].push_back(100.0 + static_cast<double>(i));
    s.data[1].push_back(static_cast<double>(i < n / 2 ? i : n / 2 - 1));
  }
  return s;
}

int main() {
  // 1) Blinks plus the saccades that contain them; the free saccade is ignored.
  {
    const SampleTable s = uniform_table(10);
    const EventTable evs = {
      {2.0, 1.0, "EBLINK"},
      {1.0, 3.0, "ESACC"},
      {6.0, 2.0, "ESACC"},
    };
    BlinkMaskOptions opt;
    opt.find_recovery = false;

    const BlinkMaskReport rep = eyelink_mask_report(s, evs, opt);
    assert(rep.n_blinks == 1);
    assert(rep.n_saccades == 1);
    assert(rep.intervals.size() == 2);
    assert(rep.intervals[0].kind == "EBLINK");
    assert(rep.intervals[1].kind == "ESACC");
    assert(rep.intervals[1].onset == 1.0);
    assert(rep.recovery.empty());

    const std::vector<size_t> rows = eyelink_mask_rows(s, evs, opt);
    assert((rows == std::vector<size_t>{1, 2, 3}));
  }

  // 2) No blinks: nothing to mask, even with saccades present.
  {
    const SampleTable s = uniform_table(10);
    const EventTable evs = {{1.0, 3.0, "ESACC"}, {5.0, 1.0, "EFIX"}};
    assert(eyelink_mask_events(s, evs).empty());
    assert(eyelink_mask_rows(s, evs).empty());
    assert(eyelink_mask_events(s, {}).empty());
  }

  // 3) Recovery pushes both the blink and its saccade to the pupil knee (row 49).
  {
    const SampleTable s = uniform_table(100);
    const EventTable evs = {{30.0, 10.0, "EBLINK"}, {28.0, 14.0, "ESACC"}};
    BlinkMaskOptions opt;
    opt.recovery.kernel_size = 1;
    opt.recovery.window = 100;

    const BlinkMaskReport rep = eyelink_mask_report(s, evs, opt);
    assert(rep.intervals.size() == 2);
    assert(rep.recovery.size() == 2);
    assert(rep.recovery[0].status == RecoveryStatus::kExtended);
    assert(rep.intervals[0].duration == 19.0);
    assert(rep.intervals[1].duration == 21.0);

    const std::vector<size_t> rows = eyelink_mask_rows(s, evs, opt);
    assert(rows.size() == 21);
    assert(rows.front() == 28);
    assert(rows.back() == 48);

    // Input events are not touched.
    assert(evs[0].duration == 10.0);
  }

  // 4) Event kinds are configurable.
  {
    const SampleTable s = uniform_table(10);
    const EventTable evs = {{2.0, 2.0, "blink"}, {1.0, 5.0, "saccade"}};
    BlinkMaskOptions opt;
    opt.blink_kind = "blink";
    opt.saccade_kind = "saccade";
    opt.find_recovery = false;
    const std::vector<size_t> rows = eyelink_mask_rows(s, evs, opt);
    assert((rows == std::vector<size_t>{1, 2, 3, 4, 5}));
  }

  std::cout << "test_blink_mask OK\n";
  return 0;
}
