#include "gazeclean/event_ops.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <vector>

using gazeclean::EventTable;
using gazeclean::deduplicate_events;
using gazeclean::normalize_events;
using gazeclean::select_events;
using gazeclean::sort_events;

int main() {
  // 1) Dedup on (kind, onset) with microsecond quantization; longest wins.
  EventTable v = {
      {1.0, 0.2, "EBLINK"},
      {1.0000001, 0.5, "EBLINK"}, // within 0.1 microsecond
      {1.0, 0.1, " EBLINK "},     // kind trims to "EBLINK"
      {1.0, 0.3, "ESACC"},        // same onset, other kind: kept
      {2.0, -1.0, "EFIX"},        // duration clamps to 0
  };

  deduplicate_events(&v);
  assert(v.size() == 3);
  assert(v[0].kind == "EBLINK");
  assert(v[0].duration == 0.5);
  assert(v[1].kind == "ESACC");
  assert(v[2].kind == "EFIX");
  assert(v[2].duration == 0.0);

  // 2) Normalize drops events without a usable onset.
  EventTable n = {{std::nan(""), 1.0, "EBLINK"}, {3.0, std::nan(""), "ESACC"}};
  normalize_events(&n);
  assert(n.size() == 1);
  assert(n[0].onset == 3.0);
  assert(n[0].duration == 0.0);

  // 3) Sort is by onset, then kind, then longer first.
  EventTable s = {{5.0, 1.0, "ESACC"}, {5.0, 2.0, "EBLINK"}, {5.0, 4.0, "EBLINK"}, {1.0, 1.0, "ESACC"}};
  sort_events(&s);
  assert(s[0].onset == 1.0);
  assert(s[1].kind == "EBLINK" && s[1].duration == 4.0);
  assert(s[2].kind == "EBLINK" && s[2].duration == 2.0);
  assert(s[3].kind == "ESACC");

  // 4) Selection keeps table order.
  const EventTable blinks = select_events(s, "EBLINK");
  assert(blinks.size() == 2);
  assert(blinks[0].duration == 4.0);
  assert(select_events(s, "EFIX").empty());

  std::cout << "test_event_ops: OK\n";
  return 0;
}
