#pragma once

#include <cstdint>

// One fixed simulation tick.
struct TimeStep {
  float dt = 0.0F;            // seconds, constant for a run
  std::uint64_t frame = 0;    // render frame that issued the tick
  int subStep = 0;            // index within that frame (0 = first)
};
