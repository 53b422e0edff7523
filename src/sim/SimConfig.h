#pragma once

#include <cstddef>

#include "physics/PhysicsConfig.h"

struct SimConfig {
  struct Time {
    int tickRate = 120;  // fixed ticks per second
    int maxSubSteps = 8;
  } time;

  PhysicsConfig physics;

  struct Broadphase {
    float cellSize = 64.0F;
  } broadphase;

  struct Assets {
    std::size_t capacity = 1024;
  } assets;

  // Tick length. The accumulator runs on the double; ticks see it narrowed to float.
  [[nodiscard]] double tickSeconds() const { return 1.0 / static_cast<double>(time.tickRate); }
  [[nodiscard]] float dt() const { return static_cast<float>(tickSeconds()); }

  // Missing keys keep their defaults; out-of-range values are warned about and replaced.
  bool loadFromToml(const char* path);
};
