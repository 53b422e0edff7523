#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/Assets.h"
#include "core/Diagnostics.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "physics/Collision.h"

struct AudioEvent {
  AudioCue cue = AudioCue::None;
  AssetHandle sound{};
};

struct RenderItem {
  EntityId entity = kInvalidEntity;
  Transform transform{};
  AssetHandle visual{};  // invalid when the entity has no ready visual
  std::optional<AudioEvent> audio;
};

// Everything one call to Simulation::frame() publishes. Buffers are reused across frames.
struct FrameOutput {
  std::uint64_t frame = 0;
  int subSteps = 0;
  double droppedSeconds = 0.0;  // whole ticks discarded by the sub-step cap
  std::vector<RenderItem> render;  // ordered by entity id
  std::vector<OverlapEvent> overlaps;
  std::vector<Diagnostic> diagnostics;

  void clear() {
    subSteps = 0;
    droppedSeconds = 0.0;
    render.clear();
    overlaps.clear();
    diagnostics.clear();
  }
};
