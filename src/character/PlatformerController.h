#pragma once

#include <vector>

#include "character/PlatformerConfig.h"
#include "core/Assets.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"

class Diagnostics;
class ObjectPools;
class World;
struct TimeStep;

// Grounded/airborne movement with coyote time and jump buffering.
//
// Configs live in a table owned by the controller; entities refer to them by index through
// PlatformerState::configIndex. Shots are queued during update() and spawned by flushShots()
// once the caller has finished iterating the registry.
class PlatformerController {
 public:
  struct Sounds {
    AssetHandle jump{};
    AssetHandle land{};
    AssetHandle shoot{};
  };

  // `shootPool` is the index into the scene's ObjectPools, or -1 when the named pool is absent.
  int addConfig(PlatformerConfig cfg, int shootPool, Sounds sounds);
  [[nodiscard]] const PlatformerConfig* config(int index) const;
  [[nodiscard]] std::size_t configCount() const { return entries_.size(); }
  void clear();

  // Adds PlatformerState, InputState and the Platformer behavior to `e`.
  void attach(World& w, EntityId e, int configIndex) const;

  void update(World& w, EntityId e, const TimeStep& ts, Diagnostics& diag);
  void flushShots(World& w, ObjectPools& pools, Diagnostics& diag);

  [[nodiscard]] std::size_t queuedShots() const { return shots_.size(); }

 private:
  struct Entry {
    PlatformerConfig cfg;
    int shootPool = -1;
    Sounds sounds;
  };

  struct ShotRequest {
    EntityId shooter = kInvalidEntity;
    int pool = -1;
    Vec2 pos{};
    Vec2 velocity{};
    AssetHandle sound{};
  };

  [[nodiscard]] const Entry& entryFor(int index) const;

  std::vector<Entry> entries_;
  std::vector<ShotRequest> shots_;
};
