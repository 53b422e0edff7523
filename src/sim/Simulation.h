#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "character/PlatformerController.h"
#include "core/Diagnostics.h"
#include "ecs/Pool.h"
#include "ecs/World.h"
#include "physics/Collision.h"
#include "physics/SpatialIndex.h"
#include "sim/FrameOutput.h"
#include "sim/Scene.h"
#include "sim/SimConfig.h"

class AssetResolver;
struct TimeStep;

// The simulation context: owns the entity store, pools, broad phase and controllers, and
// advances them with a fixed-timestep accumulator.
//
// Per tick the order is integrate, rebuild broad phase, collide, behaviors. Scene loading,
// unloading, spawning and despawning are refused while a tick is running.
class Simulation {
 public:
  Simulation(SimConfig cfg, AssetResolver& assets);

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  bool loadScene(const SceneDesc& scene);
  bool unloadScene();
  [[nodiscard]] bool sceneLoaded() const { return loaded_; }

  std::optional<EntityId> spawn(const EntityDesc& desc);
  std::optional<EntityId> spawnPooled(std::string_view pool, Vec2 pos, Vec2 velocity);
  bool despawn(EntityId id);

  // Samples `input` once, runs zero or more fixed ticks, then publishes.
  const FrameOutput& frame(double elapsedSeconds, const InputState& input);

  // Exactly one fixed step.
  void tick(const TimeStep& ts);

  [[nodiscard]] const FrameOutput& output() const { return out_; }
  [[nodiscard]] World& world() { return world_; }
  [[nodiscard]] const World& world() const { return world_; }
  [[nodiscard]] ObjectPools& pools() { return pools_; }
  [[nodiscard]] const SpatialIndex& index() const { return index_; }
  [[nodiscard]] const CollisionSystem& collision() const { return collision_; }
  [[nodiscard]] const PlatformerController& platformer() const { return platformer_; }
  [[nodiscard]] const SimConfig& config() const { return cfg_; }
  [[nodiscard]] double accumulator() const { return accumulator_; }
  [[nodiscard]] std::uint64_t tickCount() const { return ticks_; }
  [[nodiscard]] std::uint64_t frameCount() const { return frames_; }

 private:
  bool refuseDuringTick(const char* what) const;
  void applyInput(const InputState& input);
  void consumePressEdges();
  void collectOverlaps();
  void publish();

  SimConfig cfg_;
  AssetResolver* assets_ = nullptr;

  World world_;
  ObjectPools pools_{world_};
  SpatialIndex index_;
  CollisionSystem collision_;
  PlatformerController platformer_;
  Diagnostics diag_;

  FrameOutput out_;
  std::vector<EntityId> released_;

  double accumulator_ = 0.0;
  std::uint64_t ticks_ = 0;
  std::uint64_t frames_ = 0;
  bool inTick_ = false;
  bool loaded_ = false;
};
