#pragma once

#include <vector>

#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "physics/SpatialIndex.h"

class Diagnostics;
class ObjectPools;
class World;
struct PhysicsConfig;

struct Contact {
  EntityId a = kInvalidEntity;
  EntityId b = kInvalidEntity;
  Vec2 normal{};       // unit axis, points from a toward b
  float penetration = 0.0F;
  float relativeNormalVelocity = 0.0F;  // dot(vb - va, normal) before response; < 0 approaching
};

struct OverlapEvent {
  EntityId trigger = kInvalidEntity;
  EntityId other = kInvalidEntity;
  bool operator==(const OverlapEvent&) const = default;
};

// Narrow phase and response over the broad-phase candidates of one step.
//
// Contacts are resolved in candidate-pair order: positional correction split by inverse mass,
// then an impulse along the normal while the bodies approach. Each contact is re-measured
// against the positions left by the ones before it. Static bodies have zero inverse
// mass. Trigger bodies only produce overlap events.
class CollisionSystem {
 public:
  // Geometry-only test. Bounds separated by less than `skin` produce a resting contact with
  // zero penetration. The minimum-penetration axis wins, y on ties.
  static bool computeContact(const Rect& a, const Rect& b, float skin, Contact& out);

  // Grounded flags of dynamic bodies are recomputed. Bodies flagged despawnOnContact that
  // touched something solid are released to their pool afterwards (destroyed if unpooled).
  void run(World& w, const SpatialIndex& index, const PhysicsConfig& cfg, ObjectPools& pools,
           Diagnostics& diag);

  [[nodiscard]] const std::vector<Contact>& contacts() const { return contacts_; }
  [[nodiscard]] const std::vector<OverlapEvent>& overlaps() const { return overlaps_; }
  [[nodiscard]] const std::vector<EntityId>& released() const { return released_; }

 private:
  std::vector<CandidatePair> pairs_;
  std::vector<Contact> contacts_;
  std::vector<OverlapEvent> overlaps_;
  std::vector<EntityId> released_;
};
