#pragma once

#include <entt/entt.hpp>

#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"

// Owns per-entity state. All data lives in component tables indexed by entity id.
class World {
 public:
  EntityId create();
  void destroy(EntityId);
  [[nodiscard]] bool valid(EntityId id) const;
  void clear();

  // Restore the pooled component set (Transform, PhysicsBody, Behavior, Lifetime) to
  // defaults and drop everything a previous occupant may have attached.
  void resetComponents(EntityId id);

  // Current world-space bounds of a body.
  static Rect worldAabb(const Transform& t, const PhysicsBody& b);

  entt::registry registry;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;
};
