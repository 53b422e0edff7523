#include "ecs/World.h"

#include <cmath>

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  if (player == id) {
    player = kInvalidEntity;
  }
  registry.destroy(id);
}

bool World::valid(EntityId id) const {
  return id != kInvalidEntity && registry.valid(id);
}

void World::clear() {
  registry.clear();
  player = kInvalidEntity;
}

void World::resetComponents(EntityId id) {
  registry.emplace_or_replace<Transform>(id);
  registry.emplace_or_replace<PhysicsBody>(id);
  registry.emplace_or_replace<Behavior>(id);
  registry.emplace_or_replace<Lifetime>(id);
  registry.remove<PlatformerState, InputState, Visual, AudioTrigger, DebugName>(id);
}

Rect World::worldAabb(const Transform& t, const PhysicsBody& b) {
  const float sx = std::fabs(t.scale.x);
  const float sy = std::fabs(t.scale.y);
  return Rect{t.pos.x + b.offset.x * sx, t.pos.y + b.offset.y * sy, b.size.x * sx, b.size.y * sy};
}
