#include "ecs/Systems.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "character/PlatformerController.h"
#include "core/Diagnostics.h"
#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/Pool.h"
#include "ecs/World.h"
#include "physics/PhysicsConfig.h"
#include "physics/SpatialIndex.h"
#include "util/Math.h"

namespace Systems {

void rebuildIndex(World& w, SpatialIndex& index, float skin, Diagnostics& diag) {
  index.clear();

  auto view = w.registry.view<Transform, PhysicsBody>(entt::exclude<Dormant>);
  for (auto entity : view) {
    const auto& t = view.get<Transform>(entity);
    const auto& b = view.get<PhysicsBody>(entity);

    const Rect box = World::worldAabb(t, b);
    if (!util::finite(box) || !(box.w > 0.0F) || !(box.h > 0.0F)) {
      diag.report(entity, DiagnosticKind::InvalidAabb);
      continue;
    }
    // Inflated so bodies resting within the contact skin still pair up.
    if (!index.insert(entity, util::inflate(box, skin), b.layer, b.noSelfCollision)) {
      diag.report(entity, DiagnosticKind::InvalidAabb);
    }
  }
}

void integrate(World& w, const PhysicsConfig& cfg, TimeStep ts, Diagnostics& diag) {
  const float dt = ts.dt;
  const float maxSpeed = cfg.maxSpeed;

  auto view = w.registry.view<Transform, PhysicsBody>(entt::exclude<Dormant>);
  for (auto entity : view) {
    auto& t = view.get<Transform>(entity);
    auto& b = view.get<PhysicsBody>(entity);
    if (b.kind != BodyKind::Dynamic) {
      continue;
    }

    const Vec2 prevPos = t.pos;
    Vec2 accel{};
    if (b.mass > 0.0F) {
      accel = b.force * (1.0F / b.mass);
    }
    if (!b.grounded) {
      accel.y += cfg.gravity * b.gravityScale;
    }

    b.velocity = b.velocity + accel * dt;
    b.velocity.x = std::clamp(b.velocity.x, -maxSpeed, maxSpeed);
    b.velocity.y = std::clamp(b.velocity.y, -maxSpeed, maxSpeed);
    b.force = Vec2{};

    if (!util::finite(b.velocity)) {
      b.velocity = Vec2{};
      diag.report(entity, DiagnosticKind::NonFiniteState, "velocity reset");
    }

    t.pos = t.pos + b.velocity * dt;
    if (!util::finite(t.pos)) {
      t.pos = util::finite(prevPos) ? prevPos : Vec2{};
      b.velocity = Vec2{};
      diag.report(entity, DiagnosticKind::NonFiniteState, "position restored");
    }
  }
}

void behaviors(World& w,
               PlatformerController& platformer,
               ObjectPools& pools,
               TimeStep ts,
               Diagnostics& diag,
               std::vector<EntityId>& released) {
  const std::size_t firstExpired = released.size();

  auto view = w.registry.view<Behavior>(entt::exclude<Dormant>);
  for (auto entity : view) {
    switch (view.get<Behavior>(entity).kind) {
      case BehaviorKind::None:
        break;
      case BehaviorKind::Platformer:
        platformer.update(w, entity, ts, diag);
        break;
      case BehaviorKind::Projectile:
        if (auto* life = w.registry.try_get<Lifetime>(entity); life && life->remaining > 0.0F) {
          life->remaining -= ts.dt;
          if (life->remaining <= 0.0F) {
            released.push_back(entity);
          }
        }
        break;
    }
  }

  // Expired projectiles go back to their pool; unpooled ones are destroyed.
  for (std::size_t i = firstExpired; i < released.size(); ++i) {
    const EntityId e = released[i];
    if (!pools.release(e) && w.valid(e)) {
      w.destroy(e);
    }
  }

  platformer.flushShots(w, pools, diag);
}

}  // namespace Systems
