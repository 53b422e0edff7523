#include "physics/Collision.h"

#include <algorithm>
#include <cmath>

#include "core/Diagnostics.h"
#include "ecs/Pool.h"
#include "ecs/World.h"
#include "physics/PhysicsConfig.h"
#include "util/Math.h"

namespace {

// Either side may opt in.
bool layersInteract(const PhysicsBody& a, const PhysicsBody& b) {
  return (a.layer & b.mask) != 0U || (b.layer & a.mask) != 0U;
}

float inverseMass(const PhysicsBody& b) {
  if (b.kind != BodyKind::Dynamic || !(b.mass > 0.0F)) {
    return 0.0F;
  }
  return 1.0F / b.mass;
}

bool validAabb(const Rect& r) {
  return util::finite(r) && r.w > 0.0F && r.h > 0.0F;
}

void markForRelease(std::vector<EntityId>& list, EntityId id) {
  if (std::find(list.begin(), list.end(), id) == list.end()) {
    list.push_back(id);
  }
}

}  // namespace

bool CollisionSystem::computeContact(const Rect& a, const Rect& b, float skin, Contact& out) {
  const float px = std::min(a.right(), b.right()) - std::max(a.x, b.x);
  const float py = std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y);

  if (px <= -skin || py <= -skin) {
    return false;
  }
  // Corner-to-corner within the skin is not a contact on either axis.
  if (px <= 0.0F && py <= 0.0F) {
    return false;
  }

  bool alongY = false;
  if (px > 0.0F && py > 0.0F) {
    alongY = py <= px;
  } else {
    alongY = py <= 0.0F;
  }

  if (alongY) {
    const float ca = a.y + a.h * 0.5F;
    const float cb = b.y + b.h * 0.5F;
    out.normal = Vec2{0.0F, ca <= cb ? 1.0F : -1.0F};
    out.penetration = std::max(py, 0.0F);
  } else {
    const float ca = a.x + a.w * 0.5F;
    const float cb = b.x + b.w * 0.5F;
    out.normal = Vec2{ca <= cb ? 1.0F : -1.0F, 0.0F};
    out.penetration = std::max(px, 0.0F);
  }
  return true;
}

void CollisionSystem::run(World& w, const SpatialIndex& index, const PhysicsConfig& cfg,
                          ObjectPools& pools, Diagnostics& diag) {
  auto& reg = w.registry;
  pairs_.clear();
  contacts_.clear();
  overlaps_.clear();
  released_.clear();

  auto bodies = reg.view<PhysicsBody>(entt::exclude<Dormant>);
  for (auto e : bodies) {
    auto& b = bodies.get<PhysicsBody>(e);
    if (b.kind == BodyKind::Dynamic) {
      b.grounded = false;
    }
  }

  index.candidatePairs(pairs_);

  for (const CandidatePair& p : pairs_) {
    if (!w.valid(p.a) || !w.valid(p.b) || reg.all_of<Dormant>(p.a) || reg.all_of<Dormant>(p.b)) {
      continue;
    }
    const auto* ta = reg.try_get<Transform>(p.a);
    const auto* tb = reg.try_get<Transform>(p.b);
    const auto* ba = reg.try_get<PhysicsBody>(p.a);
    const auto* bb = reg.try_get<PhysicsBody>(p.b);
    if (ta == nullptr || tb == nullptr || ba == nullptr || bb == nullptr) {
      continue;
    }
    // Nothing moves in a pair without a dynamic body.
    if (ba->kind != BodyKind::Dynamic && bb->kind != BodyKind::Dynamic) {
      continue;
    }
    if (!layersInteract(*ba, *bb)) {
      continue;
    }

    const Rect ra = World::worldAabb(*ta, *ba);
    const Rect rb = World::worldAabb(*tb, *bb);
    if (!validAabb(ra)) {
      diag.report(p.a, DiagnosticKind::InvalidAabb);
      continue;
    }
    if (!validAabb(rb)) {
      diag.report(p.b, DiagnosticKind::InvalidAabb);
      continue;
    }

    if (ba->kind == BodyKind::Trigger || bb->kind == BodyKind::Trigger) {
      if (!util::overlaps(ra, rb)) {
        continue;
      }
      if (ba->kind == BodyKind::Trigger) {
        overlaps_.push_back(OverlapEvent{p.a, p.b});
      }
      if (bb->kind == BodyKind::Trigger) {
        overlaps_.push_back(OverlapEvent{p.b, p.a});
      }
      continue;
    }

    Contact c{};
    if (!computeContact(ra, rb, cfg.contactSkin, c)) {
      continue;
    }
    c.a = p.a;
    c.b = p.b;
    c.relativeNormalVelocity = util::dot(bb->velocity - ba->velocity, c.normal);
    contacts_.push_back(c);
  }

  const float restitution = std::clamp(cfg.restitution, 0.0F, 1.0F);
  for (Contact& c : contacts_) {
    auto& ta = reg.get<Transform>(c.a);
    auto& tb = reg.get<Transform>(c.b);
    auto& ba = reg.get<PhysicsBody>(c.a);
    auto& bb = reg.get<PhysicsBody>(c.b);

    const float invA = inverseMass(ba);
    const float invB = inverseMass(bb);
    const float invSum = invA + invB;
    if (invSum <= 0.0F) {
      continue;
    }

    // Earlier corrections this step may already have separated the pair (a body spanning
    // two floor tiles is pushed out by the first one).
    Contact now{};
    if (!computeContact(World::worldAabb(ta, ba), World::worldAabb(tb, bb), cfg.contactSkin,
                        now)) {
      continue;
    }
    c.normal = now.normal;
    c.penetration = now.penetration;

    if (c.penetration > 0.0F) {
      ta.pos = ta.pos - c.normal * (c.penetration * invA / invSum);
      tb.pos = tb.pos + c.normal * (c.penetration * invB / invSum);
    }

    const float vn = util::dot(bb.velocity - ba.velocity, c.normal);
    if (vn < 0.0F) {
      const float j = -(1.0F + restitution) * vn / invSum;
      ba.velocity = ba.velocity - c.normal * (j * invA);
      bb.velocity = bb.velocity + c.normal * (j * invB);
    }

    // A body with the other one directly below is standing on it.
    if (c.normal.y > 0.0F && ba.kind == BodyKind::Dynamic) {
      ba.grounded = true;
    } else if (c.normal.y < 0.0F && bb.kind == BodyKind::Dynamic) {
      bb.grounded = true;
    }

    if (ba.despawnOnContact) {
      markForRelease(released_, c.a);
    }
    if (bb.despawnOnContact) {
      markForRelease(released_, c.b);
    }
  }

  for (const EntityId id : released_) {
    if (!pools.release(id)) {
      w.destroy(id);
    }
  }
}
